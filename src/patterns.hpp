// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace hookguard {

inline constexpr size_t kPatternLineWindowBytes = 8192;
inline constexpr size_t kPatternLineWindowOverlap = 256;

/**
 * A compiled literal, glob or regex matcher.
 *
 * Construction never throws. A pattern that fails to compile is kept with
 * valid() == false and matches every input.
 */
class Pattern {
  public:
    enum class Kind { Literal, Glob, Regex };

    static Pattern literal(std::string text, bool icase = false);
    static Pattern glob(std::string text, bool icase = false);
    static Pattern regex(std::string text, bool icase = false);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] bool icase() const { return icase_; }
    [[nodiscard]] bool valid() const { return valid_; }
    [[nodiscard]] const std::string& compile_error() const { return compile_error_; }

    [[nodiscard]] bool matches(const std::string& input) const;
    // Anchored at both ends: equality, a full glob match or std::regex_match.
    [[nodiscard]] bool matches_whole(const std::string& input) const;

  private:
    Pattern(Kind kind, std::string text, bool icase);

    Kind kind_;
    std::string text_;
    bool icase_;
    bool valid_ = true;
    std::string compile_error_;
    std::shared_ptr<const std::regex> regex_;
};

bool matches(const Pattern& pattern, const std::string& text);

// Match against whole path components only, so "build" matches "a/build/x"
// but never "rebuild/x". A pattern containing '/' matches a consecutive run
// of components.
bool matches_path_component(const Pattern& pattern, const std::string& path);

// Apply the pattern to each line of `content` in bounded windows.
bool matches_lines(const Pattern& pattern, const std::string& content);

std::vector<std::string> split_path_components(const std::string& path);
std::string path_basename(const std::string& path);

struct PatternRule {
    Pattern pattern;
    std::string description;
};

// Description of the first rule whose pattern matches, or empty.
std::string first_match(const std::vector<PatternRule>& rules, const std::string& text);
std::vector<std::string> all_matches(const std::vector<PatternRule>& rules, const std::string& text);

// Same helpers over line-windowed content.
std::string first_line_match(const std::vector<PatternRule>& rules, const std::string& content);

} // namespace hookguard
