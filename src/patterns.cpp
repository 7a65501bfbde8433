// cppcheck-suppress-file missingIncludeSystem
#include "patterns.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <atomic>

#include "logging.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

std::atomic<bool> g_compile_error_logged{false};

bool literal_contains(const std::string& haystack, const std::string& needle, bool icase)
{
    if (!icase) {
        return haystack.find(needle) != std::string::npos;
    }
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool glob_matches(const std::string& pattern, const std::string& input, bool icase)
{
    int flags = 0;
    if (icase) {
        flags |= FNM_CASEFOLD;
    }
    return ::fnmatch(pattern.c_str(), input.c_str(), flags) == 0;
}

// Regex text is split on '/' only, so escapes such as "\." survive.
std::vector<std::string> split_regex_components(const std::string& text)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t slash = text.find('/', start);
        if (slash == std::string::npos) {
            slash = text.size();
        }
        if (slash > start) {
            out.push_back(text.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return out;
}

} // namespace

Pattern::Pattern(Kind kind, std::string text, bool icase) : kind_(kind), text_(std::move(text)), icase_(icase) {}

Pattern Pattern::literal(std::string text, bool icase)
{
    return Pattern(Kind::Literal, std::move(text), icase);
}

Pattern Pattern::glob(std::string text, bool icase)
{
    Pattern p(Kind::Glob, std::move(text), icase);
    if (p.text_.empty()) {
        p.valid_ = false;
        p.compile_error_ = "empty glob";
    }
    return p;
}

Pattern Pattern::regex(std::string text, bool icase)
{
    Pattern p(Kind::Regex, std::move(text), icase);
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (icase) {
        flags |= std::regex::icase;
    }
    try {
        p.regex_ = std::make_shared<const std::regex>(p.text_, flags);
    } catch (const std::regex_error& e) {
        p.valid_ = false;
        p.compile_error_ = e.what();
        if (!g_compile_error_logged.exchange(true)) {
            logger().log(SLOG_ERROR("Pattern failed to compile; treating as match-all")
                             .field("pattern", p.text_)
                             .field("error", p.compile_error_));
        }
    }
    return p;
}

bool Pattern::matches(const std::string& input) const
{
    if (!valid_) {
        return true;
    }
    switch (kind_) {
        case Kind::Literal:
            return literal_contains(input, text_, icase_);
        case Kind::Glob:
            return glob_matches(text_, input, icase_);
        case Kind::Regex:
            try {
                return std::regex_search(input, *regex_);
            } catch (const std::regex_error& e) {
                // error_complexity / error_stack: fail closed.
                logger().log(SLOG_WARN("Regex evaluation failed; treating as match")
                                 .field("pattern", text_)
                                 .field("error", e.what()));
                return true;
            }
    }
    return true;
}

bool Pattern::matches_whole(const std::string& input) const
{
    if (!valid_) {
        return true;
    }
    switch (kind_) {
        case Kind::Literal:
            return icase_ ? iequals(input, text_) : input == text_;
        case Kind::Glob:
            return glob_matches(text_, input, icase_);
        case Kind::Regex:
            try {
                return std::regex_match(input, *regex_);
            } catch (const std::regex_error& e) {
                logger().log(SLOG_WARN("Regex evaluation failed; treating as match")
                                 .field("pattern", text_)
                                 .field("error", e.what()));
                return true;
            }
    }
    return true;
}

bool matches(const Pattern& pattern, const std::string& text)
{
    return pattern.matches(text);
}

std::vector<std::string> split_path_components(const std::string& path)
{
    std::vector<std::string> out;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty() && current != ".") {
                out.push_back(current);
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty() && current != ".") {
        out.push_back(current);
    }
    return out;
}

std::string path_basename(const std::string& path)
{
    const auto components = split_path_components(path);
    if (components.empty()) {
        return {};
    }
    return components.back();
}

bool matches_path_component(const Pattern& pattern, const std::string& path)
{
    if (!pattern.valid()) {
        return true;
    }
    const auto components = split_path_components(path);
    const auto wanted = pattern.kind() == Pattern::Kind::Regex ? split_regex_components(pattern.text())
                                                               : split_path_components(pattern.text());
    if (wanted.empty()) {
        return false;
    }

    if (wanted.size() == 1) {
        for (const auto& component : components) {
            if (pattern.matches_whole(component)) {
                return true;
            }
        }
        return false;
    }

    if (components.size() < wanted.size()) {
        return false;
    }
    std::vector<Pattern> pieces;
    pieces.reserve(wanted.size());
    for (const auto& piece : wanted) {
        switch (pattern.kind()) {
            case Pattern::Kind::Literal:
                pieces.push_back(Pattern::literal(piece, pattern.icase()));
                break;
            case Pattern::Kind::Glob:
                pieces.push_back(Pattern::glob(piece, pattern.icase()));
                break;
            case Pattern::Kind::Regex:
                // A piece that does not compile alone ("a(b/c)") is invalid and matches.
                pieces.push_back(Pattern::regex(piece, pattern.icase()));
                break;
        }
    }
    for (size_t start = 0; start + pieces.size() <= components.size(); ++start) {
        bool all = true;
        for (size_t i = 0; i < pieces.size(); ++i) {
            if (!pieces[i].matches_whole(components[start + i])) {
                all = false;
                break;
            }
        }
        if (all) {
            return true;
        }
    }
    return false;
}

bool matches_lines(const Pattern& pattern, const std::string& content)
{
    if (!pattern.valid()) {
        return true;
    }
    size_t line_start = 0;
    while (line_start <= content.size()) {
        size_t line_end = content.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = content.size();
        }
        const size_t line_len = line_end - line_start;
        if (line_len <= kPatternLineWindowBytes) {
            if (pattern.matches(content.substr(line_start, line_len))) {
                return true;
            }
        } else {
            const size_t step = kPatternLineWindowBytes - kPatternLineWindowOverlap;
            for (size_t off = 0; off < line_len; off += step) {
                const size_t take = std::min(kPatternLineWindowBytes, line_len - off);
                if (pattern.matches(content.substr(line_start + off, take))) {
                    return true;
                }
                if (off + take >= line_len) {
                    break;
                }
            }
        }
        if (line_end == content.size()) {
            break;
        }
        line_start = line_end + 1;
    }
    return false;
}

std::string first_match(const std::vector<PatternRule>& rules, const std::string& text)
{
    for (const auto& rule : rules) {
        if (rule.pattern.matches(text)) {
            return rule.description;
        }
    }
    return {};
}

std::vector<std::string> all_matches(const std::vector<PatternRule>& rules, const std::string& text)
{
    std::vector<std::string> out;
    for (const auto& rule : rules) {
        if (rule.pattern.matches(text)) {
            out.push_back(rule.description);
        }
    }
    return out;
}

std::string first_line_match(const std::vector<PatternRule>& rules, const std::string& content)
{
    for (const auto& rule : rules) {
        if (matches_lines(rule.pattern, content)) {
            return rule.description;
        }
    }
    return {};
}

} // namespace hookguard
