// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "patterns.hpp"

namespace hookguard {
namespace {

TEST(PatternTest, LiteralMatchesSubstring)
{
    Pattern p = Pattern::literal("--no-verify");
    EXPECT_TRUE(p.matches("git commit --no-verify -m x"));
    EXPECT_FALSE(p.matches("git commit -m x"));

    Pattern icase = Pattern::literal("SKIP", true);
    EXPECT_TRUE(icase.matches("please skip this"));
}

TEST(PatternTest, GlobMatchesWholeInput)
{
    Pattern p = Pattern::glob("test_*");
    EXPECT_TRUE(p.matches("test_parser.py"));
    EXPECT_FALSE(p.matches("my_test_parser.py"));

    Pattern icase = Pattern::glob("debug_*", true);
    EXPECT_TRUE(icase.matches("DEBUG_dump.txt"));
}

TEST(PatternTest, RegexSearchesAnywhere)
{
    Pattern p = Pattern::regex(R"(^install.*\.sh$)", true);
    EXPECT_TRUE(p.valid());
    EXPECT_TRUE(p.matches("Install-Foo.SH"));
    EXPECT_FALSE(p.matches("reinstall.sh"));
}

TEST(PatternTest, InvalidRegexMatchesEverything)
{
    Pattern p = Pattern::regex("([unclosed");
    EXPECT_FALSE(p.valid());
    EXPECT_FALSE(p.compile_error().empty());
    EXPECT_TRUE(p.matches("anything"));
    EXPECT_TRUE(p.matches(""));
    EXPECT_TRUE(matches_lines(p, "line one\nline two"));
}

TEST(PatternTest, PathComponentAnchoring)
{
    for (const Pattern& build : {Pattern::literal("build"), Pattern::glob("build"), Pattern::regex("build")}) {
        EXPECT_TRUE(matches_path_component(build, "build/")) << build.text();
        EXPECT_TRUE(matches_path_component(build, "a/build/file")) << build.text();
        EXPECT_TRUE(matches_path_component(build, "/abs/build")) << build.text();
        EXPECT_FALSE(matches_path_component(build, "rebuild/file")) << build.text();
        EXPECT_FALSE(matches_path_component(build, "a/builds/file")) << build.text();
    }

    Pattern wide = Pattern::regex("bui.d");
    EXPECT_TRUE(matches_path_component(wide, "a/build/file"));
    EXPECT_FALSE(matches_path_component(wide, "a/rebuilds/file"));
}

TEST(PatternTest, RegexMultiComponentAnchoring)
{
    Pattern hooks = Pattern::regex(R"(\.git/hook.)");
    EXPECT_TRUE(matches_path_component(hooks, "/repo/.git/hooks/pre-commit"));
    EXPECT_FALSE(matches_path_component(hooks, "/repo/.git/hooksx"));
    EXPECT_FALSE(matches_path_component(hooks, "/repo/my.git/hooks"));

    Pattern glob = Pattern::glob(".git/hook*");
    EXPECT_TRUE(matches_path_component(glob, "repo/.git/hooks/x"));
    EXPECT_FALSE(matches_path_component(glob, "repo/x.git/hooks"));
}

TEST(PatternTest, MultiComponentPatternMatchesConsecutiveRun)
{
    Pattern hooks = Pattern::literal(".git/hooks");
    EXPECT_TRUE(matches_path_component(hooks, ".git/hooks/pre-commit"));
    EXPECT_TRUE(matches_path_component(hooks, "/repo/.git/hooks"));
    EXPECT_FALSE(matches_path_component(hooks, ".git/info/hooks"));
    EXPECT_FALSE(matches_path_component(hooks, "my.git/hooks"));
}

TEST(PatternTest, MatchesLinesChecksEachLine)
{
    Pattern p = Pattern::regex(R"(^\s*skip:)");
    EXPECT_TRUE(matches_lines(p, "repos:\n  skip: [ruff]\n"));
    EXPECT_FALSE(matches_lines(p, "repos: skip: no\n"));
}

TEST(PatternTest, MatchesLinesFindsNeedleInVeryLongLine)
{
    std::string line(kPatternLineWindowBytes * 3, 'x');
    line.replace(kPatternLineWindowBytes * 2 + 17, 12, "--no-verify ");
    Pattern p = Pattern::regex(R"(--no-verify)");
    EXPECT_TRUE(matches_lines(p, line));

    // A needle that straddles a window boundary is still seen.
    std::string straddle(kPatternLineWindowBytes * 2, 'y');
    const size_t step = kPatternLineWindowBytes - kPatternLineWindowOverlap;
    straddle.replace(step - 5, 11, "--no-verify");
    EXPECT_TRUE(matches_lines(p, straddle));
}

TEST(PatternTest, SplitAndBasename)
{
    EXPECT_EQ(split_path_components("./a//b/./c/"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(path_basename("/x/y/install.sh"), "install.sh");
    EXPECT_EQ(path_basename("install.sh"), "install.sh");
    EXPECT_EQ(path_basename(""), "");
}

TEST(PatternRuleTest, FirstAndAllMatches)
{
    std::vector<PatternRule> rules = {
        {Pattern::literal("alpha"), "alpha rule"},
        {Pattern::regex("b.ta"), "beta rule"},
        {Pattern::glob("*gamma*"), "gamma rule"},
    };
    EXPECT_EQ(first_match(rules, "beta then alpha"), "alpha rule");
    EXPECT_EQ(first_match(rules, "nothing"), "");
    EXPECT_EQ(all_matches(rules, "alpha beta gamma"),
              (std::vector<std::string>{"alpha rule", "beta rule", "gamma rule"}));
    EXPECT_EQ(first_line_match(rules, "one\ntwo gamma\n"), "gamma rule");
}

} // namespace
} // namespace hookguard
