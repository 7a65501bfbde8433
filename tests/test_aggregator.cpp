// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "aggregator.hpp"

namespace hookguard {
namespace {

std::vector<Decision> clean_decisions()
{
    return {Decision::allow("a"), Decision::warn("b", "heads up"), Decision::allow("c")};
}

std::vector<Decision> two_blocks()
{
    return {Decision::block("path_boundary", "left root"), Decision::allow("x"),
            Decision::block("install_script", "install.sh")};
}

TEST(AggregatorTest, CleanEventAllowsWithoutConsultingOverride)
{
    int calls = 0;
    Aggregation agg = aggregate(clean_decisions(), [&]() {
        ++calls;
        return true;
    });
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(agg.state, AggregatorState::Clean);
    EXPECT_EQ(agg.verdict.outcome, Outcome::Allow);
    EXPECT_FALSE(agg.verdict.blocked);
    EXPECT_FALSE(agg.verdict.overridden);
    EXPECT_TRUE(agg.verdict.reasons.empty());
    ASSERT_EQ(agg.verdict.warnings.size(), 1u);
    EXPECT_EQ(agg.verdict.warnings[0], "b: heads up");
    EXPECT_EQ(agg.verdict.decisions.size(), 3u);
}

TEST(AggregatorTest, ViolationWithoutOverrideBlocks)
{
    Aggregation agg = aggregate(two_blocks(), []() { return false; });
    EXPECT_EQ(agg.state, AggregatorState::OverrideInvalidOrAbsent);
    EXPECT_EQ(agg.verdict.outcome, Outcome::Block);
    EXPECT_TRUE(agg.verdict.blocked);
    EXPECT_EQ(agg.verdict.reasons,
              (std::vector<std::string>{"path_boundary: left root", "install_script: install.sh"}));
}

TEST(AggregatorTest, NullResolverMeansNoOverride)
{
    Aggregation agg = aggregate(two_blocks(), OverrideResolver{});
    EXPECT_TRUE(agg.verdict.blocked);
    EXPECT_EQ(agg.state, AggregatorState::OverrideInvalidOrAbsent);
}

TEST(AggregatorTest, OneOverrideUnblocksAllViolations)
{
    int calls = 0;
    Aggregation agg = aggregate(two_blocks(), [&]() {
        ++calls;
        return true;
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(agg.state, AggregatorState::OverrideValid);
    EXPECT_EQ(agg.verdict.outcome, Outcome::AllowOverridden);
    EXPECT_FALSE(agg.verdict.blocked);
    EXPECT_TRUE(agg.verdict.overridden);
    // Reasons are kept so the audit trail shows what was overridden.
    EXPECT_EQ(agg.verdict.reasons.size(), 2u);
}

TEST(AggregatorTest, WarningsNeverBlock)
{
    Aggregation agg = aggregate({Decision::warn("a", "x"), Decision::warn("b", "y")}, []() { return false; });
    EXPECT_FALSE(agg.verdict.blocked);
    EXPECT_EQ(agg.verdict.warnings.size(), 2u);
}

TEST(AggregatorTest, StateNames)
{
    EXPECT_STREQ(aggregator_state_name(AggregatorState::Clean), "CLEAN");
    EXPECT_STREQ(aggregator_state_name(AggregatorState::Violated), "VIOLATED");
    EXPECT_STREQ(aggregator_state_name(AggregatorState::OverrideValid), "OVERRIDE_VALID");
    EXPECT_STREQ(aggregator_state_name(AggregatorState::OverrideInvalidOrAbsent), "OVERRIDE_INVALID_OR_ABSENT");
}

} // namespace
} // namespace hookguard
