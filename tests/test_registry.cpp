// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "guards.hpp"
#include "registry.hpp"
#include "test_support.hpp"

namespace hookguard {
namespace {

using testing_support::shell_event;
using testing_support::write_event;

class FixedGuard : public Guard {
  public:
    FixedGuard(const char* name, Severity severity) : name_(name), severity_(severity) {}

    [[nodiscard]] const char* name() const override { return name_; }
    [[nodiscard]] const char* description() const override { return "fixed"; }
    [[nodiscard]] Decision check(const Event&) const override
    {
        switch (severity_) {
            case Severity::Block:
                return Decision::block(name_, "always");
            case Severity::Warn:
                return Decision::warn(name_, "maybe");
            case Severity::Info:
                break;
        }
        return Decision::allow(name_);
    }

  private:
    const char* name_;
    Severity severity_;
};

class ThrowingGuard : public Guard {
  public:
    [[nodiscard]] const char* name() const override { return "throwing"; }
    [[nodiscard]] const char* description() const override { return "throws"; }
    [[nodiscard]] Decision check(const Event&) const override { throw std::runtime_error("boom"); }
};

class NonStandardThrowGuard : public Guard {
  public:
    [[nodiscard]] const char* name() const override { return "throws_int"; }
    [[nodiscard]] const char* description() const override { return "throws an int"; }
    [[nodiscard]] Decision check(const Event&) const override { throw 42; }
};

GuardSettings test_settings()
{
    GuardSettings s = default_guard_settings();
    s.project_root = "/home/u/proj";
    s.home_dir = "/home/u";
    return s;
}

TEST(GuardRegistryTest, RejectsDuplicateNames)
{
    GuardRegistry registry;
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("a", Severity::Info)));
    auto dup = registry.register_guard(std::make_unique<FixedGuard>("a", Severity::Block));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code(), ErrorCode::DuplicateGuard);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(GuardRegistryTest, RejectsNullGuard)
{
    GuardRegistry registry;
    auto result = registry.register_guard(nullptr);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(GuardRegistryTest, EvaluatesAllGuardsInOrderWithoutShortCircuit)
{
    GuardRegistry registry;
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("first", Severity::Block)));
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("second", Severity::Warn)));
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("third", Severity::Block)));

    auto decisions = registry.evaluate(shell_event("ls", "/"));
    ASSERT_EQ(decisions.size(), 3u);
    EXPECT_EQ(decisions[0].guard_name, "first");
    EXPECT_TRUE(decisions[0].blocked);
    EXPECT_EQ(decisions[1].guard_name, "second");
    EXPECT_FALSE(decisions[1].blocked);
    EXPECT_EQ(decisions[2].guard_name, "third");
    EXPECT_TRUE(decisions[2].blocked);
}

TEST(GuardRegistryTest, DisabledGuardsAreSkipped)
{
    GuardRegistry registry;
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("a", Severity::Block)));
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("b", Severity::Block)));
    ASSERT_TRUE(registry.set_enabled("a", false));
    EXPECT_FALSE(registry.set_enabled("missing", false));

    auto decisions = registry.evaluate(shell_event("ls", "/"));
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].guard_name, "b");

    auto infos = registry.list();
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_FALSE(infos[0].enabled);
    EXPECT_TRUE(infos[1].enabled);
}

TEST(GuardRegistryTest, GuardExceptionFailsClosed)
{
    GuardRegistry registry;
    ASSERT_TRUE(registry.register_guard(std::make_unique<ThrowingGuard>()));
    ASSERT_TRUE(registry.register_guard(std::make_unique<NonStandardThrowGuard>()));
    ASSERT_TRUE(registry.register_guard(std::make_unique<FixedGuard>("after", Severity::Info)));

    auto decisions = registry.evaluate(shell_event("ls", "/"));
    ASSERT_EQ(decisions.size(), 3u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_TRUE(decisions[i].blocked);
        EXPECT_EQ(decisions[i].severity, Severity::Block);
        EXPECT_EQ(decisions[i].reason, kGuardInternalError);
    }
    EXPECT_EQ(decisions[0].guard_name, "throwing");
    EXPECT_FALSE(decisions[2].blocked);
}

TEST(GuardRegistryTest, DefaultRegistryHasAllGuardsInOrder)
{
    auto registry = build_default_registry(test_settings());
    ASSERT_TRUE(registry) << registry.error().to_string();
    auto infos = registry->list();
    ASSERT_EQ(infos.size(), 9u);
    EXPECT_EQ(infos[0].name, kPathBoundaryGuard);
    EXPECT_EQ(infos[1].name, kInstallScriptGuard);
    EXPECT_EQ(infos[2].name, kBypassPatternGuard);
    EXPECT_EQ(infos[3].name, kScriptIntegrityGuard);
    EXPECT_EQ(infos[4].name, kGitSafetyGuard);
    EXPECT_EQ(infos[5].name, kTempFileLocationGuard);
    EXPECT_EQ(infos[6].name, kMockCodeGuard);
    EXPECT_EQ(infos[7].name, kPythonEnvGuard);
    EXPECT_EQ(infos[8].name, kDockerComposeGuard);
    for (const auto& info : infos) {
        EXPECT_TRUE(info.enabled);
        EXPECT_FALSE(info.description.empty());
    }
}

TEST(GuardRegistryTest, DefaultRegistryHonoursDisabledList)
{
    auto registry = build_default_registry(test_settings(), {kPathBoundaryGuard});
    ASSERT_TRUE(registry);
    auto decisions = registry->evaluate(shell_event("cd /etc", "/home/u/proj"));
    EXPECT_EQ(decisions.size(), 8u);
    for (const auto& d : decisions) {
        EXPECT_FALSE(d.blocked) << d.guard_name << ": " << d.reason;
    }

    auto bad = build_default_registry(test_settings(), {"no_such_guard"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);
}

TEST(GuardRegistryTest, IndependentGuardsReportTogether)
{
    auto registry = build_default_registry(test_settings());
    ASSERT_TRUE(registry);
    auto decisions = registry->evaluate(write_event("tests/install_fixtures.sh", "#!/bin/sh\n", "/home/u/proj"));
    std::vector<std::string> blocked;
    for (const auto& d : decisions) {
        if (d.blocked) {
            blocked.push_back(d.guard_name);
        }
    }
    EXPECT_EQ(blocked, (std::vector<std::string>{kInstallScriptGuard, kScriptIntegrityGuard}));
}

} // namespace
} // namespace hookguard
