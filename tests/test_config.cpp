// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "config.hpp"
#include "file_lock.hpp"
#include "test_support.hpp"

namespace hookguard {
namespace {

using testing_support::ScopedEnvVar;
using testing_support::TempDir;
using testing_support::write_all;

std::string resolve_fixture(const std::string& name)
{
#ifdef HOOKGUARD_SOURCE_DIR
    std::string configured = std::string(HOOKGUARD_SOURCE_DIR) + "/tests/fixtures/golden/" + name;
    if (std::filesystem::exists(configured)) {
        return configured;
    }
#endif
    // Try relative to build directory
    std::string path = "../tests/fixtures/golden/" + name;
    if (std::filesystem::exists(path)) {
        return path;
    }
    path = (std::filesystem::current_path().parent_path() / "tests/fixtures/golden" / name).string();
    if (std::filesystem::exists(path)) {
        return path;
    }
    return "../tests/fixtures/golden/" + name;
}

struct GoldenTestCase {
    std::string fixture_name;
    int expected_version;
    size_t expected_allow_roots;
    size_t expected_protected_files;
    size_t expected_protected_dirs;
    size_t expected_protected_globs;
    size_t expected_disabled_guards;
    size_t expected_warnings;
    std::string expected_project_root;
};

class PolicyGoldenTest : public ::testing::TestWithParam<GoldenTestCase> {};

TEST_P(PolicyGoldenTest, MatchesExpectedEntries)
{
    const auto& tc = GetParam();
    std::string path = resolve_fixture(tc.fixture_name);
    ASSERT_TRUE(std::filesystem::exists(path)) << "Golden fixture not found: " << path;

    PolicyIssues issues;
    auto result = parse_policy_file(path, issues);
    ASSERT_TRUE(result) << "Parse failed: " << (issues.has_errors() ? issues.errors[0] : "unknown");
    EXPECT_FALSE(issues.has_errors());
    EXPECT_EQ(issues.warnings.size(), tc.expected_warnings);

    const GuardPolicy& policy = *result;
    EXPECT_EQ(policy.version, tc.expected_version);
    EXPECT_EQ(policy.allow_roots.size(), tc.expected_allow_roots);
    EXPECT_EQ(policy.protected_files.size(), tc.expected_protected_files);
    EXPECT_EQ(policy.protected_dirs.size(), tc.expected_protected_dirs);
    EXPECT_EQ(policy.protected_globs.size(), tc.expected_protected_globs);
    EXPECT_EQ(policy.disabled_guards.size(), tc.expected_disabled_guards);
    EXPECT_EQ(policy.project_root, tc.expected_project_root);
}

INSTANTIATE_TEST_SUITE_P(
    GoldenVectors, PolicyGoldenTest,
    ::testing::Values(GoldenTestCase{"minimal.conf", 1, 0, 0, 0, 0, 0, 0, ""},
                      GoldenTestCase{"allow_roots.conf", 1, 2, 0, 0, 0, 0, 0, ""},
                      GoldenTestCase{"protected_files.conf", 1, 0, 2, 1, 2, 0, 0, ""},
                      GoldenTestCase{"full_policy.conf", 1, 1, 1, 1, 1, 1, 0, "/srv/work/monorepo"},
                      GoldenTestCase{"duplicates.conf", 1, 1, 1, 0, 0, 0, 1, ""}),
    [](const ::testing::TestParamInfo<GoldenTestCase>& info) {
        std::string name = info.param.fixture_name;
        auto pos = name.rfind('.');
        if (pos != std::string::npos) {
            name = name.substr(0, pos);
        }
        return name;
    });

TEST(PolicyParseTest, ProtectedDirTrailingSlashIsStripped)
{
    PolicyIssues issues;
    auto result = parse_policy_text("version=1\n[protected_dir]\nintegration/\n", issues);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->protected_dirs.size(), 1u);
    EXPECT_EQ(result->protected_dirs[0], "integration");
}

TEST(PolicyParseTest, RejectsInvalidPolicies)
{
    const char* bad[] = {
        "[allow_root]\n/tmp\n",                         // missing version
        "version=2\n",                                  // unsupported version
        "version=abc\n",                                // malformed version
        "version=1\n[deny_everything]\nx\n",            // unknown section
        "version=1\nmode=strict\n",                     // unknown header key
        "version=1\n[allow_root]\nrelative/dir\n",      // relative allow root
        "version=1\nproject_root=proj\n",               // relative project root
        "version=1\n[protected_file]\ntests/run.sh\n",  // not a basename
        "version=1\n[disable_guard]\nno_such_guard\n",  // unknown guard
        "version=1\ninstall_entry_point=bin/setup.sh\n" // entry point with a directory
    };
    for (const char* text : bad) {
        PolicyIssues issues;
        auto result = parse_policy_text(text, issues);
        ASSERT_FALSE(result) << text;
        EXPECT_EQ(result.error().code(), ErrorCode::PolicyParseFailed) << text;
        EXPECT_TRUE(issues.has_errors()) << text;
    }
}

TEST(PolicyParseTest, MissingFileIsNotFound)
{
    PolicyIssues issues;
    auto result = parse_policy_file("/nonexistent/hookguard/policy.conf", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ResourceNotFound);
}

TEST(PolicyParseTest, ApplyPolicyExtendsDefaults)
{
    EngineConfig config = default_engine_config();
    const size_t default_files = config.guards.protected_files.size();
    PolicyIssues issues;
    auto policy = parse_policy_text(
        "version=1\ninstall_entry_point=bootstrap.sh\n[protected_file]\nverify.sh\nrun_tests.sh\n"
        "[disable_guard]\ngit_safety\n",
        issues);
    ASSERT_TRUE(policy);
    apply_policy(config, *policy);
    // run_tests.sh is already a default and is not duplicated.
    EXPECT_EQ(config.guards.protected_files.size(), default_files + 1);
    EXPECT_EQ(config.guards.install_entry_point, "bootstrap.sh");
    ASSERT_EQ(config.disabled_guards.size(), 1u);
    EXPECT_EQ(config.disabled_guards[0], "git_safety");
}

class EngineConfigTest : public ::testing::Test {
  protected:
    TempDir dir_{"hookguard_config_test"};
};

TEST_F(EngineConfigTest, StateDirDerivesStorePaths)
{
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    auto config = load_engine_config();
    ASSERT_TRUE(config) << config.error().to_string();
    EXPECT_EQ(config->audit_log_path, dir_.file("audit.jsonl"));
    EXPECT_EQ(config->override_store_path, dir_.file("overrides.jsonl"));
    EXPECT_EQ(config->policy_path, dir_.file("policy.conf"));
    EXPECT_FALSE(config->policy_path_explicit);
}

TEST_F(EngineConfigTest, PolicyInStateDirIsApplied)
{
    write_all(dir_.file("policy.conf"), "version=1\nproject_root=/srv/proj\n[allow_root]\n/tmp\n");
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    auto config = load_engine_config();
    ASSERT_TRUE(config);
    EXPECT_EQ(config->guards.project_root, "/srv/proj");
    ASSERT_EQ(config->guards.allow_roots.size(), 1u);
    EXPECT_EQ(config->guards.allow_roots[0], "/tmp");
}

TEST_F(EngineConfigTest, InvalidPolicyIsAnError)
{
    write_all(dir_.file("policy.conf"), "version=1\n[bogus]\n");
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    auto config = load_engine_config();
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::PolicyParseFailed);
}

TEST_F(EngineConfigTest, ExplicitPolicyPathMustExist)
{
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    ScopedEnvVar policy("HOOKGUARD_POLICY_PATH", dir_.file("missing.conf"));
    auto config = load_engine_config();
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::ResourceNotFound);
}

TEST_F(EngineConfigTest, EnvironmentOverridesWin)
{
    write_all(dir_.file("policy.conf"), "version=1\nproject_root=/srv/proj\n");
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    ScopedEnvVar root("HOOKGUARD_PROJECT_ROOT", "/other/root");
    ScopedEnvVar audit("HOOKGUARD_AUDIT_LOG_PATH", dir_.file("custom/audit.jsonl"));
    ScopedEnvVar timeout("HOOKGUARD_LOCK_TIMEOUT_MS", "250");
    auto config = load_engine_config();
    ASSERT_TRUE(config);
    EXPECT_EQ(config->guards.project_root, "/other/root");
    EXPECT_EQ(config->audit_log_path, dir_.file("custom/audit.jsonl"));
    EXPECT_EQ(config->lock_timeout_ms, 250u);
}

TEST_F(EngineConfigTest, InvalidNumericOverrideKeepsDefault)
{
    ScopedEnvVar state("HOOKGUARD_STATE_DIR", dir_.path().string());
    ScopedEnvVar timeout("HOOKGUARD_LOCK_TIMEOUT_MS", "soon");
    auto config = load_engine_config();
    ASSERT_TRUE(config);
    EXPECT_EQ(config->lock_timeout_ms, kDefaultLockTimeoutMs);
}

} // namespace
} // namespace hookguard
