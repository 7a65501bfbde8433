// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "commands.hpp"
#include "engine.hpp"
#include "interception.hpp"
#include "override_store.hpp"
#include "test_support.hpp"

namespace hookguard {
namespace {

using testing_support::TempDir;

constexpr const char* kCwd = "/home/u/proj";

Result<void> always_fail_write(const std::string&, const std::string&)
{
    return Error(ErrorCode::IoError, "disk full");
}

class CoutCapture {
  public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    [[nodiscard]] std::string str() const { return buffer_.str(); }

  private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

std::string bash_payload(const std::string& command)
{
    return std::string(R"({"session_id":"s1","hook_event_name":"PreToolUse","tool_name":"Bash",)") +
           R"("tool_input":{"command":")" + command + R"("},"cwd":")" + kCwd + R"("})";
}

std::string write_payload(const std::string& path)
{
    return std::string(R"({"tool_name":"Write","tool_input":{"file_path":")") + path +
           R"(","content":"#!/bin/sh\necho hi\n"},"cwd":")" + kCwd + R"("})";
}

class InterceptionTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        config_ = default_engine_config();
        config_.state_dir = dir_.path().string();
        config_.audit_log_path = dir_.file("audit.jsonl");
        config_.override_store_path = dir_.file("overrides.jsonl");
        config_.guards.project_root = kCwd;
        config_.guards.home_dir = "/home/u";
        auto engine = make_engine(config_);
        ASSERT_TRUE(engine) << engine.error().to_string();
        engine_ = std::move(*engine);
    }

    void TearDown() override { reset_audit_write_fn_for_test(); }

    int run(const std::string& payload, const std::optional<std::string>& code = std::nullopt)
    {
        err_.str("");
        CoutCapture capture;
        const int rc = handle_hook_payload(*engine_, payload, code, "/fallback", err_);
        stdout_ = capture.str();
        return rc;
    }

    size_t audit_records()
    {
        auto records = engine_->audit().read_tail(1000);
        return records ? records->size() : 0;
    }

    TempDir dir_{"hookguard_interception_test"};
    EngineConfig config_;
    std::unique_ptr<Engine> engine_;
    std::ostringstream err_;
    std::string stdout_;
};

TEST_F(InterceptionTest, ScenarioA_CdOutsideProjectIsBlocked)
{
    const std::string payload = R"({"tool_name":"bash","tool_input":{"command":"cd ../outside-project"},"cwd":")" +
                                std::string(kCwd) + R"("})";
    EXPECT_EQ(run(payload), kExitBlock);
    EXPECT_NE(err_.str().find("BLOCKED"), std::string::npos);
    EXPECT_NE(err_.str().find("path_boundary"), std::string::npos);
    EXPECT_TRUE(stdout_.empty());
    EXPECT_EQ(audit_records(), 1u);
}

TEST_F(InterceptionTest, ScenarioB_InstallScriptBlockedEntryPointAllowed)
{
    EXPECT_EQ(run(write_payload("install-foo.sh")), kExitBlock);
    EXPECT_NE(err_.str().find("install_script"), std::string::npos);

    EXPECT_EQ(run(write_payload("safe_install.sh")), kExitAllow);
    EXPECT_EQ(err_.str().find("BLOCKED"), std::string::npos);
    EXPECT_TRUE(stdout_.empty());
    EXPECT_EQ(audit_records(), 2u);
}

TEST_F(InterceptionTest, ScenarioC_OneOverrideUnblocksAllViolations)
{
    const std::string payload = write_payload("tests/install_fixtures.sh");
    EXPECT_EQ(run(payload), kExitBlock);
    EXPECT_NE(err_.str().find("install_script"), std::string::npos);
    EXPECT_NE(err_.str().find("script_integrity"), std::string::npos);
    EXPECT_NE(err_.str().find("2 violation(s)"), std::string::npos);

    auto issued = engine_->overrides().issue(300, "fixture installer approved");
    ASSERT_TRUE(issued) << issued.error().to_string();

    EXPECT_EQ(run(payload, issued->code), kExitAllow);
    EXPECT_NE(err_.str().find("override accepted"), std::string::npos);
    EXPECT_TRUE(stdout_.empty());

    // Single use.
    EXPECT_EQ(run(payload, issued->code), kExitBlock);

    auto records = engine_->audit().read_tail(10);
    ASSERT_TRUE(records);
    ASSERT_EQ(records->size(), 3u);
    EXPECT_TRUE((*records)[1].overridden);
    EXPECT_EQ((*records)[1].outcome, "allow_overridden");
    ASSERT_TRUE((*records)[1].override_code_sha256.has_value());
    EXPECT_EQ((*records)[1].decisions.size(), 2u);
    EXPECT_FALSE((*records)[0].override_code_sha256.has_value());
}

TEST_F(InterceptionTest, OverrideIsNotConsumedByCleanEvents)
{
    auto issued = engine_->overrides().issue(300, "");
    ASSERT_TRUE(issued);
    EXPECT_EQ(run(bash_payload("ls -la"), issued->code), kExitAllow);
    EXPECT_EQ(err_.str().find("override accepted"), std::string::npos);

    auto entries = engine_->overrides().list();
    ASSERT_TRUE(entries);
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_FALSE((*entries)[0].consumed);
}

TEST_F(InterceptionTest, InvalidOverrideStillBlocks)
{
    EXPECT_EQ(run(bash_payload("git push --force"), std::string("HG-ZZZZ-ZZZZ")), kExitBlock);
    EXPECT_EQ(run(bash_payload("git push --force"), std::string("garbage")), kExitBlock);
}

TEST_F(InterceptionTest, WarningsAllowWithMessage)
{
    EXPECT_EQ(run(bash_payload("cd -")), kExitAllow);
    EXPECT_NE(err_.str().find("warning"), std::string::npos);
    EXPECT_TRUE(stdout_.empty());
}

TEST_F(InterceptionTest, UnusableInputFailsWithExitOne)
{
    for (const char* payload : {"", "   \n", "not json", "[1,2]", R"({"tool_input":{"command":"ls"}})",
                                R"({"tool_name":42})", R"({"tool_name":"Bash","tool_input":"ls"})",
                                R"({"tool_name":"Bash","tool_input":{"command":["ls"]}})"}) {
        EXPECT_EQ(run(payload), kExitCheckFailed) << payload;
        EXPECT_NE(err_.str().find("cannot evaluate payload"), std::string::npos) << payload;
        EXPECT_TRUE(stdout_.empty());
    }
    EXPECT_EQ(audit_records(), 0u);
}

TEST_F(InterceptionTest, AuditFailureDoesNotChangeVerdict)
{
    set_audit_write_fn_for_test(always_fail_write);
    EXPECT_EQ(run(bash_payload("git reset --hard")), kExitBlock);
    EXPECT_NE(err_.str().find("audit log write failed"), std::string::npos);

    EXPECT_EQ(run(bash_payload("make test")), kExitAllow);
    EXPECT_NE(err_.str().find("audit log write failed"), std::string::npos);
    EXPECT_TRUE(stdout_.empty());
}

TEST_F(InterceptionTest, DisabledGuardDoesNotBlock)
{
    config_.disabled_guards = {"git_safety"};
    auto engine = make_engine(config_);
    ASSERT_TRUE(engine);
    std::ostringstream err;
    EXPECT_EQ(handle_hook_payload(**engine, bash_payload("git push --force"), std::nullopt, "/", err), kExitAllow);
}

TEST(HookPayloadTest, ReadsPayloadUpToLimit)
{
    std::istringstream small(R"({"tool_name":"Bash"})");
    auto ok = read_hook_payload(small);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, R"({"tool_name":"Bash"})");

    std::istringstream big(std::string(kMaxPayloadBytes + 1, ' '));
    auto too_big = read_hook_payload(big);
    ASSERT_FALSE(too_big);
    EXPECT_EQ(too_big.error().code(), ErrorCode::InvalidInput);
}

TEST(HookPayloadTest, AcceptsFieldAliases)
{
    auto a = parse_hook_payload(R"({"tool":"Bash","toolInput":{"command":"ls"}})", "/fb");
    ASSERT_TRUE(a) << a.error().to_string();
    EXPECT_EQ(a->tool_name, "Bash");
    EXPECT_EQ(a->command, std::optional<std::string>("ls"));
    EXPECT_EQ(a->working_directory, "/fb");
    EXPECT_GT(a->timestamp_unix_ms, 0);

    auto b = parse_hook_payload(R"({"tool_name":"Bash","parameters":{"command":"pwd"},"cwd":"/w"})", "/fb");
    ASSERT_TRUE(b);
    EXPECT_EQ(b->command, std::optional<std::string>("pwd"));
    EXPECT_EQ(b->working_directory, "/w");

    auto c = parse_hook_payload(R"({"tool_name":"Bash","command":"echo top"})", "/fb");
    ASSERT_TRUE(c);
    EXPECT_EQ(c->command, std::optional<std::string>("echo top"));
}

TEST(HookPayloadTest, ExtractsEditContent)
{
    auto edit = parse_hook_payload(
        R"({"tool_name":"Edit","tool_input":{"file_path":"a.py","old_string":"x","new_string":"y"}})", "/");
    ASSERT_TRUE(edit);
    EXPECT_EQ(edit->file_path, std::optional<std::string>("a.py"));
    EXPECT_EQ(edit->new_content, std::optional<std::string>("y"));
    EXPECT_TRUE(edit->is_file_edit());

    auto multi = parse_hook_payload(
        R"({"tool_name":"MultiEdit","tool_input":{"file_path":"a.py","edits":[{"old_string":"a","new_string":"one"},{"old_string":"b","new_string":"two"}]}})",
        "/");
    ASSERT_TRUE(multi);
    EXPECT_EQ(multi->new_content, std::optional<std::string>("one\ntwo"));

    auto notebook = parse_hook_payload(
        R"J({"tool_name":"NotebookEdit","tool_input":{"notebook_path":"n.ipynb","new_source":"print(1)"}})J", "/");
    ASSERT_TRUE(notebook);
    EXPECT_EQ(notebook->file_path, std::optional<std::string>("n.ipynb"));
    EXPECT_EQ(notebook->new_content, std::optional<std::string>("print(1)"));
}

TEST(HookPayloadTest, VerdictExitCodes)
{
    Verdict allow;
    EXPECT_EQ(verdict_exit_code(allow), kExitAllow);
    Verdict block;
    block.blocked = true;
    EXPECT_EQ(verdict_exit_code(block), kExitBlock);
    Verdict overridden;
    overridden.overridden = true;
    EXPECT_EQ(verdict_exit_code(overridden), kExitAllow);
}

TEST(CommandGuardTest, EscapingExceptionBecomesCheckFailure)
{
    std::ostringstream err;
    const int rc = run_command_guarded("check", []() -> int { throw std::runtime_error("boom"); }, err);
    EXPECT_EQ(rc, kExitCheckFailed);
    EXPECT_NE(err.str().find("internal error in check: boom"), std::string::npos);

    const int other = run_command_guarded("check", []() -> int { throw 42; }, err);
    EXPECT_EQ(other, kExitCheckFailed);
}

TEST(CommandGuardTest, ReturnValuePassesThrough)
{
    std::ostringstream err;
    EXPECT_EQ(run_command_guarded("check", []() { return kExitBlock; }, err), kExitBlock);
    EXPECT_EQ(run_command_guarded("audit", []() { return 0; }, err), 0);
    EXPECT_TRUE(err.str().empty());
}

} // namespace
} // namespace hookguard
