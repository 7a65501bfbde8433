// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

bool is_engine_variable(const std::string& name)
{
    return to_lower(name).rfind("hookguard_", 0) == 0 || name == kOverrideEnvVar;
}

bool is_precommit_config(const std::string& path)
{
    const std::string base = path_basename(path);
    return base == ".pre-commit-config.yaml" || base == ".pre-commit-config.yml";
}

// Options of `git commit` that take a separate value word.
bool commit_option_takes_value(const std::string& arg)
{
    return arg == "-m" || arg == "-F" || arg == "-C" || arg == "-c" || arg == "-t" || arg == "--message" ||
           arg == "--file" || arg == "--author" || arg == "--date" || arg == "--template" ||
           arg == "--reuse-message" || arg == "--reedit-message" || arg == "--fixup" || arg == "--squash";
}

// git accepts any unambiguous prefix of a long option.
bool is_no_verify_option(const std::string& arg)
{
    static const std::string kNoVerify = "--no-verify";
    return arg.size() >= kNoVerify.size() - 2 && kNoVerify.compare(0, arg.size(), arg) == 0;
}

// Scans a short option cluster ("-an", "-nm msg"). Letters after one that
// takes a value are that value, not options.
bool short_cluster_has_no_verify(const std::string& arg)
{
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        const char c = arg[i];
        if (c == 'n') {
            return true;
        }
        if (c == 'm' || c == 'F' || c == 'C' || c == 'c' || c == 't') {
            return false;
        }
    }
    return false;
}

} // namespace

BypassPatternGuard::BypassPatternGuard()
{
    static const char* const kEnvNames[] = {
        "CLAUDE[_-]?SKIP[_-]?GUARDS?",   "CLAUDE[_-]?DISABLE[_-]?GUARDS?", "CLAUDE[_-]?BYPASS[_-]?GUARDS?",
        "CLAUDE[_-]?NO[_-]?GUARDS?",     "CLAUDECODE[_-]?SKIP[_-]?GUARDS?", "SKIP[_-]?GUARDS?",
        "DISABLE[_-]?GUARDS?",           "BYPASS[_-]?GUARDS?",             "NO[_-]?GUARDS?",
        "GUARDS?[_-]?SKIP",              "GUARDS?[_-]?DISABLE",            "GUARDS?[_-]?BYPASS",
        "TEST[_-]?SKIP",                 "SKIP[_-]?TESTS?",                "BYPASS[_-]?TESTS?",
        "DISABLE[_-]?TESTS?",            "NO[_-]?TESTS?",                  "FORCE[_-]?PASS",
        "ALWAYS[_-]?PASS",               "IGNORE[_-]?FAIL(URE)?S?",        "SKIP",
        "PRE_COMMIT_ALLOW_NO_CONFIG",    "SKIP[_-]?HOOKS?",                "SKIP[_-]?SLOW[_-]?TESTS?"};
    for (const char* n : kEnvNames) {
        env_name_patterns_.push_back(Pattern::regex(std::string("^(") + n + ")$", true));
    }

    content_rules_ = {
        {Pattern::regex(R"(@pytest\.mark\.skip)"), "pytest skip marker"},
        {Pattern::regex(R"(pytest\.skip\()"), "pytest skip call"},
        {Pattern::regex(R"(@unittest\.skip)"), "unittest skip decorator"},
        {Pattern::regex(R"(stages:\s*\[\s*manual\s*\])"), "manual-only pre-commit stage"},
        {Pattern::regex(R"(stages:\s*\[\s*push\s*\])"), "push-only pre-commit stage"},
        {Pattern::regex(R"(--fast(["'\s]|$))"), "fast mode flag"},
        {Pattern::regex(R"(--quick(["'\s]|$))"), "quick mode flag"},
        {Pattern::regex(R"(-k\s*["']?not\s+slow)"), "slow test exclusion"},
        {Pattern::regex(R"(\b(TEST_)?FAST_MODE\b)"), "fast mode variable"},
        {Pattern::regex(R"(SKIP_SLOW_TESTS)"), "skip slow tests variable"},
        {Pattern::regex(R"(#.*--no-verify)"), "comment suggesting --no-verify"},
        {Pattern::regex(R"(#.*skip.*test)", true), "comment about skipping tests"},
        {Pattern::regex(R"(#.*disable.*hook)", true), "comment about disabling hooks"},
    };

    precommit_rules_ = {
        {Pattern::regex(R"(--exit-zero)"), "--exit-zero makes a hook always pass"},
        {Pattern::regex(R"(--no-verify)"), "--no-verify in pre-commit configuration"},
        {Pattern::regex(R"(fail_fast:\s*false)"), "fail_fast disabled"},
        {Pattern::regex(R"(^\s*skip:\s*\[.*\])"), "hooks skipped via skip list"},
        {Pattern::regex(R"(stages:\s*\[\s*\])"), "empty stages disable a hook"},
    };
}

const char* BypassPatternGuard::description() const
{
    return "Blocks commands and edits that disable or weaken other checks";
}

bool BypassPatternGuard::is_bypass_variable(const std::string& name) const
{
    for (const auto& p : env_name_patterns_) {
        if (p.matches(name)) {
            return true;
        }
    }
    return false;
}

Decision BypassPatternGuard::check(const Event& event) const
{
    if (event.is_shell() && event.command) {
        return check_shell(*event.command);
    }
    if (event.is_file_edit() && event.new_content) {
        return check_content(event);
    }
    return Decision::allow(name());
}

Decision BypassPatternGuard::check_shell(const std::string& command) const
{
    const char* suggestion = "Fix the failing check instead of bypassing it";
    for (const auto& cmd : parse_command_line(command)) {
        std::vector<std::string> assigned;
        for (const auto& a : cmd.assignments) {
            assigned.push_back(a.first);
        }
        const std::string& program = cmd.program();
        if (program == "export" || program == "declare" || program == "typeset") {
            for (size_t i = 1; i < cmd.argv.size(); ++i) {
                const std::string& w = cmd.argv[i].text;
                if (w.empty() || w[0] == '-') {
                    continue;
                }
                const size_t eq = w.find('=');
                assigned.push_back(eq == std::string::npos ? w : w.substr(0, eq));
            }
        }
        for (const auto& var : assigned) {
            if (is_engine_variable(var)) {
                return Decision::block(name(), "command sets engine control variable " + var,
                                       std::string("Override codes are supplied by the operator via ") +
                                           kOverrideEnvVar + " in the hook environment");
            }
            if (is_bypass_variable(var)) {
                return Decision::block(name(), "command sets bypass variable " + var, suggestion);
            }
        }

        if (program == "pre-commit" && cmd.has_arg("uninstall")) {
            return Decision::block(name(), "pre-commit uninstall removes commit checks", suggestion);
        }
        if (program != "git") {
            continue;
        }
        size_t sub_index = 0;
        const std::string sub = git_subcommand(cmd, sub_index);
        if (sub.empty()) {
            continue;
        }
        for (size_t i = sub_index + 1; i < cmd.argv.size(); ++i) {
            const std::string& arg = cmd.argv[i].text;
            if (is_no_verify_option(arg)) {
                return Decision::block(name(), "git " + sub + " " + arg + " skips hooks (--no-verify)", suggestion);
            }
            if (sub != "commit") {
                continue;
            }
            if (commit_option_takes_value(arg)) {
                ++i;
                continue;
            }
            if (short_cluster_has_no_verify(arg)) {
                return Decision::block(name(), "git commit " + arg + " skips hooks (-n is --no-verify)", suggestion);
            }
        }
    }
    return Decision::allow(name());
}

Decision BypassPatternGuard::check_content(const Event& event) const
{
    const std::string& content = *event.new_content;
    const char* suggestion = "Keep every test and hook in the default run";
    if (event.file_path && is_precommit_config(*event.file_path)) {
        const std::string hit = first_line_match(precommit_rules_, content);
        if (!hit.empty()) {
            return Decision::block(name(), "pre-commit configuration weakened: " + hit, suggestion);
        }
    }
    const std::string hit = first_line_match(content_rules_, content);
    if (!hit.empty()) {
        return Decision::block(name(), "edit introduces bypass pattern: " + hit, suggestion);
    }
    return Decision::allow(name());
}

} // namespace hookguard
