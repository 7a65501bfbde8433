// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

constexpr const char* kGitSuggestion = "Use a non-destructive alternative (git stash, --force-with-lease, a branch)";

bool is_short_flag_with(const std::string& arg, char flag)
{
    return arg.size() > 1 && arg[0] == '-' && arg[1] != '-' && arg.find(flag) != std::string::npos;
}

bool mutates_files(const SimpleCommand& cmd)
{
    const std::string& p = cmd.program();
    if (p == "sed") {
        for (size_t i = 1; i < cmd.argv.size(); ++i) {
            if (is_short_flag_with(cmd.argv[i].text, 'i') || cmd.argv[i].text.rfind("--in-place", 0) == 0) {
                return true;
            }
        }
        return false;
    }
    return p == "rm" || p == "mv" || p == "cp" || p == "chmod" || p == "chown" || p == "touch" || p == "ln" ||
           p == "tee" || p == "truncate" || p == "install" || p == "unlink" || p == "rmdir" || p == "rsync";
}

// A config key that turns hooks off or points them elsewhere.
bool is_hook_config_key(const std::string& key)
{
    const std::string lower = to_lower(key);
    return lower == "core.hookspath" || lower.rfind("hooks.", 0) == 0 || lower.rfind("hook.", 0) == 0;
}

// Global "-c key=value" and "--config-env key=VAR" options given before the
// subcommand apply to that one invocation.
std::string check_global_config(const SimpleCommand& cmd, size_t end)
{
    for (size_t i = 1; i < end && i < cmd.argv.size(); ++i) {
        const std::string& arg = cmd.argv[i].text;
        std::string assignment;
        if ((arg == "-c" || arg == "--config-env") && i + 1 < end) {
            assignment = cmd.argv[++i].text;
        } else if (arg.rfind("--config-env=", 0) == 0) {
            assignment = arg.substr(13);
        } else if (arg.size() > 2 && arg.rfind("-c", 0) == 0) {
            assignment = arg.substr(2);
        } else {
            continue;
        }
        const std::string key = assignment.substr(0, assignment.find('='));
        if (is_hook_config_key(key)) {
            const char* option = arg.rfind("--config-env", 0) == 0 ? "--config-env" : "-c";
            return std::string("git ") + option + " " + key + " overrides hook configuration";
        }
    }
    return {};
}

} // namespace

std::vector<ShellWord> operand_words(const SimpleCommand& cmd)
{
    std::vector<ShellWord> out;
    bool options_done = false;
    for (size_t i = 1; i < cmd.argv.size(); ++i) {
        const auto& w = cmd.argv[i];
        if (!options_done && w.text == "--") {
            options_done = true;
            continue;
        }
        if (!options_done && w.text.size() > 1 && w.text[0] == '-') {
            continue;
        }
        out.push_back(w);
    }
    return out;
}

std::string git_subcommand(const SimpleCommand& cmd, size_t& index)
{
    if (cmd.program() != "git") {
        return {};
    }
    for (size_t i = 1; i < cmd.argv.size(); ++i) {
        const std::string& arg = cmd.argv[i].text;
        if (arg == "-C" || arg == "-c" || arg == "--config-env" || arg == "--git-dir" || arg == "--work-tree" ||
            arg == "--namespace") {
            ++i;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            continue;
        }
        index = i;
        return arg;
    }
    return {};
}

GitSafetyGuard::GitSafetyGuard() : hooks_dir_(Pattern::literal(".git/hooks")) {}

const char* GitSafetyGuard::description() const
{
    return "Blocks force pushes, work-destroying git commands and hook tampering";
}

std::string GitSafetyGuard::check_git(const SimpleCommand& cmd) const
{
    size_t sub_index = 0;
    const std::string sub = git_subcommand(cmd, sub_index);
    std::string global = check_global_config(cmd, sub.empty() ? cmd.argv.size() : sub_index);
    if (!global.empty() || sub.empty()) {
        return global;
    }
    std::vector<std::string> args;
    for (size_t i = sub_index + 1; i < cmd.argv.size(); ++i) {
        args.push_back(cmd.argv[i].text);
    }
    auto has = [&](const char* flag) {
        for (const auto& a : args) {
            if (a == flag) {
                return true;
            }
        }
        return false;
    };

    if (sub == "push") {
        for (const auto& a : args) {
            if (a == "--force" || is_short_flag_with(a, 'f')) {
                return "git push " + a + " rewrites remote history";
            }
            if (a.size() > 1 && a[0] == '+') {
                return "git push with forced refspec '" + a + "'";
            }
        }
        return {};
    }
    if (sub == "reset" && has("--hard")) {
        return "git reset --hard discards uncommitted work";
    }
    if (sub == "clean") {
        if (has("-n") || has("--dry-run")) {
            return {};
        }
        for (const auto& a : args) {
            if (a == "--force" || is_short_flag_with(a, 'f')) {
                return "git clean " + a + " deletes untracked files";
            }
        }
        return {};
    }
    if (sub == "checkout") {
        bool after_dashes = false;
        for (const auto& a : args) {
            if (a == "--") {
                after_dashes = true;
                continue;
            }
            if (a == "." || a == ":/") {
                return "git checkout " + a + " discards working tree changes";
            }
            if (!after_dashes && (a == "-f" || a == "--force")) {
                return "git checkout --force discards working tree changes";
            }
        }
        return {};
    }
    if (sub == "restore") {
        const bool staged = has("--staged") || has("-S");
        const bool worktree = has("--worktree") || has("-W");
        if (!staged || worktree) {
            return "git restore overwrites working tree files";
        }
        return {};
    }
    if (sub == "config") {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string key = to_lower(args[i]);
            if (key == "core.hookspath" || key.rfind("core.hookspath=", 0) == 0) {
                return "git config core.hooksPath redirects or disables hooks";
            }
            if (key.rfind("hooks.", 0) == 0 && i + 1 < args.size() && to_lower(args[i + 1]) == "false") {
                return "git config " + args[i] + " false disables hooks";
            }
        }
        return {};
    }
    return {};
}

std::string GitSafetyGuard::check_hook_tampering(const SimpleCommand& cmd) const
{
    for (const auto& r : cmd.redirections) {
        if ((r.op == ">" || r.op == ">>") && matches_path_component(hooks_dir_, r.target.text)) {
            return "redirection writes into .git/hooks";
        }
    }
    if (!mutates_files(cmd)) {
        return {};
    }
    for (size_t i = 1; i < cmd.argv.size(); ++i) {
        if (matches_path_component(hooks_dir_, cmd.argv[i].text)) {
            return cmd.program() + " modifies .git/hooks";
        }
    }
    return {};
}

Decision GitSafetyGuard::check(const Event& event) const
{
    if (event.is_file_edit() && event.file_path) {
        if (matches_path_component(hooks_dir_, *event.file_path)) {
            return Decision::block(name(), "edit inside .git/hooks", std::string("Leave git hooks to the installer"));
        }
        return Decision::allow(name());
    }
    if (!event.is_shell() || !event.command) {
        return Decision::allow(name());
    }
    for (const auto& cmd : parse_command_line(*event.command)) {
        std::string reason = cmd.program() == "git" ? check_git(cmd) : check_hook_tampering(cmd);
        if (!reason.empty()) {
            return Decision::block(name(), reason, std::string(kGitSuggestion));
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
