// cppcheck-suppress-file missingIncludeSystem
#include <vector>

#include "guards.hpp"
#include "logging.hpp"

namespace hookguard {

namespace {

// Directory state of one shell level. A child shell ("bash -c") starts from
// its parent's state and its changes are discarded when it exits.
struct DirState {
    std::string cwd;
    bool cwd_known = true;
    std::vector<std::string> dir_stack;
};

} // namespace

PathBoundaryGuard::PathBoundaryGuard(GuardSettings settings) : settings_(std::move(settings)) {}

const char* PathBoundaryGuard::description() const
{
    return "Blocks cd/pushd out of the project root and allowlisted roots";
}

bool PathBoundaryGuard::allowed(const std::string& path, const std::string& project_root) const
{
    if (path_is_within(path, project_root)) {
        return true;
    }
    for (const auto& root : settings_.allow_roots) {
        if (path_is_within(path, resolve_path("/", root, settings_.home_dir))) {
            return true;
        }
    }
    return false;
}

Decision PathBoundaryGuard::check(const Event& event) const
{
    if (!event.is_shell() || !event.command) {
        return Decision::allow(name());
    }

    const std::string project_root = settings_.project_root_for(event);
    DirState state{resolve_path("/", event.working_directory, settings_.home_dir), true, {}};
    std::vector<DirState> parents;
    std::vector<std::string> violations;
    std::vector<std::string> unresolved;

    for (const auto& cmd : parse_command_line(*event.command)) {
        while (static_cast<int>(parents.size()) > cmd.shell_depth) {
            state = std::move(parents.back());
            parents.pop_back();
        }
        while (static_cast<int>(parents.size()) < cmd.shell_depth) {
            parents.push_back(state);
        }
        if (cmd.empty()) {
            continue;
        }
        const ScriptArgument script = script_argument(cmd);
        if (script.present && script.dynamic) {
            unresolved.push_back("'" + cmd.program() + "' script cannot be resolved statically");
            continue;
        }
        if (cmd.runs_script) {
            continue;
        }
        std::string& cwd = state.cwd;
        bool& cwd_known = state.cwd_known;
        std::vector<std::string>& dir_stack = state.dir_stack;
        const std::string program = cmd.program();
        if (program == "popd") {
            if (!dir_stack.empty()) {
                cwd = dir_stack.back();
                dir_stack.pop_back();
            } else {
                cwd_known = false;
            }
            continue;
        }
        if (program != "cd" && program != "pushd") {
            continue;
        }

        std::vector<ShellWord> args;
        for (size_t i = 1; i < cmd.argv.size(); ++i) {
            const ShellWord& w = cmd.argv[i];
            if (w.text == "-L" || w.text == "-P" || w.text == "-e" || w.text == "-@" || w.text == "--") {
                continue;
            }
            args.push_back(w);
        }

        std::string target;
        if (args.empty()) {
            if (program == "pushd") {
                unresolved.push_back("pushd without a directory swaps the directory stack");
                cwd_known = false;
                continue;
            }
            target = settings_.home_dir;
        } else {
            const ShellWord& arg = args.front();
            if (arg.text == "-") {
                unresolved.push_back("'" + program + " -' target cannot be resolved statically");
                cwd_known = false;
                continue;
            }
            if (arg.dynamic) {
                unresolved.push_back("'" + program + " " + arg.text + "' depends on runtime expansion");
                cwd_known = false;
                continue;
            }
            if (arg.text.size() > 1 && arg.text[0] == '~' && arg.text[1] != '/') {
                unresolved.push_back("'" + program + " " + arg.text + "' refers to another user's home");
                cwd_known = false;
                continue;
            }
            if (!cwd_known && arg.text[0] != '/' && arg.text[0] != '~') {
                unresolved.push_back("'" + program + " " + arg.text + "' is relative to an unknown directory");
                continue;
            }
            target = arg.text;
        }

        const std::string resolved = resolve_path(cwd, target, settings_.home_dir);
        if (!allowed(resolved, project_root)) {
            violations.push_back(program + " to '" + resolved + "' leaves project root '" + project_root + "'");
        }
        if (program == "pushd") {
            dir_stack.push_back(cwd);
        }
        cwd = resolved;
        cwd_known = true;
    }

    if (!violations.empty()) {
        std::string reason = violations.front();
        if (violations.size() > 1) {
            reason += " (+" + std::to_string(violations.size() - 1) + " more)";
        }
        return Decision::block(name(), reason,
                               "Stay inside " + project_root + " or add the directory to [allow_root] in the policy");
    }
    if (!unresolved.empty()) {
        logger().log(SLOG_DEBUG("Unresolved directory change").field("detail", unresolved.front()));
        return Decision::warn(name(), unresolved.front());
    }
    return Decision::allow(name());
}

} // namespace hookguard
