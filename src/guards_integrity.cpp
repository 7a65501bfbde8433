// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

constexpr const char* kIntegritySuggestion =
    "Protected verification files change only with an operator override code (hookguard override issue)";

bool has_in_place_flag(const SimpleCommand& cmd)
{
    for (size_t i = 1; i < cmd.argv.size(); ++i) {
        const std::string& arg = cmd.argv[i].text;
        if (arg == "--in-place" || arg.rfind("--in-place=", 0) == 0) {
            return true;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-' && arg.find('i') != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

ScriptIntegrityGuard::ScriptIntegrityGuard(GuardSettings settings) : settings_(std::move(settings))
{
    for (const auto& dir : settings_.protected_dirs) {
        dir_patterns_.push_back(Pattern::literal(dir));
    }
    for (const auto& glob : settings_.protected_globs) {
        glob_patterns_.push_back(Pattern::glob(glob));
    }
}

const char* ScriptIntegrityGuard::description() const
{
    return "Blocks edits and destructive commands on protected test/verification files";
}

bool ScriptIntegrityGuard::is_protected(const std::string& path, const std::string& cwd,
                                        const std::string& project_root) const
{
    if (path.empty()) {
        return false;
    }
    const std::string absolute = resolve_path(cwd, path, settings_.home_dir);
    std::string relative = absolute;
    if (path_is_within(absolute, project_root) && absolute.size() > project_root.size()) {
        relative = absolute.substr(project_root == "/" ? 1 : project_root.size() + 1);
    }

    const std::string base = path_basename(relative);
    for (const auto& file : settings_.protected_files) {
        if (base == file) {
            return true;
        }
    }
    for (const auto& p : dir_patterns_) {
        if (matches_path_component(p, relative)) {
            return true;
        }
    }
    for (const auto& p : glob_patterns_) {
        if (p.matches(base)) {
            return true;
        }
    }
    return false;
}

Decision ScriptIntegrityGuard::check(const Event& event) const
{
    if (event.is_file_edit() && event.file_path) {
        const std::string root = settings_.project_root_for(event);
        const std::string cwd = resolve_path("/", event.working_directory, settings_.home_dir);
        if (is_protected(*event.file_path, cwd, root)) {
            return Decision::block(name(), "edit to protected verification file '" + *event.file_path + "'",
                                   std::string(kIntegritySuggestion));
        }
        return Decision::allow(name());
    }
    if (event.is_shell() && event.command) {
        return check_shell(event);
    }
    return Decision::allow(name());
}

Decision ScriptIntegrityGuard::check_shell(const Event& event) const
{
    const std::string root = settings_.project_root_for(event);
    const std::string cwd = resolve_path("/", event.working_directory, settings_.home_dir);

    for (const auto& cmd : parse_command_line(*event.command)) {
        for (const auto& r : cmd.redirections) {
            if ((r.op == ">" || r.op == ">>") && is_protected(r.target.text, cwd, root)) {
                return Decision::block(name(), "redirection overwrites protected file '" + r.target.text + "'",
                                       std::string(kIntegritySuggestion));
            }
        }

        const std::string& program = cmd.program();
        const auto operands = operand_words(cmd);
        std::vector<ShellWord> targets;
        if (program == "rm" || program == "mv" || program == "truncate" || program == "chmod" || program == "tee" ||
            program == "unlink" || program == "shred") {
            targets = operands;
        } else if (program == "sed" && has_in_place_flag(cmd)) {
            targets = operands;
        } else if (program == "cp" && !operands.empty()) {
            targets.push_back(operands.back());
        }
        for (const auto& t : targets) {
            if (is_protected(t.text, cwd, root)) {
                return Decision::block(name(), program + " targets protected file '" + t.text + "'",
                                       std::string(kIntegritySuggestion));
            }
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
