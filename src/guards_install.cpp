// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

bool looks_like_shell_script(const std::string& path, const std::string& content)
{
    const std::string lower = to_lower(path);
    auto ends_with = [&](const char* suffix) {
        const std::string s(suffix);
        return lower.size() >= s.size() && lower.compare(lower.size() - s.size(), s.size(), s) == 0;
    };
    return ends_with(".sh") || ends_with(".bash") || content.rfind("#!", 0) == 0;
}

std::string blocked_script_reason(const std::string& basename)
{
    return "creating or modifying installation script '" + basename + "'";
}

} // namespace

InstallScriptGuard::InstallScriptGuard(GuardSettings settings) : settings_(std::move(settings))
{
    for (const char* re : {R"(^install.*\.sh$)", R"(^setup.*\.sh$)", R"(^deploy.*\.sh$)", R"(install.*claude.*\.sh$)",
                           R"(setup.*claude.*\.sh$)", R"(install.*hook.*\.sh$)", R"(install.*mcp.*\.sh$)"}) {
        name_patterns_.push_back(Pattern::regex(re, true));
    }
    const char* target = R"((~|\$HOME|\$\{HOME\})/\.claude\b)";
    for (const char* verb : {"cp", "mv", "rm", "mkdir", "install", "ln", "rsync"}) {
        content_rules_.push_back(PatternRule{Pattern::regex(std::string("\\b") + verb + "\\b.*" + target),
                                             std::string("'") + verb + "' into the agent configuration directory"});
    }
}

const char* InstallScriptGuard::description() const
{
    return "Blocks ad-hoc installation scripts and writes into ~/.claude";
}

bool InstallScriptGuard::is_install_script(const std::string& path) const
{
    const std::string base = path_basename(path);
    if (base.empty() || iequals(base, settings_.install_entry_point)) {
        return false;
    }
    for (const auto& p : name_patterns_) {
        if (p.matches(base)) {
            return true;
        }
    }
    return false;
}

Decision InstallScriptGuard::check(const Event& event) const
{
    if (event.is_shell() && event.command) {
        return check_shell(*event.command);
    }
    if (event.is_file_edit() && event.file_path) {
        return check_file_edit(event);
    }
    return Decision::allow(name());
}

Decision InstallScriptGuard::check_file_edit(const Event& event) const
{
    const std::string& path = *event.file_path;
    const std::string suggestion = "Extend the single entry point '" + settings_.install_entry_point + "' instead";
    if (is_install_script(path)) {
        return Decision::block(name(), blocked_script_reason(path_basename(path)), suggestion);
    }
    if (iequals(path_basename(path), settings_.install_entry_point) || !event.new_content) {
        return Decision::allow(name());
    }
    if (!looks_like_shell_script(path, *event.new_content)) {
        return Decision::allow(name());
    }
    const std::string hit = first_line_match(content_rules_, *event.new_content);
    if (!hit.empty()) {
        return Decision::block(name(), "script content installs into the agent configuration: " + hit, suggestion);
    }
    return Decision::allow(name());
}

Decision InstallScriptGuard::check_shell(const std::string& command) const
{
    const std::string suggestion = "Extend the single entry point '" + settings_.install_entry_point + "' instead";
    for (const auto& cmd : parse_command_line(command)) {
        for (const auto& r : cmd.redirections) {
            if ((r.op == ">" || r.op == ">>") && is_install_script(r.target.text)) {
                return Decision::block(name(), blocked_script_reason(path_basename(r.target.text)), suggestion);
            }
        }
        const std::string& program = cmd.program();
        const auto operands = operand_words(cmd);
        if (program == "touch" || program == "tee") {
            for (const auto& w : operands) {
                if (is_install_script(w.text)) {
                    return Decision::block(name(), blocked_script_reason(path_basename(w.text)), suggestion);
                }
            }
        } else if ((program == "cp" || program == "mv" || program == "install" || program == "ln") &&
                   operands.size() >= 2) {
            const std::string& dest = operands.back().text;
            const bool dest_is_dir = dest == "." || dest == ".." || (!dest.empty() && dest.back() == '/');
            if (dest_is_dir) {
                for (size_t i = 0; i + 1 < operands.size(); ++i) {
                    if (is_install_script(operands[i].text)) {
                        return Decision::block(name(), blocked_script_reason(path_basename(operands[i].text)),
                                               suggestion);
                    }
                }
            } else if (is_install_script(dest)) {
                return Decision::block(name(), blocked_script_reason(path_basename(dest)), suggestion);
            }
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
