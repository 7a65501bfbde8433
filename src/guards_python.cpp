// cppcheck-suppress-file missingIncludeSystem
#include "guards.hpp"

namespace hookguard {

namespace {

// "python", "python3", "python3.12" and the same for "pip".
bool is_versioned_tool(const std::string& program, const char* tool)
{
    const std::string base = path_basename(program);
    const std::string prefix(tool);
    if (base.rfind(prefix, 0) != 0) {
        return false;
    }
    for (size_t i = prefix.size(); i < base.size(); ++i) {
        if ((base[i] < '0' || base[i] > '9') && base[i] != '.') {
            return false;
        }
    }
    return true;
}

bool is_venv_interpreter(const std::string& program)
{
    return program.find("venv/bin/") != std::string::npos;
}

bool activates_venv(const SimpleCommand& cmd)
{
    if ((cmd.program() != "source" && cmd.program() != ".") || cmd.argv.size() < 2) {
        return false;
    }
    const std::string& script = cmd.argv[1].text;
    const std::string suffix = "bin/activate";
    return script.size() >= suffix.size() && script.compare(script.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Words after "pip install" when `cmd` runs pip, either directly or as
// "python -m pip". Returns false when the command does not install.
bool pip_install_args(const SimpleCommand& cmd, std::vector<std::string>& args)
{
    size_t i = 1;
    if (is_versioned_tool(cmd.program(), "python")) {
        if (cmd.argv.size() < 3 || cmd.argv[1].text != "-m" || cmd.argv[2].text != "pip") {
            return false;
        }
        i = 3;
    } else if (!is_versioned_tool(cmd.program(), "pip")) {
        return false;
    }
    for (; i < cmd.argv.size(); ++i) {
        const std::string& w = cmd.argv[i].text;
        if (!w.empty() && w[0] == '-') {
            continue;
        }
        if (w != "install") {
            return false;
        }
        for (size_t j = i + 1; j < cmd.argv.size(); ++j) {
            args.push_back(cmd.argv[j].text);
        }
        return true;
    }
    return false;
}

bool pip_install_allowed(const std::vector<std::string>& args)
{
    bool upgrade = false;
    bool pip_operand = false;
    for (const auto& a : args) {
        if (a == "--user" || a.rfind("-r", 0) == 0 || a.rfind("--requirement", 0) == 0) {
            return true;
        }
        upgrade = upgrade || a == "--upgrade" || a == "-U";
        pip_operand = pip_operand || a == "pip";
    }
    return upgrade && pip_operand;
}

bool interpreter_call_allowed(const SimpleCommand& cmd)
{
    if (cmd.argv.size() < 2) {
        return true;
    }
    const std::string& first = cmd.argv[1].text;
    if (first == "--version" || first == "-V" || first == "-VV") {
        return true;
    }
    return first == "-m" && cmd.argv.size() > 2 && cmd.argv[2].text == "venv";
}

} // namespace

PythonEnvGuard::PythonEnvGuard(GuardSettings settings) : settings_(std::move(settings)) {}

const char* PythonEnvGuard::description() const
{
    return "Blocks ad-hoc pip installs and Python run outside the project venv";
}

Decision PythonEnvGuard::check(const Event& event) const
{
    if (!event.is_shell() || !event.command) {
        return Decision::allow(name());
    }
    const std::string root = settings_.project_root_for(event);
    bool activated = false;
    for (const auto& cmd : parse_command_line(*event.command)) {
        if (cmd.runs_script) {
            continue;
        }
        if (activates_venv(cmd)) {
            activated = true;
            continue;
        }
        std::vector<std::string> install_args;
        if (pip_install_args(cmd, install_args) && !pip_install_allowed(install_args)) {
            std::string package = "package";
            for (const auto& a : install_args) {
                if (!a.empty() && a[0] != '-') {
                    package = a;
                    break;
                }
            }
            return Decision::block(name(), "pip install " + package + " bypasses the requirements files",
                                   "Add " + package + " to requirements.txt and run pip install -r requirements.txt");
        }
        const std::string& program = cmd.program();
        if (!is_versioned_tool(program, "python") || is_venv_interpreter(program) || activated) {
            continue;
        }
        if (!interpreter_call_allowed(cmd)) {
            return Decision::block(name(), "'" + program + "' runs outside the project venv",
                                   "Run " + root + "/venv/bin/python or source venv/bin/activate first");
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
