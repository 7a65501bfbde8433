// cppcheck-suppress-file missingIncludeSystem
#include "types.hpp"

#include "utils.hpp"

namespace hookguard {

const char* severity_name(Severity severity)
{
    switch (severity) {
        case Severity::Info:
            return "info";
        case Severity::Warn:
            return "warn";
        case Severity::Block:
            return "block";
    }
    return "info";
}

bool parse_severity(const std::string& value, Severity& out)
{
    const std::string v = to_lower(trim(value));
    if (v == "info") {
        out = Severity::Info;
    } else if (v == "warn") {
        out = Severity::Warn;
    } else if (v == "block") {
        out = Severity::Block;
    } else {
        return false;
    }
    return true;
}

const char* outcome_name(Outcome outcome)
{
    switch (outcome) {
        case Outcome::Allow:
            return "allow";
        case Outcome::AllowOverridden:
            return "allow_overridden";
        case Outcome::Block:
            return "block";
    }
    return "block";
}

bool Event::is_tool(const char* name) const
{
    return iequals(tool_name, name);
}

bool Event::is_shell() const
{
    return is_tool("Bash");
}

bool Event::is_file_edit() const
{
    return is_tool("Write") || is_tool("Edit") || is_tool("MultiEdit") || is_tool("NotebookEdit");
}

Decision Decision::allow(const std::string& guard_name)
{
    Decision d;
    d.guard_name = guard_name;
    return d;
}

Decision Decision::warn(const std::string& guard_name, std::string reason, std::optional<std::string> suggestion)
{
    Decision d;
    d.guard_name = guard_name;
    d.severity = Severity::Warn;
    d.reason = std::move(reason);
    d.suggestion = std::move(suggestion);
    return d;
}

Decision Decision::block(const std::string& guard_name, std::string reason, std::optional<std::string> suggestion)
{
    Decision d;
    d.guard_name = guard_name;
    d.blocked = true;
    d.severity = Severity::Block;
    d.reason = std::move(reason);
    d.suggestion = std::move(suggestion);
    return d;
}

} // namespace hookguard
