// cppcheck-suppress-file missingIncludeSystem
#include "guard.hpp"

#include <exception>

#include "logging.hpp"
#include "shell.hpp"
#include "utils.hpp"

namespace hookguard {

std::string GuardSettings::project_root_for(const Event& event) const
{
    const std::string& root = project_root.empty() ? event.working_directory : project_root;
    return resolve_path("/", root, home_dir);
}

GuardSettings default_guard_settings()
{
    GuardSettings settings;
    settings.home_dir = home_directory();
    settings.protected_files = {"run_tests.sh", ".pre-commit-config.yaml", "CLAUDE.md"};
    settings.protected_dirs = {"tests"};
    settings.protected_globs = {"test_*", "*_test.*"};
    return settings;
}

Decision run_guard(const Guard& guard, const Event& event)
{
    try {
        Decision d = guard.check(event);
        d.guard_name = guard.name();
        d.blocked = d.severity == Severity::Block;
        return d;
    } catch (const std::exception& e) {
        logger().log(SLOG_ERROR("Guard raised an exception; failing closed")
                         .field("guard", guard.name())
                         .field("tool", event.tool_name)
                         .field("error", e.what()));
    } catch (...) {
        logger().log(SLOG_ERROR("Guard raised a non-standard exception; failing closed")
                         .field("guard", guard.name())
                         .field("tool", event.tool_name));
    }
    return Decision::block(guard.name(), kGuardInternalError);
}

} // namespace hookguard
