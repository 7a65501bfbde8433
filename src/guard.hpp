// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace hookguard {

inline constexpr const char* kGuardInternalError = "guard internal error";

/**
 * Deployment-specific inputs shared by all guards. Values come from the
 * engine configuration; guards never read the environment themselves.
 */
struct GuardSettings {
    // Empty means "the event's working directory".
    std::string project_root;
    std::vector<std::string> allow_roots;
    std::string home_dir;
    std::string install_entry_point = kDefaultInstallEntryPoint;
    std::vector<std::string> protected_files;
    std::vector<std::string> protected_dirs;
    std::vector<std::string> protected_globs;

    [[nodiscard]] std::string project_root_for(const Event& event) const;
};

GuardSettings default_guard_settings();

class Guard {
  public:
    virtual ~Guard() = default;

    [[nodiscard]] virtual const char* name() const = 0;
    [[nodiscard]] virtual const char* description() const = 0;

    // Must be a pure function of the event and the guard's settings.
    [[nodiscard]] virtual Decision check(const Event& event) const = 0;
};

// Total wrapper around Guard::check: a thrown exception becomes a blocking
// decision with reason kGuardInternalError.
Decision run_guard(const Guard& guard, const Event& event);

} // namespace hookguard
