// cppcheck-suppress-file missingIncludeSystem
#include <filesystem>

#include "guards.hpp"

namespace hookguard {

TempFileLocationGuard::TempFileLocationGuard(GuardSettings settings) : settings_(std::move(settings))
{
    for (const char* glob : {"debug_*", "temp_*", "quick_*", "check_*", "investigate_*"}) {
        scratch_patterns_.push_back(Pattern::glob(glob, true));
    }
}

const char* TempFileLocationGuard::description() const
{
    return "Warns when scratch files are written to the project root";
}

Decision TempFileLocationGuard::check(const Event& event) const
{
    if (!event.is_file_edit() || !event.file_path) {
        return Decision::allow(name());
    }
    const std::string root = settings_.project_root_for(event);
    const std::string cwd = resolve_path("/", event.working_directory, settings_.home_dir);
    const std::string absolute = resolve_path(cwd, *event.file_path, settings_.home_dir);
    const std::string parent = std::filesystem::path(absolute).parent_path().string();
    if (parent != root) {
        return Decision::allow(name());
    }
    const std::string base = path_basename(absolute);
    for (const auto& p : scratch_patterns_) {
        if (p.matches(base)) {
            return Decision::warn(name(), "scratch file '" + base + "' written to the project root",
                                  "Put scratch files under " + root + "/tmp/ instead");
        }
    }
    return Decision::allow(name());
}

} // namespace hookguard
