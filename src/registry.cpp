// cppcheck-suppress-file missingIncludeSystem
#include "registry.hpp"

#include "guards.hpp"
#include "logging.hpp"
#include "tracing.hpp"

namespace hookguard {

Result<void> GuardRegistry::register_guard(std::unique_ptr<Guard> guard)
{
    if (!guard) {
        return Error::invalid_argument("Cannot register a null guard");
    }
    if (contains(guard->name())) {
        return Error(ErrorCode::DuplicateGuard, "Guard already registered", guard->name());
    }
    entries_.push_back(Entry{std::move(guard), true});
    return {};
}

Result<void> GuardRegistry::set_enabled(const std::string& name, bool enabled)
{
    for (auto& entry : entries_) {
        if (name == entry.guard->name()) {
            entry.enabled = enabled;
            return {};
        }
    }
    return Error(ErrorCode::InvalidArgument, "Unknown guard", name);
}

bool GuardRegistry::contains(const std::string& name) const
{
    for (const auto& entry : entries_) {
        if (name == entry.guard->name()) {
            return true;
        }
    }
    return false;
}

std::vector<Decision> GuardRegistry::evaluate(const Event& event) const
{
    ScopedSpan span("registry.evaluate", current_trace_id(), current_span_id());
    std::vector<Decision> decisions;
    decisions.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!entry.enabled) {
            continue;
        }
        Decision d = run_guard(*entry.guard, event);
        if (d.severity != Severity::Info) {
            logger().log(SLOG_DEBUG("Guard decision")
                             .field("guard", d.guard_name)
                             .field("severity", severity_name(d.severity))
                             .field("reason", d.reason));
        }
        decisions.push_back(std::move(d));
    }
    return decisions;
}

std::vector<GuardInfo> GuardRegistry::list() const
{
    std::vector<GuardInfo> out;
    for (const auto& entry : entries_) {
        out.push_back(GuardInfo{entry.guard->name(), entry.guard->description(), entry.enabled});
    }
    return out;
}

Result<GuardRegistry> build_default_registry(const GuardSettings& settings, const std::vector<std::string>& disabled)
{
    GuardRegistry registry;
    TRY(registry.register_guard(std::make_unique<PathBoundaryGuard>(settings)));
    TRY(registry.register_guard(std::make_unique<InstallScriptGuard>(settings)));
    TRY(registry.register_guard(std::make_unique<BypassPatternGuard>()));
    TRY(registry.register_guard(std::make_unique<ScriptIntegrityGuard>(settings)));
    TRY(registry.register_guard(std::make_unique<GitSafetyGuard>()));
    TRY(registry.register_guard(std::make_unique<TempFileLocationGuard>(settings)));
    TRY(registry.register_guard(std::make_unique<MockCodeGuard>()));
    TRY(registry.register_guard(std::make_unique<PythonEnvGuard>(settings)));
    TRY(registry.register_guard(std::make_unique<DockerComposeGuard>()));

    for (const auto& name : disabled) {
        TRY(registry.set_enabled(name, false));
    }
    return registry;
}

} // namespace hookguard
