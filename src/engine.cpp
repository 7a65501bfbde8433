// cppcheck-suppress-file missingIncludeSystem
#include "engine.hpp"

#include "logging.hpp"
#include "sha256.hpp"
#include "tracing.hpp"

namespace hookguard {

Engine::Engine(GuardRegistry registry, OverrideStore overrides, AuditLog audit)
    : registry_(std::move(registry)), overrides_(std::move(overrides)), audit_(std::move(audit))
{
}

EvaluationResult Engine::evaluate(const Event& event, const std::optional<std::string>& override_code)
{
    ScopedSpan span("engine.evaluate", current_trace_id(), current_span_id());
    EvaluationResult result;

    std::vector<Decision> decisions = registry_.evaluate(event);
    Aggregation agg = aggregate(std::move(decisions), [&]() -> bool {
        if (!override_code || override_code->empty()) {
            return false;
        }
        if (!overrides_.validate_and_consume(*override_code)) {
            return false;
        }
        result.override_code_sha256 = Sha256::hash_hex(normalize_override_code(*override_code));
        return true;
    });
    result.verdict = std::move(agg.verdict);
    result.state = agg.state;

    if (result.verdict.blocked) {
        span.fail("blocked");
    }
    logger().log(SLOG_INFO("Event evaluated")
                     .field("tool", event.tool_name)
                     .field("outcome", outcome_name(result.verdict.outcome))
                     .field("state", aggregator_state_name(result.state))
                     .field("blocking", static_cast<uint64_t>(result.verdict.reasons.size()))
                     .field("warnings", static_cast<uint64_t>(result.verdict.warnings.size())));

    const AuditRecord record = make_audit_record(event, result.verdict, result.override_code_sha256);
    auto appended = audit_.append(record);
    if (!appended) {
        result.audit_ok = false;
        result.audit_error = appended.error().to_string();
        logger().log(SLOG_ERROR("Audit log write failed; verdict unchanged")
                         .field("path", audit_.options().path)
                         .field("error", result.audit_error));
    }
    return result;
}

AuditLogOptions audit_options_from_config(const EngineConfig& config)
{
    AuditLogOptions options;
    options.path = config.audit_log_path;
    options.lock_timeout_ms = config.lock_timeout_ms;
    return options;
}

Result<std::unique_ptr<Engine>> make_engine(const EngineConfig& config)
{
    auto registry = build_default_registry(config.guards, config.disabled_guards);
    if (!registry) {
        return registry.error();
    }
    OverrideStore overrides(config.override_store_path, config.lock_timeout_ms);
    AuditLog audit(audit_options_from_config(config));
    return std::make_unique<Engine>(std::move(*registry), std::move(overrides), std::move(audit));
}

} // namespace hookguard
