// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "aggregator.hpp"
#include "audit_log.hpp"
#include "config.hpp"
#include "override_store.hpp"
#include "registry.hpp"
#include "result.hpp"

namespace hookguard {

struct EvaluationResult {
    Verdict verdict;
    AggregatorState state = AggregatorState::Clean;
    // SHA-256 of the override code, only when one was consumed.
    std::optional<std::string> override_code_sha256;
    bool audit_ok = true;
    std::string audit_error;
};

/**
 * One evaluation pipeline: registry fan-out, aggregation with lazy override
 * resolution, then a best-effort audit append. The audit outcome never
 * changes the verdict.
 */
class Engine {
  public:
    Engine(GuardRegistry registry, OverrideStore overrides, AuditLog audit);

    // `override_code` is the out-of-band code, if any; it is only consumed
    // when the event is blocked.
    EvaluationResult evaluate(const Event& event, const std::optional<std::string>& override_code);

    [[nodiscard]] const GuardRegistry& registry() const { return registry_; }
    [[nodiscard]] OverrideStore& overrides() { return overrides_; }
    [[nodiscard]] const AuditLog& audit() const { return audit_; }

  private:
    GuardRegistry registry_;
    OverrideStore overrides_;
    AuditLog audit_;
};

Result<std::unique_ptr<Engine>> make_engine(const EngineConfig& config);

AuditLogOptions audit_options_from_config(const EngineConfig& config);

} // namespace hookguard
