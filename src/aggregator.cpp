// cppcheck-suppress-file missingIncludeSystem
#include "aggregator.hpp"

namespace hookguard {

const char* aggregator_state_name(AggregatorState state)
{
    switch (state) {
        case AggregatorState::Clean:
            return "CLEAN";
        case AggregatorState::Violated:
            return "VIOLATED";
        case AggregatorState::OverrideValid:
            return "OVERRIDE_VALID";
        case AggregatorState::OverrideInvalidOrAbsent:
            return "OVERRIDE_INVALID_OR_ABSENT";
    }
    return "VIOLATED";
}

Aggregation aggregate(std::vector<Decision> decisions, const OverrideResolver& resolve_override)
{
    Aggregation out;
    Verdict& v = out.verdict;
    for (const auto& d : decisions) {
        if (d.blocked) {
            v.reasons.push_back(d.guard_name + ": " + d.reason);
        } else if (d.severity == Severity::Warn) {
            v.warnings.push_back(d.guard_name + ": " + d.reason);
        }
    }
    v.decisions = std::move(decisions);

    out.state = v.reasons.empty() ? AggregatorState::Clean : AggregatorState::Violated;
    if (out.state == AggregatorState::Clean) {
        v.outcome = Outcome::Allow;
        return out;
    }

    const bool override_ok = resolve_override && resolve_override();
    if (override_ok) {
        out.state = AggregatorState::OverrideValid;
        v.outcome = Outcome::AllowOverridden;
        v.overridden = true;
        v.blocked = false;
    } else {
        out.state = AggregatorState::OverrideInvalidOrAbsent;
        v.outcome = Outcome::Block;
        v.blocked = true;
    }
    return out;
}

} // namespace hookguard
