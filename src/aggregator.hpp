// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <functional>
#include <vector>

#include "types.hpp"

namespace hookguard {

enum class AggregatorState { Clean, Violated, OverrideValid, OverrideInvalidOrAbsent };

const char* aggregator_state_name(AggregatorState state);

struct Aggregation {
    Verdict verdict;
    AggregatorState state = AggregatorState::Clean;
};

// Consulted only when at least one decision blocks. Returns true iff a valid
// override was presented and consumed.
using OverrideResolver = std::function<bool()>;

/**
 * Merge per-guard decisions and override status into one verdict.
 *
 *   CLEAN     -> ALLOW
 *   VIOLATED  -> OVERRIDE_VALID            -> ALLOW (overridden)
 *             -> OVERRIDE_INVALID_OR_ABSENT -> BLOCK
 *
 * One valid override unblocks every blocking decision of the event.
 */
Aggregation aggregate(std::vector<Decision> decisions, const OverrideResolver& resolve_override);

} // namespace hookguard
