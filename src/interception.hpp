// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "engine.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hookguard {

// Read the whole payload, failing with InvalidInput past kMaxPayloadBytes.
Result<std::string> read_hook_payload(std::istream& in);

/**
 * Build an Event from the host's JSON payload.
 *
 * Accepts tool_name (alias tool), tool_input (aliases toolInput, parameters,
 * or the top level as a fallback) and an optional cwd. `fallback_cwd` is used
 * when the payload carries no cwd.
 */
Result<Event> parse_hook_payload(const std::string& payload, const std::string& fallback_cwd);

int verdict_exit_code(const Verdict& verdict);

// Human-readable verdict for the agent; written to `err` only.
void report_verdict(const EvaluationResult& result, std::ostream& err);

// Parse, evaluate and report one payload. Returns the host exit code
// (kExitAllow, kExitBlock, or kExitCheckFailed for unusable input).
int handle_hook_payload(Engine& engine, const std::string& payload, const std::optional<std::string>& override_code,
                        const std::string& fallback_cwd, std::ostream& err);

} // namespace hookguard
