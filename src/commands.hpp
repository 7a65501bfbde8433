// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace hookguard {

// Hook mode: payload on stdin, verdict on stderr, exit 0/1/2.
int cmd_check(const std::optional<std::string>& override_code);

// Operator commands (stdout is theirs).
int cmd_override_issue(int64_t ttl_seconds, const std::string& reason, bool json_output = false);
int cmd_override_list(bool json_output = false);
int cmd_override_prune();

int cmd_audit_tail(size_t count);
int cmd_audit_summary(int64_t window_seconds, bool json_output = false);

int cmd_guards_list();
int cmd_policy_validate(const std::string& path, bool verbose = false);

// Runs `body`. An exception escaping it is logged at ERROR, reported on `err`
// and turned into kExitCheckFailed so a hook never dies with an abort.
int run_command_guarded(const std::string& command, const std::function<int()>& body, std::ostream& err);

} // namespace hookguard
