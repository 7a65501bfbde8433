// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hookguard {

inline constexpr const char* kVersion = "1.0.0";

inline constexpr const char* kOverrideEnvVar = "HOOK_OVERRIDE_CODE";
inline constexpr const char* kDefaultStateSubdir = ".claude/hookguard";
inline constexpr const char* kAuditLogFileName = "audit.jsonl";
inline constexpr const char* kOverrideStoreFileName = "overrides.jsonl";
inline constexpr const char* kPolicyFileName = "policy.conf";
inline constexpr const char* kDefaultInstallEntryPoint = "safe_install.sh";

inline constexpr int kExitAllow = 0;
inline constexpr int kExitCheckFailed = 1;
inline constexpr int kExitBlock = 2;

inline constexpr size_t kMaxPayloadBytes = 1024 * 1024;
inline constexpr size_t kAuditCommandMaxBytes = 512;
inline constexpr uint32_t kAuditSchemaVersion = 1;
inline constexpr int64_t kOverrideDefaultTtlSeconds = 900;
inline constexpr int64_t kOverrideMaxTtlSeconds = 86400;

enum class Severity { Info, Warn, Block };

const char* severity_name(Severity severity);
bool parse_severity(const std::string& value, Severity& out);

/**
 * Normalized description of one proposed action. Built once by the
 * interception adapter and treated as immutable afterwards.
 */
struct Event {
    std::string tool_name;
    std::optional<std::string> command;
    std::optional<std::string> file_path;
    std::optional<std::string> new_content;
    std::string working_directory;
    int64_t timestamp_unix_ms = 0;

    [[nodiscard]] bool is_tool(const char* name) const;
    [[nodiscard]] bool is_shell() const;
    [[nodiscard]] bool is_file_edit() const;
};

struct Decision {
    std::string guard_name;
    bool blocked = false;
    Severity severity = Severity::Info;
    std::string reason;
    std::optional<std::string> suggestion;

    static Decision allow(const std::string& guard_name);
    static Decision warn(const std::string& guard_name, std::string reason,
                         std::optional<std::string> suggestion = {});
    static Decision block(const std::string& guard_name, std::string reason,
                          std::optional<std::string> suggestion = {});
};

enum class Outcome { Allow, AllowOverridden, Block };

const char* outcome_name(Outcome outcome);

struct Verdict {
    Outcome outcome = Outcome::Allow;
    bool blocked = false;
    bool overridden = false;
    // "<guard>: <reason>" per blocking decision, registry order.
    std::vector<std::string> reasons;
    std::vector<std::string> warnings;
    std::vector<Decision> decisions;
};

struct OverrideCode {
    std::string code_sha256;
    int64_t issued_at = 0;
    int64_t expires_at = 0;
    bool consumed = false;
    int64_t consumed_at = 0;
    std::string reason;

    [[nodiscard]] bool expired(int64_t now_unix) const { return now_unix >= expires_at; }
};

struct PolicyIssues {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
};

} // namespace hookguard
