// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "file_lock.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hookguard {

inline constexpr size_t kAuditReadCapBytes = 1024 * 1024;

struct SanitizedText {
    std::string sanitized;
    bool truncated = false;
    std::string raw_sha256_hex;
};

// NOTE: raw_sha256_hex is computed over the raw bytes exactly as provided,
// before truncation/sanitization.
SanitizedText sanitize_and_hash(const std::string& raw, size_t max_bytes);

struct AuditDecision {
    std::string guard;
    std::string severity;
    std::string reason;
};

struct AuditRecord {
    uint32_t schema_version = kAuditSchemaVersion;
    int64_t ts_unix_ms = 0;
    uint32_t pid = 0;
    std::string tool_name;
    std::optional<std::string> command;
    std::optional<std::string> command_sha256;
    bool command_truncated = false;
    std::optional<std::string> file_path;
    std::optional<std::string> content_sha256;
    uint64_t content_bytes = 0;
    std::string working_directory;
    std::string outcome;
    bool blocked = false;
    bool overridden = false;
    std::optional<std::string> override_code_sha256;
    std::vector<AuditDecision> decisions;
};

// Summarize an evaluated event into a record. Only non-info decisions are kept.
AuditRecord make_audit_record(const Event& event, const Verdict& verdict,
                              const std::optional<std::string>& override_code_sha256);

std::string audit_record_to_json(const AuditRecord& record);
bool parse_audit_record(const std::string& line, AuditRecord& out);

struct AuditLogOptions {
    std::string path;
    uint32_t lock_timeout_ms = kDefaultLockTimeoutMs;
};

struct AuditSummary {
    uint64_t total = 0;
    uint64_t blocked = 0;
    uint64_t overridden = 0;
    uint64_t allowed = 0;
    uint64_t malformed_lines = 0;
    int64_t window_seconds = 0;
    // Blocking decisions per guard within the window.
    std::map<std::string, uint64_t> blocks_by_guard;
    std::map<std::string, uint64_t> warnings_by_guard;
};

/**
 * Append-only JSONL audit trail.
 *
 * Writers serialize on an exclusive lock of "<path>.lock"; each record is a
 * single O_APPEND write followed by fsync. Readers never take the lock and
 * skip lines that do not parse.
 */
class AuditLog {
  public:
    explicit AuditLog(AuditLogOptions options);

    // Appends under the lock. A failed attempt is retried once. Records are
    // never rewritten or removed; rotation and archival happen outside.
    Result<void> append(const AuditRecord& record);

    // Most recent records, oldest first.
    Result<std::vector<AuditRecord>> read_tail(size_t max_records) const;

    // window_seconds <= 0 means the whole readable tail.
    Result<AuditSummary> summarize(int64_t window_seconds, int64_t now_ms) const;

    [[nodiscard]] const AuditLogOptions& options() const { return options_; }

  private:
    Result<void> append_once(const std::string& line);
    Result<std::vector<std::string>> read_tail_lines() const;

    AuditLogOptions options_;
};

using AuditWriteFn = Result<void> (*)(const std::string& path, const std::string& line);
void set_audit_write_fn_for_test(AuditWriteFn fn);
void reset_audit_write_fn_for_test();

} // namespace hookguard
