// cppcheck-suppress-file missingIncludeSystem
#include "audit_log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sstream>

#include "json_value.hpp"
#include "logging.hpp"
#include "sha256.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

AuditWriteFn g_audit_write_fn = append_jsonl_line;

void write_optional_string(std::ostringstream& oss, const char* key, const std::optional<std::string>& value)
{
    oss << ",\"" << key << "\":";
    if (value) {
        oss << "\"" << json_escape(*value) << "\"";
    } else {
        oss << "null";
    }
}

std::optional<std::string> read_optional_string(const JsonValue& doc, const char* key)
{
    std::string value;
    if (doc.get_string(key, value)) {
        return value;
    }
    return std::nullopt;
}

} // namespace

void set_audit_write_fn_for_test(AuditWriteFn fn)
{
    g_audit_write_fn = fn ? fn : append_jsonl_line;
}

void reset_audit_write_fn_for_test()
{
    g_audit_write_fn = append_jsonl_line;
}

SanitizedText sanitize_and_hash(const std::string& raw, size_t max_bytes)
{
    SanitizedText out{};
    out.raw_sha256_hex = Sha256::hash_hex(raw);

    std::string s;
    s.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c < 0x20 || c == 0x7f) {
            s.push_back(' ');
            continue;
        }
        s.push_back(static_cast<char>(c));
    }

    s = trim(s);

    if (max_bytes == 0) {
        max_bytes = kAuditCommandMaxBytes;
    }
    static constexpr const char* kSuffix = "...(truncated)";
    if (s.size() > max_bytes) {
        out.truncated = true;
        const size_t suffix_len = std::strlen(kSuffix);
        size_t keep = max_bytes > suffix_len + 1 ? max_bytes - suffix_len : max_bytes;
        // Do not cut a UTF-8 sequence in half.
        while (keep > 0 && (static_cast<unsigned char>(s[keep]) & 0xC0) == 0x80) {
            --keep;
        }
        s = s.substr(0, keep) + (max_bytes > suffix_len + 1 ? kSuffix : "");
    }

    out.sanitized = s;
    return out;
}

AuditRecord make_audit_record(const Event& event, const Verdict& verdict,
                              const std::optional<std::string>& override_code_sha256)
{
    AuditRecord r;
    r.ts_unix_ms = event.timestamp_unix_ms != 0 ? event.timestamp_unix_ms : now_unix_ms();
    r.pid = static_cast<uint32_t>(::getpid());
    r.tool_name = event.tool_name;
    if (event.command) {
        const SanitizedText cmd = sanitize_and_hash(*event.command, kAuditCommandMaxBytes);
        r.command = cmd.sanitized;
        r.command_sha256 = cmd.raw_sha256_hex;
        r.command_truncated = cmd.truncated;
    }
    r.file_path = event.file_path;
    if (event.new_content) {
        r.content_sha256 = Sha256::hash_hex(*event.new_content);
        r.content_bytes = event.new_content->size();
    }
    r.working_directory = event.working_directory;
    r.outcome = outcome_name(verdict.outcome);
    r.blocked = verdict.blocked;
    r.overridden = verdict.overridden;
    r.override_code_sha256 = override_code_sha256;
    for (const auto& d : verdict.decisions) {
        if (d.severity == Severity::Info) {
            continue;
        }
        r.decisions.push_back(AuditDecision{d.guard_name, severity_name(d.severity), d.reason});
    }
    return r;
}

std::string audit_record_to_json(const AuditRecord& r)
{
    std::ostringstream oss;
    oss << "{\"schema_version\":" << r.schema_version << ",\"ts_unix_ms\":" << r.ts_unix_ms << ",\"pid\":" << r.pid
        << ",\"tool_name\":\"" << json_escape(r.tool_name) << "\"";
    write_optional_string(oss, "command", r.command);
    write_optional_string(oss, "command_sha256", r.command_sha256);
    oss << ",\"command_truncated\":" << (r.command_truncated ? "true" : "false");
    write_optional_string(oss, "file_path", r.file_path);
    write_optional_string(oss, "content_sha256", r.content_sha256);
    oss << ",\"content_bytes\":" << r.content_bytes;
    oss << ",\"working_directory\":\"" << json_escape(r.working_directory) << "\"";
    oss << ",\"outcome\":\"" << json_escape(r.outcome) << "\"";
    oss << ",\"blocked\":" << (r.blocked ? "true" : "false");
    oss << ",\"overridden\":" << (r.overridden ? "true" : "false");
    write_optional_string(oss, "override_code_sha256", r.override_code_sha256);
    oss << ",\"decisions\":[";
    for (size_t i = 0; i < r.decisions.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << "{\"guard\":\"" << json_escape(r.decisions[i].guard) << "\",\"severity\":\""
            << json_escape(r.decisions[i].severity) << "\",\"reason\":\"" << json_escape(r.decisions[i].reason)
            << "\"}";
    }
    oss << "]}";
    return oss.str();
}

bool parse_audit_record(const std::string& line, AuditRecord& out)
{
    auto doc = JsonValue::parse(line);
    if (!doc || !doc->is_object()) {
        return false;
    }
    int64_t schema = 0;
    if (!doc->get_int64("schema_version", schema) || schema <= 0) {
        return false;
    }
    AuditRecord r;
    r.schema_version = static_cast<uint32_t>(schema);
    if (!doc->get_int64("ts_unix_ms", r.ts_unix_ms) || !doc->get_string("outcome", r.outcome)) {
        return false;
    }
    int64_t pid = 0;
    if (doc->get_int64("pid", pid) && pid >= 0) {
        r.pid = static_cast<uint32_t>(pid);
    }
    doc->get_string("tool_name", r.tool_name);
    r.command = read_optional_string(*doc, "command");
    r.command_sha256 = read_optional_string(*doc, "command_sha256");
    doc->get_bool("command_truncated", r.command_truncated);
    r.file_path = read_optional_string(*doc, "file_path");
    r.content_sha256 = read_optional_string(*doc, "content_sha256");
    int64_t content_bytes = 0;
    if (doc->get_int64("content_bytes", content_bytes) && content_bytes >= 0) {
        r.content_bytes = static_cast<uint64_t>(content_bytes);
    }
    doc->get_string("working_directory", r.working_directory);
    doc->get_bool("blocked", r.blocked);
    doc->get_bool("overridden", r.overridden);
    r.override_code_sha256 = read_optional_string(*doc, "override_code_sha256");
    if (const JsonValue* decisions = doc->find("decisions"); decisions && decisions->is_array()) {
        for (const auto& item : decisions->items()) {
            AuditDecision d;
            item.get_string("guard", d.guard);
            item.get_string("severity", d.severity);
            item.get_string("reason", d.reason);
            r.decisions.push_back(std::move(d));
        }
    }
    out = std::move(r);
    return true;
}

AuditLog::AuditLog(AuditLogOptions options) : options_(std::move(options)) {}

Result<void> AuditLog::append_once(const std::string& line)
{
    auto lock = ScopedFileLock::acquire(lock_path_for(options_.path), options_.lock_timeout_ms);
    if (!lock) {
        return lock.error();
    }
    return g_audit_write_fn(options_.path, line);
}

Result<void> AuditLog::append(const AuditRecord& record)
{
    ScopedSpan span("audit.append", current_trace_id(), current_span_id());
    const std::string line = audit_record_to_json(record);

    auto first = append_once(line);
    if (first) {
        return {};
    }
    logger().log(SLOG_WARN("Audit append failed; retrying once")
                     .field("path", options_.path)
                     .field("error", first.error().to_string()));

    auto second = append_once(line);
    if (second) {
        return {};
    }
    span.fail(second.error().to_string());
    return Error(ErrorCode::AuditWriteFailed, "Audit append failed after retry", second.error().to_string());
}

Result<std::vector<std::string>> AuditLog::read_tail_lines() const
{
    std::vector<std::string> lines;
    int fd = ::open(options_.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return lines;
        }
        return Error::system(errno, "Failed to open audit log");
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to stat audit log");
    }
    const uint64_t size = static_cast<uint64_t>(st.st_size);
    const uint64_t start = size > kAuditReadCapBytes ? size - kAuditReadCapBytes : 0;
    std::string buf(static_cast<size_t>(size - start), '\0');
    size_t got = 0;
    while (got < buf.size()) {
        const ssize_t n = ::pread(fd, buf.data() + got, buf.size() - got, static_cast<off_t>(start + got));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to read audit log");
        }
        if (n == 0) {
            break;
        }
        got += static_cast<size_t>(n);
    }
    ::close(fd);
    buf.resize(got);

    size_t pos = 0;
    if (start > 0) {
        // The first line is probably partial.
        const size_t nl = buf.find('\n');
        pos = nl == std::string::npos ? buf.size() : nl + 1;
    }
    while (pos < buf.size()) {
        size_t nl = buf.find('\n', pos);
        if (nl == std::string::npos) {
            // Torn tail from an interrupted writer.
            lines.push_back(buf.substr(pos));
            break;
        }
        lines.push_back(buf.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

Result<std::vector<AuditRecord>> AuditLog::read_tail(size_t max_records) const
{
    auto lines = read_tail_lines();
    if (!lines) {
        return lines.error();
    }
    std::vector<AuditRecord> records;
    for (const auto& line : *lines) {
        AuditRecord r;
        if (parse_audit_record(line, r)) {
            records.push_back(std::move(r));
        }
    }
    if (records.size() > max_records) {
        records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(max_records));
    }
    return records;
}

Result<AuditSummary> AuditLog::summarize(int64_t window_seconds, int64_t now_ms) const
{
    auto lines = read_tail_lines();
    if (!lines) {
        return lines.error();
    }
    AuditSummary summary;
    summary.window_seconds = window_seconds;
    const int64_t cutoff = window_seconds > 0 ? now_ms - window_seconds * 1000 : INT64_MIN;
    for (const auto& line : *lines) {
        if (trim(line).empty()) {
            continue;
        }
        AuditRecord r;
        if (!parse_audit_record(line, r)) {
            ++summary.malformed_lines;
            continue;
        }
        if (r.ts_unix_ms < cutoff) {
            continue;
        }
        ++summary.total;
        if (r.blocked) {
            ++summary.blocked;
        } else if (r.overridden) {
            ++summary.overridden;
        } else {
            ++summary.allowed;
        }
        for (const auto& d : r.decisions) {
            if (d.severity == "block") {
                ++summary.blocks_by_guard[d.guard];
            } else if (d.severity == "warn") {
                ++summary.warnings_by_guard[d.guard];
            }
        }
    }
    return summary;
}

} // namespace hookguard
