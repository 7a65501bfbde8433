// cppcheck-suppress-file missingIncludeSystem
#include "override_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <exception>
#include <sstream>

#include "json_value.hpp"
#include "logging.hpp"
#include "sha256.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace hookguard {

namespace {

constexpr const char* kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr const char* kCodePrefix = "HG-";

int64_t system_now_unix()
{
    return now_unix_ms() / 1000;
}

OverrideClockFn g_clock = system_now_unix;

bool is_crockford_char(char c)
{
    for (const char* p = kCrockfordAlphabet; *p; ++p) {
        if (*p == c) {
            return true;
        }
    }
    return false;
}

std::string serialize_entry(const OverrideCode& e)
{
    std::ostringstream oss;
    oss << "{\"code_sha256\":\"" << json_escape(e.code_sha256) << "\",\"issued_at\":" << e.issued_at
        << ",\"expires_at\":" << e.expires_at << ",\"consumed\":" << (e.consumed ? "true" : "false")
        << ",\"consumed_at\":" << e.consumed_at << ",\"reason\":\"" << json_escape(e.reason) << "\"}";
    return oss.str();
}

bool parse_entry(const std::string& line, OverrideCode& out)
{
    auto doc = JsonValue::parse(line);
    if (!doc || !doc->is_object()) {
        return false;
    }
    if (!doc->get_string("code_sha256", out.code_sha256) || out.code_sha256.size() != 64) {
        return false;
    }
    if (!doc->get_int64("issued_at", out.issued_at) || !doc->get_int64("expires_at", out.expires_at)) {
        return false;
    }
    doc->get_bool("consumed", out.consumed);
    doc->get_int64("consumed_at", out.consumed_at);
    doc->get_string("reason", out.reason);
    return true;
}

} // namespace

void set_override_clock_for_test(OverrideClockFn fn)
{
    g_clock = fn ? fn : system_now_unix;
}

void reset_override_clock_for_test()
{
    g_clock = system_now_unix;
}

std::string normalize_override_code(const std::string& code)
{
    std::string out;
    for (char c : trim(code)) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (u == 'O') {
            u = '0';
        } else if (u == 'I' || u == 'L') {
            u = '1';
        }
        out.push_back(u);
    }
    return out;
}

bool is_well_formed_override_code(const std::string& code)
{
    const std::string c = normalize_override_code(code);
    // HG-XXXX-XXXX
    if (c.size() != 12 || c.compare(0, 3, kCodePrefix) != 0 || c[7] != '-') {
        return false;
    }
    for (size_t i = 3; i < c.size(); ++i) {
        if (i == 7) {
            continue;
        }
        if (!is_crockford_char(c[i])) {
            return false;
        }
    }
    return true;
}

Result<std::string> generate_override_code()
{
    int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Error::system(errno, "Failed to open /dev/urandom");
    }
    unsigned char bytes[8];
    size_t got = 0;
    while (got < sizeof(bytes)) {
        const ssize_t n = ::read(fd, bytes + got, sizeof(bytes) - got);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to read /dev/urandom");
        }
        if (n == 0) {
            ::close(fd);
            return Error(ErrorCode::IoError, "Short read from /dev/urandom");
        }
        got += static_cast<size_t>(n);
    }
    ::close(fd);

    std::string code = kCodePrefix;
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        if (i == 4) {
            code.push_back('-');
        }
        code.push_back(kCrockfordAlphabet[bytes[i] & 0x1f]);
    }
    return code;
}

OverrideStore::OverrideStore(std::string path, uint32_t lock_timeout_ms)
    : path_(std::move(path)), lock_timeout_ms_(lock_timeout_ms)
{
}

Result<std::vector<OverrideCode>> OverrideStore::load_unlocked() const
{
    std::vector<OverrideCode> entries;
    auto content = read_file_to_string(path_);
    if (!content) {
        if (content.error().code() == ErrorCode::ResourceNotFound) {
            return entries;
        }
        return content.error();
    }
    std::istringstream in(*content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }
        OverrideCode entry;
        if (!parse_entry(line, entry)) {
            logger().log(SLOG_WARN("Skipping malformed override store entry")
                             .field("path", path_)
                             .field("line", static_cast<uint64_t>(line_no)));
            continue;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

Result<void> OverrideStore::save_unlocked(const std::vector<OverrideCode>& entries) const
{
    TRY(ensure_parent_directory(path_));
    return atomic_write_stream(path_, [&](std::ostream& out) -> bool {
        for (const auto& e : entries) {
            out << serialize_entry(e) << "\n";
        }
        return out.good();
    });
}

Result<IssuedOverride> OverrideStore::issue(int64_t ttl_seconds, const std::string& reason)
{
    if (ttl_seconds <= 0 || ttl_seconds > kOverrideMaxTtlSeconds) {
        return Error::invalid_argument("ttl must be between 1 and " + std::to_string(kOverrideMaxTtlSeconds) +
                                       " seconds");
    }
    auto code = generate_override_code();
    if (!code) {
        return code.error();
    }

    auto lock = ScopedFileLock::acquire(lock_path_for(path_), lock_timeout_ms_);
    if (!lock) {
        return lock.error();
    }
    auto loaded = load_unlocked();
    if (!loaded) {
        return loaded.error();
    }

    const int64_t now = g_clock();
    std::vector<OverrideCode> kept;
    for (auto& e : *loaded) {
        if (!e.consumed && !e.expired(now)) {
            kept.push_back(std::move(e));
        }
    }

    IssuedOverride issued;
    issued.code = *code;
    issued.record.code_sha256 = Sha256::hash_hex(*code);
    issued.record.issued_at = now;
    issued.record.expires_at = now + ttl_seconds;
    issued.record.reason = reason;
    kept.push_back(issued.record);

    TRY(save_unlocked(kept));
    logger().log(SLOG_INFO("Override code issued")
                     .field("expires_at", issued.record.expires_at)
                     .field("reason", reason));
    return issued;
}

bool OverrideStore::consume_locked(const std::string& code_sha256, int64_t now)
{
    auto loaded = load_unlocked();
    if (!loaded) {
        logger().log(SLOG_WARN("Override store unreadable; treating override as absent")
                         .field("path", path_)
                         .field("error", loaded.error().to_string()));
        return false;
    }
    auto& entries = *loaded;
    for (auto& e : entries) {
        if (e.code_sha256 != code_sha256) {
            continue;
        }
        if (e.consumed) {
            logger().log(SLOG_WARN("Override code already consumed").field("consumed_at", e.consumed_at));
            return false;
        }
        if (e.expired(now)) {
            logger().log(SLOG_WARN("Override code expired").field("expires_at", e.expires_at));
            return false;
        }
        e.consumed = true;
        e.consumed_at = now;
        auto saved = save_unlocked(entries);
        if (!saved) {
            logger().log(SLOG_WARN("Failed to persist override consumption; override rejected")
                             .field("path", path_)
                             .field("error", saved.error().to_string()));
            return false;
        }
        return true;
    }
    logger().log(SLOG_WARN("Unknown override code"));
    return false;
}

bool OverrideStore::validate_and_consume(const std::string& code) noexcept
{
    try {
        ScopedSpan span("override.consume", current_trace_id(), current_span_id());
        if (trim(code).empty()) {
            return false;
        }
        if (!is_well_formed_override_code(code)) {
            logger().log(SLOG_WARN("Malformed override code"));
            span.fail("malformed");
            return false;
        }
        auto lock = ScopedFileLock::acquire(lock_path_for(path_), lock_timeout_ms_);
        if (!lock) {
            logger().log(SLOG_WARN("Override store lock unavailable; treating override as absent")
                             .field("error", lock.error().to_string()));
            span.fail(lock.error().to_string());
            return false;
        }
        const bool ok = consume_locked(Sha256::hash_hex(normalize_override_code(code)), g_clock());
        if (!ok) {
            span.fail("rejected");
        }
        return ok;
    } catch (const std::exception& e) {
        logger().log(SLOG_WARN("Override validation failed").field("error", e.what()));
        return false;
    }
}

Result<std::vector<OverrideCode>> OverrideStore::list() const
{
    auto lock = ScopedFileLock::acquire(lock_path_for(path_), lock_timeout_ms_);
    if (!lock) {
        return lock.error();
    }
    return load_unlocked();
}

Result<size_t> OverrideStore::prune()
{
    auto lock = ScopedFileLock::acquire(lock_path_for(path_), lock_timeout_ms_);
    if (!lock) {
        return lock.error();
    }
    auto loaded = load_unlocked();
    if (!loaded) {
        return loaded.error();
    }
    const int64_t now = g_clock();
    std::vector<OverrideCode> kept;
    for (auto& e : *loaded) {
        if (!e.consumed && !e.expired(now)) {
            kept.push_back(std::move(e));
        }
    }
    const size_t removed = loaded->size() - kept.size();
    if (removed > 0) {
        TRY(save_unlocked(kept));
    }
    return removed;
}

} // namespace hookguard
