// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "file_lock.hpp"
#include "result.hpp"
#include "types.hpp"

namespace hookguard {

struct IssuedOverride {
    // Plaintext code; shown to the operator once and never persisted.
    std::string code;
    OverrideCode record;
};

// Trim, uppercase and map Crockford look-alikes (O->0, I/L->1).
std::string normalize_override_code(const std::string& code);
// "HG-XXXX-XXXX" over the Crockford base32 alphabet, after normalization.
bool is_well_formed_override_code(const std::string& code);
Result<std::string> generate_override_code();

/**
 * Single-use override codes stored as JSONL (one OverrideCode per line, code
 * kept only as SHA-256). Every read-modify-write runs under an exclusive
 * lock on "<path>.lock" and replaces the file atomically.
 */
class OverrideStore {
  public:
    explicit OverrideStore(std::string path, uint32_t lock_timeout_ms = kDefaultLockTimeoutMs);

    Result<IssuedOverride> issue(int64_t ttl_seconds, const std::string& reason);

    // True exactly once for an existing, unexpired, unconsumed code; marks it
    // consumed in the same critical section. Every failure returns false.
    bool validate_and_consume(const std::string& code) noexcept;

    Result<std::vector<OverrideCode>> list() const;

    // Remove expired and consumed entries; returns how many were removed.
    Result<size_t> prune();

    [[nodiscard]] const std::string& path() const { return path_; }

  private:
    Result<std::vector<OverrideCode>> load_unlocked() const;
    Result<void> save_unlocked(const std::vector<OverrideCode>& entries) const;
    bool consume_locked(const std::string& code_sha256, int64_t now);

    std::string path_;
    uint32_t lock_timeout_ms_;
};

using OverrideClockFn = int64_t (*)();
void set_override_clock_for_test(OverrideClockFn fn);
void reset_override_clock_for_test();

} // namespace hookguard
