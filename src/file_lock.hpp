// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "result.hpp"

namespace hookguard {

inline constexpr uint32_t kDefaultLockTimeoutMs = 2000;
inline constexpr uint32_t kLockRetrySleepMs = 10;

// Lock file guarding `path`: "<path>.lock".
std::string lock_path_for(const std::string& path);

/**
 * Exclusive flock(2) on a dedicated lock file, held for the object's
 * lifetime. Acquisition retries until `timeout_ms` elapses and then fails
 * with ResourceBusy; it never blocks indefinitely.
 */
class ScopedFileLock {
  public:
    static Result<ScopedFileLock> acquire(const std::string& lock_path, uint32_t timeout_ms);

    ScopedFileLock() = default;
    ~ScopedFileLock();

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

    ScopedFileLock(ScopedFileLock&& other) noexcept;
    ScopedFileLock& operator=(ScopedFileLock&& other) noexcept;

    [[nodiscard]] bool ok() const { return fd_ >= 0; }

  private:
    explicit ScopedFileLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

// Append a single jsonl line with one O_APPEND write, then fsync. If the file
// does not end in '\n' (torn tail from a killed writer) a newline is written
// first. Caller provides locking.
Result<void> append_jsonl_line(const std::string& path, const std::string& line);

} // namespace hookguard
