// cppcheck-suppress-file missingIncludeSystem
#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <thread>

namespace hookguard {

namespace {

Result<void> create_parent(const std::string& path, const char* what)
{
    std::error_code ec;
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error(ErrorCode::IoError, std::string("Failed to create ") + what + " directory", ec.message());
        }
    }
    return {};
}

// True when the last byte of a non-empty file is not '\n'.
Result<bool> has_torn_tail(int fd)
{
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return Error::system(errno, "Failed to stat jsonl file");
    }
    if (st.st_size == 0) {
        return false;
    }
    char last = '\n';
    const ssize_t n = ::pread(fd, &last, 1, st.st_size - 1);
    if (n < 0) {
        return Error::system(errno, "Failed to read jsonl tail");
    }
    return n == 1 && last != '\n';
}

} // namespace

std::string lock_path_for(const std::string& path)
{
    return path + ".lock";
}

Result<ScopedFileLock> ScopedFileLock::acquire(const std::string& lock_path, uint32_t timeout_ms)
{
    TRY(create_parent(lock_path, "lock"));

    int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error::system(errno, "Failed to open lock file");
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return ScopedFileLock(fd);
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to lock " + lock_path);
        }
        if (timeout_ms == 0 || std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            return Error(ErrorCode::ResourceBusy, "Timed out acquiring lock", lock_path);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kLockRetrySleepMs));
    }
}

ScopedFileLock::~ScopedFileLock()
{
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

ScopedFileLock::ScopedFileLock(ScopedFileLock&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

ScopedFileLock& ScopedFileLock::operator=(ScopedFileLock&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

Result<void> append_jsonl_line(const std::string& path, const std::string& line)
{
    if (line.find('\n') != std::string::npos || line.find('\r') != std::string::npos) {
        return Error::invalid_argument("jsonl line contains newline characters");
    }
    TRY(create_parent(path, "jsonl"));

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error::system(errno, "Failed to open jsonl file for append");
    }

    auto torn = has_torn_tail(fd);
    if (!torn) {
        ::close(fd);
        return torn.error();
    }

    std::string payload;
    payload.reserve(line.size() + 2);
    if (*torn) {
        payload.push_back('\n');
    }
    payload += line;
    payload.push_back('\n');

    // One write call per record; O_APPEND makes it land at the current end.
    const ssize_t wrote = ::write(fd, payload.data(), payload.size());
    if (wrote < 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to append jsonl line");
    }
    if (static_cast<size_t>(wrote) != payload.size()) {
        ::close(fd);
        return Error(ErrorCode::IoError, "Short write appending jsonl line",
                     std::to_string(wrote) + "/" + std::to_string(payload.size()));
    }

    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to fsync jsonl file");
    }
    ::close(fd);
    return {};
}

} // namespace hookguard
