// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "types.hpp"

namespace hookguard {
namespace testing_support {

class ScopedEnvVar {
  public:
    ScopedEnvVar(const char* key, const std::string& value) : key_(key)
    {
        const char* existing = std::getenv(key_);
        if (existing) {
            had_previous_ = true;
            previous_ = existing;
        }
        ::setenv(key_, value.c_str(), 1);
    }

    ~ScopedEnvVar()
    {
        if (had_previous_) {
            ::setenv(key_, previous_.c_str(), 1);
        } else {
            ::unsetenv(key_);
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  private:
    const char* key_;
    bool had_previous_ = false;
    std::string previous_;
};

// Unique scratch directory removed on destruction.
class TempDir {
  public:
    explicit TempDir(const std::string& prefix)
    {
        static uint64_t counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }

  private:
    std::filesystem::path path_;
};

inline std::string read_all(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_all(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline Event shell_event(const std::string& command, const std::string& cwd)
{
    Event e;
    e.tool_name = "Bash";
    e.command = command;
    e.working_directory = cwd;
    return e;
}

inline Event write_event(const std::string& path, const std::string& content, const std::string& cwd)
{
    Event e;
    e.tool_name = "Write";
    e.file_path = path;
    e.new_content = content;
    e.working_directory = cwd;
    return e;
}

} // namespace testing_support
} // namespace hookguard
