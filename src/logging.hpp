// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hookguard {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& out);

class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message, const char* file, int line);

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, uint64_t value);
    LogEntry& field(const std::string& key, int value);
    LogEntry& field(const std::string& key, uint32_t value);
    LogEntry& field(const std::string& key, bool value);
    LogEntry& field(const std::string& key, double value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const char* file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }

    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };
    [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }

  private:
    LogLevel level_;
    std::string message_;
    const char* file_;
    int line_;
    std::vector<Field> fields_;
};

/**
 * Process-wide structured logger.
 *
 * Always writes to a diagnostic stream (stderr by default); stdout is reserved
 * for the administrative commands and must stay clean in hook mode.
 */
class Logger {
  public:
    void log(const LogEntry& entry);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void set_json_format(bool json);
    [[nodiscard]] bool json_format() const;

    void set_output(std::ostream* out);

  private:
    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Warn;
    bool json_ = false;
    std::ostream* out_ = nullptr;
};

Logger& logger();

// Apply HOOKGUARD_LOG_LEVEL / HOOKGUARD_LOG_FORMAT.
void configure_logger_from_env();

} // namespace hookguard

#define SLOG_DEBUG(msg) ::hookguard::LogEntry(::hookguard::LogLevel::Debug, (msg), __FILE__, __LINE__)
#define SLOG_INFO(msg) ::hookguard::LogEntry(::hookguard::LogLevel::Info, (msg), __FILE__, __LINE__)
#define SLOG_WARN(msg) ::hookguard::LogEntry(::hookguard::LogLevel::Warn, (msg), __FILE__, __LINE__)
#define SLOG_ERROR(msg) ::hookguard::LogEntry(::hookguard::LogLevel::Error, (msg), __FILE__, __LINE__)
