// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "utils.hpp"

namespace hookguard {

namespace {

std::string format_timestamp_utc()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

const char* basename_of(const char* path)
{
    if (!path) {
        return "";
    }
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            last = p + 1;
        }
    }
    return last;
}

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& out)
{
    const std::string v = to_lower(trim(value));
    if (v == "debug") {
        out = LogLevel::Debug;
    } else if (v == "info") {
        out = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        out = LogLevel::Warn;
    } else if (v == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

LogEntry::LogEntry(LogLevel level, std::string message, const char* file, int line)
    : level_(level), message_(std::move(message)), file_(file), line_(line)
{
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back(Field{key, value ? value : "", true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, uint64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int value)
{
    return field(key, static_cast<int64_t>(value));
}

LogEntry& LogEntry::field(const std::string& key, uint32_t value)
{
    return field(key, static_cast<uint64_t>(value));
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (static_cast<int>(entry.level()) < static_cast<int>(level_)) {
        return;
    }
    std::ostream& out = out_ ? *out_ : std::cerr;

    std::ostringstream line;
    if (json_) {
        line << "{\"ts\":\"" << format_timestamp_utc() << "\",\"level\":\"" << log_level_name(entry.level())
             << "\",\"message\":\"" << json_escape(entry.message()) << "\"";
        for (const auto& f : entry.fields()) {
            line << ",\"" << json_escape(f.key) << "\":";
            if (f.quoted) {
                line << "\"" << json_escape(f.value) << "\"";
            } else {
                line << f.value;
            }
        }
        line << "}";
    } else {
        line << format_timestamp_utc() << " " << log_level_name(entry.level()) << " hookguard: " << entry.message();
        for (const auto& f : entry.fields()) {
            line << " " << f.key << "=";
            if (f.quoted && f.value.find_first_of(" \t\"") != std::string::npos) {
                line << "\"" << json_escape(f.value) << "\"";
            } else {
                line << f.value;
            }
        }
        if (entry.level() == LogLevel::Debug) {
            line << " (" << basename_of(entry.file()) << ":" << entry.line() << ")";
        }
    }
    line << "\n";
    out << line.str();
    out.flush();
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

bool Logger::json_format() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return json_;
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

void configure_logger_from_env()
{
    const char* level_env = std::getenv("HOOKGUARD_LOG_LEVEL");
    if (level_env && *level_env) {
        LogLevel level = LogLevel::Warn;
        if (parse_log_level(level_env, level)) {
            logger().set_level(level);
        } else {
            logger().log(SLOG_WARN("Invalid log level; keeping default").field("value", level_env));
        }
    } else if (env_truthy("HOOKGUARD_OTEL_SPANS")) {
        // Span entries are info-level.
        logger().set_level(LogLevel::Info);
    }
    const char* format_env = std::getenv("HOOKGUARD_LOG_FORMAT");
    if (format_env && *format_env) {
        const std::string format = to_lower(trim(format_env));
        if (format == "json") {
            logger().set_json_format(true);
        } else if (format == "text") {
            logger().set_json_format(false);
        } else {
            logger().log(SLOG_WARN("Invalid log format; keeping default").field("value", format_env));
        }
    }
}

} // namespace hookguard
