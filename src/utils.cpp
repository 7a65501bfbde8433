// cppcheck-suppress-file missingIncludeSystem
#include "utils.hpp"

#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "logging.hpp"

namespace hookguard {

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool parse_uint64(const std::string& text, uint64_t& out)
{
    const std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    uint64_t v = 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - digit) / 10) {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

bool parse_int64(const std::string& text, int64_t& out)
{
    std::string t = trim(text);
    bool neg = false;
    if (!t.empty() && t[0] == '-') {
        neg = true;
        t = t.substr(1);
    }
    uint64_t v = 0;
    if (!parse_uint64(t, v)) {
        return false;
    }
    if (v > static_cast<uint64_t>(INT64_MAX)) {
        return false;
    }
    out = neg ? -static_cast<int64_t>(v) : static_cast<int64_t>(v);
    return true;
}

bool parse_key_value(const std::string& line, std::string& key, std::string& value)
{
    const size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return !key.empty();
}

std::string json_escape(const std::string& in)
{
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

int64_t now_unix_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_unix_seconds_utc(int64_t unix_seconds)
{
    const std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string env_or_default(const char* env_name, const std::string& fallback)
{
    const char* env = std::getenv(env_name);
    if (env && *env) {
        return std::string(env);
    }
    return fallback;
}

bool parse_u64_env(const char* key, uint64_t& out)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    uint64_t v = 0;
    if (!parse_uint64(env, v)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", key).field("value", env));
        return false;
    }
    out = v;
    return true;
}

bool parse_u32_env(const char* key, uint32_t& out)
{
    uint64_t v = 0;
    if (!parse_u64_env(key, v)) {
        return false;
    }
    if (v > UINT32_MAX) {
        logger().log(SLOG_WARN("Env value out of range; using default").field("key", key).field("value", v));
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool env_truthy(const char* key)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    const std::string v = to_lower(trim(env));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string home_directory()
{
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home);
    }
    const struct passwd* pw = ::getpwuid(::getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return "/";
}

Result<void> ensure_parent_directory(const std::string& path)
{
    std::error_code ec;
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return {};
    }
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Error(ErrorCode::IoError, "Failed to create directory", parent.string() + ": " + ec.message());
    }
    return {};
}

Result<void> atomic_write_stream(const std::string& path, const std::function<bool(std::ostream&)>& writer)
{
    TRY(ensure_parent_directory(path));

    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Error::system(errno, "Failed to open temp file " + tmp);
        }
        if (!writer(out)) {
            out.close();
            std::remove(tmp.c_str());
            return Error(ErrorCode::IoError, "Failed to write temp file", tmp);
        }
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(tmp.c_str());
            return Error(ErrorCode::IoError, "Failed to flush temp file", tmp);
        }
    }

    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        const int saved = errno;
        std::remove(tmp.c_str());
        return Error::system(saved, "Failed to rename temp file over " + path);
    }
    return {};
}

Result<void> atomic_write_file(const std::string& path, const std::string& content)
{
    return atomic_write_stream(path, [&](std::ostream& out) -> bool {
        out << content;
        return out.good();
    });
}

Result<std::string> read_file_to_string(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error::not_found(path);
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return Error::system(errno, "Failed to open " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::IoError, "Failed to read", path);
    }
    return buf.str();
}

} // namespace hookguard
