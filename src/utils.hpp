// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "result.hpp"

namespace hookguard {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool iequals(const std::string& a, const std::string& b);

std::vector<std::string> split(const std::string& s, char delim);

bool parse_uint64(const std::string& text, uint64_t& out);
bool parse_int64(const std::string& text, int64_t& out);

// Parse "key=value" (whitespace around either side is ignored).
bool parse_key_value(const std::string& line, std::string& key, std::string& value);

std::string json_escape(const std::string& in);

int64_t now_unix_ms();
std::string format_unix_seconds_utc(int64_t unix_seconds);

std::string env_or_default(const char* env_name, const std::string& fallback);
bool parse_u64_env(const char* key, uint64_t& out);
bool parse_u32_env(const char* key, uint32_t& out);
bool env_truthy(const char* key);

std::string home_directory();

Result<void> ensure_parent_directory(const std::string& path);

// Write to a temp file in the same directory, fsync, then rename over `path`.
Result<void> atomic_write_stream(const std::string& path, const std::function<bool(std::ostream&)>& writer);
Result<void> atomic_write_file(const std::string& path, const std::string& content);

Result<std::string> read_file_to_string(const std::string& path);

} // namespace hookguard
