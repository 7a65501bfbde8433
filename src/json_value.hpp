// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "result.hpp"

namespace hookguard {

/**
 * Minimal JSON document model for hook payloads and the jsonl stores.
 *
 * Parsing is strict (RFC 8259): trailing garbage, unterminated strings,
 * invalid escapes and excessive nesting are rejected with InvalidInput.
 */
class JsonValue {
  public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    JsonValue() = default;

    static Result<JsonValue> parse(const std::string& text);

    [[nodiscard]] Type type() const { return type_; }
    [[nodiscard]] bool is_null() const { return type_ == Type::Null; }
    [[nodiscard]] bool is_bool() const { return type_ == Type::Bool; }
    [[nodiscard]] bool is_number() const { return type_ == Type::Number; }
    [[nodiscard]] bool is_string() const { return type_ == Type::String; }
    [[nodiscard]] bool is_array() const { return type_ == Type::Array; }
    [[nodiscard]] bool is_object() const { return type_ == Type::Object; }

    [[nodiscard]] bool as_bool() const { return bool_; }
    [[nodiscard]] double as_number() const { return number_; }
    [[nodiscard]] int64_t as_int64() const { return static_cast<int64_t>(number_); }
    [[nodiscard]] const std::string& as_string() const { return string_; }
    [[nodiscard]] const std::vector<JsonValue>& items() const { return items_; }
    [[nodiscard]] const std::map<std::string, JsonValue>& members() const { return members_; }

    // Object member lookup; nullptr when absent or when this is not an object.
    [[nodiscard]] const JsonValue* find(const std::string& key) const;

    // Typed lookups returning false when absent or of another type.
    bool get_string(const std::string& key, std::string& out) const;
    bool get_int64(const std::string& key, int64_t& out) const;
    bool get_bool(const std::string& key, bool& out) const;

  private:
    friend class JsonParser;

    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    std::vector<JsonValue> items_;
    std::map<std::string, JsonValue> members_;
};

} // namespace hookguard
