// cppcheck-suppress-file missingIncludeSystem
#include "json_value.hpp"

#include <cerrno>
#include <cstdlib>

namespace hookguard {

namespace {

constexpr int kMaxDepth = 64;

void append_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

class JsonParser {
  public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    Result<JsonValue> parse_document()
    {
        JsonValue root;
        TRY(parse_value(root, 0));
        skip_ws();
        if (pos_ != text_.size()) {
            return fail("trailing characters after JSON value");
        }
        return root;
    }

  private:
    Error fail(const std::string& what) const
    {
        return Error::invalid_input("Malformed JSON", what + " at offset " + std::to_string(pos_));
    }

    void skip_ws()
    {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    bool consume_literal(const char* lit)
    {
        size_t i = 0;
        while (lit[i] != '\0') {
            if (pos_ + i >= text_.size() || text_[pos_ + i] != lit[i]) {
                return false;
            }
            ++i;
        }
        pos_ += i;
        return true;
    }

    Result<void> parse_value(JsonValue& out, int depth)
    {
        if (depth > kMaxDepth) {
            return fail("nesting too deep");
        }
        skip_ws();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }
        const char c = text_[pos_];
        if (c == '{') {
            return parse_object(out, depth);
        }
        if (c == '[') {
            return parse_array(out, depth);
        }
        if (c == '"') {
            out.type_ = JsonValue::Type::String;
            return parse_string(out.string_);
        }
        if (c == 't') {
            if (!consume_literal("true")) {
                return fail("invalid literal");
            }
            out.type_ = JsonValue::Type::Bool;
            out.bool_ = true;
            return {};
        }
        if (c == 'f') {
            if (!consume_literal("false")) {
                return fail("invalid literal");
            }
            out.type_ = JsonValue::Type::Bool;
            out.bool_ = false;
            return {};
        }
        if (c == 'n') {
            if (!consume_literal("null")) {
                return fail("invalid literal");
            }
            out.type_ = JsonValue::Type::Null;
            return {};
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return parse_number(out);
        }
        return fail("unexpected character");
    }

    Result<void> parse_object(JsonValue& out, int depth)
    {
        out.type_ = JsonValue::Type::Object;
        ++pos_; // '{'
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return {};
        }
        while (true) {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected object key");
            }
            std::string key;
            TRY(parse_string(key));
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("expected ':'");
            }
            ++pos_;
            JsonValue member;
            TRY(parse_value(member, depth + 1));
            // Last duplicate wins.
            out.members_[key] = std::move(member);
            skip_ws();
            if (pos_ >= text_.size()) {
                return fail("unterminated object");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                return {};
            }
            return fail("expected ',' or '}'");
        }
    }

    Result<void> parse_array(JsonValue& out, int depth)
    {
        out.type_ = JsonValue::Type::Array;
        ++pos_; // '['
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return {};
        }
        while (true) {
            JsonValue item;
            TRY(parse_value(item, depth + 1));
            out.items_.push_back(std::move(item));
            skip_ws();
            if (pos_ >= text_.size()) {
                return fail("unterminated array");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                return {};
            }
            return fail("expected ',' or ']'");
        }
    }

    bool parse_hex4(uint32_t& out)
    {
        if (pos_ + 4 > text_.size()) {
            return false;
        }
        uint32_t v = 0;
        for (size_t i = 0; i < 4; ++i) {
            const char c = text_[pos_ + i];
            v <<= 4;
            if (c >= '0' && c <= '9') {
                v |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                v |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                v |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return false;
            }
        }
        pos_ += 4;
        out = v;
        return true;
    }

    Result<void> parse_string(std::string& out)
    {
        ++pos_; // opening quote
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return {};
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':
                    out.push_back('"');
                    break;
                case '\\':
                    out.push_back('\\');
                    break;
                case '/':
                    out.push_back('/');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(cp)) {
                        return fail("invalid \\u escape");
                    }
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (pos_ + 2 <= text_.size() && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                                return fail("invalid surrogate pair");
                            }
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            return fail("unpaired surrogate");
                        }
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        return fail("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    Result<void> parse_number(JsonValue& out)
    {
        const size_t start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        if (pos_ >= text_.size()) {
            return fail("invalid number");
        }
        if (text_[pos_] == '0') {
            ++pos_;
        } else if (text_[pos_] >= '1' && text_[pos_] <= '9') {
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
                ++pos_;
            }
        } else {
            return fail("invalid number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            const size_t frac = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
                ++pos_;
            }
            if (pos_ == frac) {
                return fail("invalid number fraction");
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            const size_t exp = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
                ++pos_;
            }
            if (pos_ == exp) {
                return fail("invalid number exponent");
            }
        }
        const std::string token = text_.substr(start, pos_ - start);
        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(token.c_str(), &end);
        if (errno == ERANGE || end == nullptr || *end != '\0') {
            return fail("number out of range");
        }
        out.type_ = JsonValue::Type::Number;
        out.number_ = v;
        return {};
    }

    const std::string& text_;
    size_t pos_ = 0;
};

Result<JsonValue> JsonValue::parse(const std::string& text)
{
    JsonParser parser(text);
    return parser.parse_document();
}

const JsonValue* JsonValue::find(const std::string& key) const
{
    if (type_ != Type::Object) {
        return nullptr;
    }
    auto it = members_.find(key);
    if (it == members_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool JsonValue::get_string(const std::string& key, std::string& out) const
{
    const JsonValue* v = find(key);
    if (!v || !v->is_string()) {
        return false;
    }
    out = v->as_string();
    return true;
}

bool JsonValue::get_int64(const std::string& key, int64_t& out) const
{
    const JsonValue* v = find(key);
    if (!v || !v->is_number()) {
        return false;
    }
    out = v->as_int64();
    return true;
}

bool JsonValue::get_bool(const std::string& key, bool& out) const
{
    const JsonValue* v = find(key);
    if (!v || !v->is_bool()) {
        return false;
    }
    out = v->as_bool();
    return true;
}

} // namespace hookguard
