/**
 * @file auth_json.hpp
 * @brief JSON value, reader and writer for directory files and cache bodies
 * @author Bennie Shearer
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - JsonValue, a variant over the six JSON kinds with exact 64-bit integers
 * - a strict reader reporting line and column on errors
 * - a compact or indented writer with sorted object keys
 */

#ifndef AUTHCORE_JSON_HPP
#define AUTHCORE_JSON_HPP

#include <charconv>
#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace authcore {
namespace json {

class JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

enum class JsonType { Null, Bool, Number, String, Array, Object };

/**
 * @brief One JSON value
 *
 * Integral numbers read from text or built from integer types are kept as
 * int64_t; everything else numeric is a double. Both report isNumber().
 */
class JsonValue {
public:
    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : value_(b) {}
    JsonValue(int i) : value_(static_cast<int64_t>(i)) {}
    JsonValue(long l) : value_(static_cast<int64_t>(l)) {}
    JsonValue(long long ll) : value_(static_cast<int64_t>(ll)) {}
    JsonValue(double d) : value_(d) {}
    JsonValue(const char* s) : value_(std::string(s)) {}
    JsonValue(std::string s) : value_(std::move(s)) {}
    JsonValue(JsonArray arr) : value_(std::move(arr)) {}
    JsonValue(JsonObject obj) : value_(std::move(obj)) {}

    [[nodiscard]] JsonType type() const noexcept;
    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::monostate>(value_); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool isNumber() const noexcept { return isInteger() || std::holds_alternative<double>(value_); }
    [[nodiscard]] bool isInteger() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(value_); }
    [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(value_); }

    // Throwing accessors; std::runtime_error names the expected kind
    [[nodiscard]] bool asBool() const { return expect<bool>("a boolean"); }
    [[nodiscard]] double asNumber() const;
    [[nodiscard]] int asInt() const { return static_cast<int>(asInt64()); }
    [[nodiscard]] int64_t asInt64() const;
    [[nodiscard]] const std::string& asString() const { return expect<std::string>("a string"); }
    [[nodiscard]] const JsonArray& asArray() const { return expect<JsonArray>("an array"); }
    [[nodiscard]] const JsonObject& asObject() const { return expect<JsonObject>("an object"); }
    [[nodiscard]] JsonArray& asArray() { return expectMutable<JsonArray>("an array"); }
    [[nodiscard]] JsonObject& asObject() { return expectMutable<JsonObject>("an object"); }

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] const JsonValue& operator[](std::size_t index) const { return asArray().at(index); }
    void push_back(JsonValue val) { asArray().push_back(std::move(val)); }

    [[nodiscard]] bool contains(const std::string& key) const noexcept { return find(key) != nullptr; }
    [[nodiscard]] const JsonValue& operator[](const std::string& key) const;
    [[nodiscard]] JsonValue& operator[](const std::string& key) { return asObject()[key]; }
    [[nodiscard]] std::optional<std::reference_wrapper<const JsonValue>> get(const std::string& key) const noexcept;

    /** @param indent negative for compact output */
    [[nodiscard]] std::string dump(int indent = -1) const;

    /** @brief Numbers compare by value, so 1 equals 1.0 */
    [[nodiscard]] bool operator==(const JsonValue& other) const;

private:
    template<typename T>
    const T& expect(const char* what) const {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw std::runtime_error(std::string("JSON value is not ") + what);
    }
    template<typename T>
    T& expectMutable(const char* what) {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw std::runtime_error(std::string("JSON value is not ") + what);
    }
    const JsonValue* find(const std::string& key) const noexcept;

    friend class JsonWriter;

    std::variant<std::monostate, bool, int64_t, double, std::string, JsonArray, JsonObject> value_;
};

// ============================================================================
// Errors
// ============================================================================

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& msg, std::size_t line, std::size_t column)
        : std::runtime_error(msg + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")")
        , line_(line), column_(column) {}

    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

private:
    std::size_t line_;
    std::size_t column_;
};

// ============================================================================
// Reader
// ============================================================================

/**
 * @brief Strict RFC 8259 reader
 *
 * Rejects trailing commas, unescaped control characters, lone surrogates,
 * leading zeros and anything after the top-level value.
 */
class JsonReader {
public:
    static constexpr int MAX_DEPTH = 256;

    explicit JsonReader(std::string_view text) : text_(text) {}

    /** @throws JsonParseError */
    JsonValue readDocument();

private:
    JsonValue readValue(int depth);
    JsonValue readNumber();
    JsonValue readArray(int depth);
    JsonValue readObject(int depth);
    std::string readString();
    uint32_t readHex4();
    void readLiteral(std::string_view word);

    void skipSpace();
    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }
    void advance(char expected, const char* context);
    [[noreturn]] void fail(const std::string& msg) const;

    std::string_view text_;
    std::size_t pos_ = 0;
};

[[nodiscard]] inline JsonValue parse(std::string_view text) {
    return JsonReader(text).readDocument();
}

/** @return std::nullopt instead of throwing on malformed input */
[[nodiscard]] inline std::optional<JsonValue> tryParse(std::string_view text) {
    try {
        return parse(text);
    } catch (const JsonParseError&) {
        return std::nullopt;
    }
}

// ============================================================================
// Writer
// ============================================================================

class JsonWriter {
public:
    explicit JsonWriter(int indent) : indent_(indent) {}

    void write(const JsonValue& value, int level);
    std::string take() { return std::move(out_); }

private:
    void writeString(std::string_view s);
    void writeDouble(double d);
    void newline(int level);

    int indent_;
    std::string out_;
};

// ============================================================================
// JsonValue implementation
// ============================================================================

inline JsonType JsonValue::type() const noexcept {
    switch (value_.index()) {
        case 0: return JsonType::Null;
        case 1: return JsonType::Bool;
        case 2:
        case 3: return JsonType::Number;
        case 4: return JsonType::String;
        case 5: return JsonType::Array;
        default: return JsonType::Object;
    }
}

inline double JsonValue::asNumber() const {
    if (auto* i = std::get_if<int64_t>(&value_)) return static_cast<double>(*i);
    return expect<double>("a number");
}

inline int64_t JsonValue::asInt64() const {
    if (auto* i = std::get_if<int64_t>(&value_)) return *i;
    return static_cast<int64_t>(std::llround(expect<double>("a number")));
}

inline std::size_t JsonValue::size() const noexcept {
    if (auto* arr = std::get_if<JsonArray>(&value_)) return arr->size();
    if (auto* obj = std::get_if<JsonObject>(&value_)) return obj->size();
    return 0;
}

inline const JsonValue* JsonValue::find(const std::string& key) const noexcept {
    auto* obj = std::get_if<JsonObject>(&value_);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    return it == obj->end() ? nullptr : &it->second;
}

inline const JsonValue& JsonValue::operator[](const std::string& key) const {
    asObject();
    if (const JsonValue* v = find(key)) return *v;
    throw std::runtime_error("JSON object has no key '" + key + "'");
}

inline std::optional<std::reference_wrapper<const JsonValue>>
JsonValue::get(const std::string& key) const noexcept {
    if (const JsonValue* v = find(key)) return std::cref(*v);
    return std::nullopt;
}

inline bool JsonValue::operator==(const JsonValue& other) const {
    if (isNumber() && other.isNumber()) {
        if (isInteger() && other.isInteger()) return std::get<int64_t>(value_) == std::get<int64_t>(other.value_);
        return asNumber() == other.asNumber();
    }
    return value_ == other.value_;
}

inline std::string JsonValue::dump(int indent) const {
    JsonWriter writer(indent);
    writer.write(*this, 0);
    return writer.take();
}

// ============================================================================
// JsonReader implementation
// ============================================================================

inline JsonValue JsonReader::readDocument() {
    skipSpace();
    JsonValue value = readValue(0);
    skipSpace();
    if (!atEnd()) fail("trailing characters after the document");
    return value;
}

inline JsonValue JsonReader::readValue(int depth) {
    if (depth > MAX_DEPTH) fail("nesting deeper than " + std::to_string(MAX_DEPTH));
    skipSpace();
    switch (peek()) {
        case '{': return readObject(depth + 1);
        case '[': return readArray(depth + 1);
        case '"': return JsonValue(readString());
        case 't': readLiteral("true"); return JsonValue(true);
        case 'f': readLiteral("false"); return JsonValue(false);
        case 'n': readLiteral("null"); return JsonValue();
        case '\0':
            if (atEnd()) fail("unexpected end of input");
            break;
        default:
            if (peek() == '-' || (peek() >= '0' && peek() <= '9')) return readNumber();
    }
    fail(std::string("unexpected character '") + peek() + "'");
}

inline void JsonReader::readLiteral(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) fail("expected '" + std::string(word) + "'");
    pos_ += word.size();
}

inline JsonValue JsonReader::readNumber() {
    const std::size_t start = pos_;
    auto digits = [this] {
        std::size_t first = pos_;
        while (!atEnd() && peek() >= '0' && peek() <= '9') ++pos_;
        return pos_ - first;
    };

    if (peek() == '-') ++pos_;
    if (peek() == '0') {
        ++pos_;
        if (peek() >= '0' && peek() <= '9') fail("leading zero in a number");
    } else if (digits() == 0) {
        fail("expected digits");
    }

    bool integral = true;
    if (peek() == '.') {
        ++pos_;
        integral = false;
        if (digits() == 0) fail("expected digits after the decimal point");
    }
    if (peek() == 'e' || peek() == 'E') {
        ++pos_;
        integral = false;
        if (peek() == '+' || peek() == '-') ++pos_;
        if (digits() == 0) fail("expected digits in the exponent");
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
        int64_t i = 0;
        auto [ptr, ec] = std::from_chars(first, last, i);
        if (ec == std::errc() && ptr == last) return JsonValue(static_cast<long long>(i));
        // out of int64 range: fall through to double
    }
    double d = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc() || ptr != last) fail("number out of range");
    return JsonValue(d);
}

inline uint32_t JsonReader::readHex4() {
    if (pos_ + 4 > text_.size()) fail("truncated \\u escape");
    uint32_t cp = 0;
    for (int i = 0; i < 4; ++i) {
        char h = text_[pos_++];
        cp <<= 4;
        if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
        else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
        else fail("bad hex digit in \\u escape");
    }
    return cp;
}

inline std::string JsonReader::readString() {
    advance('"', "string");
    std::string out;
    while (true) {
        if (atEnd()) fail("unterminated string");
        char c = text_[pos_++];
        if (c == '"') return out;
        if (static_cast<unsigned char>(c) < 0x20) fail("control character in a string");
        if (c != '\\') {
            out += c;
            continue;
        }
        if (atEnd()) fail("unterminated escape");
        char e = text_[pos_++];
        switch (e) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                uint32_t cp = readHex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (text_.substr(pos_, 2) != "\\u") fail("lone high surrogate");
                    pos_ += 2;
                    uint32_t low = readHex4();
                    if (low < 0xDC00 || low > 0xDFFF) fail("bad low surrogate");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("lone low surrogate");
                }
                if (cp < 0x80) {
                    out += static_cast<char>(cp);
                } else if (cp < 0x800) {
                    out += static_cast<char>(0xC0 | (cp >> 6));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                } else if (cp < 0x10000) {
                    out += static_cast<char>(0xE0 | (cp >> 12));
                    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                } else {
                    out += static_cast<char>(0xF0 | (cp >> 18));
                    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                }
                break;
            }
            default:
                fail(std::string("bad escape '\\") + e + "'");
        }
    }
}

inline JsonValue JsonReader::readArray(int depth) {
    advance('[', "array");
    JsonArray arr;
    skipSpace();
    if (peek() == ']') {
        ++pos_;
        return JsonValue(std::move(arr));
    }
    while (true) {
        arr.push_back(readValue(depth));
        skipSpace();
        if (peek() == ']') {
            ++pos_;
            return JsonValue(std::move(arr));
        }
        advance(',', "array");
    }
}

inline JsonValue JsonReader::readObject(int depth) {
    advance('{', "object");
    JsonObject obj;
    skipSpace();
    if (peek() == '}') {
        ++pos_;
        return JsonValue(std::move(obj));
    }
    while (true) {
        skipSpace();
        std::string key = readString();
        skipSpace();
        advance(':', "object");
        obj[std::move(key)] = readValue(depth);
        skipSpace();
        if (peek() == '}') {
            ++pos_;
            return JsonValue(std::move(obj));
        }
        advance(',', "object");
    }
}

inline void JsonReader::skipSpace() {
    while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) ++pos_;
}

inline void JsonReader::advance(char expected, const char* context) {
    if (peek() != expected || atEnd()) {
        fail(std::string("expected '") + expected + "' in " + context);
    }
    ++pos_;
}

inline void JsonReader::fail(const std::string& msg) const {
    std::size_t line = 1;
    std::size_t column = 1;
    for (std::size_t i = 0; i < pos_ && i < text_.size(); ++i) {
        if (text_[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    throw JsonParseError(msg, line, column);
}

// ============================================================================
// JsonWriter implementation
// ============================================================================

inline void JsonWriter::newline(int level) {
    if (indent_ < 0) return;
    out_ += '\n';
    out_.append(static_cast<std::size_t>(level * indent_), ' ');
}

inline void JsonWriter::writeString(std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out_ += '"';
    for (char c : s) {
        switch (c) {
            case '"': out_ += "\\\""; break;
            case '\\': out_ += "\\\\"; break;
            case '\n': out_ += "\\n"; break;
            case '\r': out_ += "\\r"; break;
            case '\t': out_ += "\\t"; break;
            case '\b': out_ += "\\b"; break;
            case '\f': out_ += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out_ += "\\u00";
                    out_ += HEX[(c >> 4) & 0xF];
                    out_ += HEX[c & 0xF];
                } else {
                    out_ += c;
                }
        }
    }
    out_ += '"';
}

inline void JsonWriter::writeDouble(double d) {
    if (!std::isfinite(d)) {
        out_ += "null";
        return;
    }
    char buf[32];
    // shortest representation that reads back to the same double
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text(buf, static_cast<std::size_t>(ptr - buf));
    out_ += text;
    if (text.find_first_of(".eEn") == std::string_view::npos) out_ += ".0";
}

inline void JsonWriter::write(const JsonValue& value, int level) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out_ += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out_ += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out_ += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(v);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
            out_ += '[';
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i) out_ += ',';
                newline(level + 1);
                write(v[i], level + 1);
            }
            if (!v.empty()) newline(level);
            out_ += ']';
        } else {
            out_ += '{';
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) out_ += ',';
                first = false;
                newline(level + 1);
                writeString(key);
                out_ += indent_ < 0 ? ":" : ": ";
                write(item, level + 1);
            }
            if (!v.empty()) newline(level);
            out_ += '}';
        }
    }, value.value_);
}

} // namespace json
} // namespace authcore

#endif // AUTHCORE_JSON_HPP
