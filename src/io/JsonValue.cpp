#include "adiabat/io/JsonValue.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace Adiabat {

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type != OBJECT) return nullptr;
    auto it = objectValue.find(key);
    return (it == objectValue.end()) ? nullptr : &it->second;
}

namespace Json {

namespace {

/// Recursive-descent reader over one document
class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    bool readDocument(JsonValue& value) {
        skipWhitespace();
        if (!readValue(value)) return false;
        skipWhitespace();
        if (pos_ != text_.size()) return fail("unexpected trailing characters");
        return true;
    }

    const std::string& error() const { return error_; }

private:
    const std::string& text_;
    size_t pos_ = 0;
    std::string error_;

    bool fail(const std::string& message) {
        if (error_.empty()) {
            error_ = message + " at offset " + std::to_string(pos_);
        }
        return false;
    }

    void skipWhitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool readLiteral(const char* literal) {
        size_t start = pos_;
        for (const char* p = literal; *p != '\0'; ++p) {
            if (!consume(*p)) {
                pos_ = start;
                return fail("invalid literal");
            }
        }
        return true;
    }

    bool readValue(JsonValue& value) {
        if (pos_ >= text_.size()) return fail("unexpected end of input");

        switch (text_[pos_]) {
            case '{':
                return readObject(value);
            case '[':
                return readArray(value);
            case '"':
                value.type = JsonValue::STRING;
                return readString(value.stringValue);
            case 't':
                value.type = JsonValue::BOOLEAN;
                value.boolValue = true;
                return readLiteral("true");
            case 'f':
                value.type = JsonValue::BOOLEAN;
                value.boolValue = false;
                return readLiteral("false");
            case 'n':
                value.type = JsonValue::NULL_TYPE;
                return readLiteral("null");
            default:
                return readNumber(value);
        }
    }

    bool readObject(JsonValue& value) {
        value.type = JsonValue::OBJECT;
        ++pos_;  // '{'
        skipWhitespace();
        if (consume('}')) return true;

        while (true) {
            skipWhitespace();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"') return fail("expected object key");
            if (!readString(key)) return false;

            skipWhitespace();
            if (!consume(':')) return fail("expected ':'");
            skipWhitespace();

            JsonValue member;
            if (!readValue(member)) return false;

            if (value.objectValue.find(key) == value.objectValue.end()) {
                value.objectKeys.push_back(key);
            }
            value.objectValue[key] = std::move(member);

            skipWhitespace();
            if (consume(',')) continue;
            if (consume('}')) return true;
            return fail("expected ',' or '}'");
        }
    }

    bool readArray(JsonValue& value) {
        value.type = JsonValue::ARRAY;
        ++pos_;  // '['
        skipWhitespace();
        if (consume(']')) return true;

        while (true) {
            skipWhitespace();
            JsonValue element;
            if (!readValue(element)) return false;
            value.arrayValue.push_back(std::move(element));

            skipWhitespace();
            if (consume(',')) continue;
            if (consume(']')) return true;
            return fail("expected ',' or ']'");
        }
    }

    static void appendUtf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    bool readHex4(unsigned long& code) {
        if (pos_ + 4 > text_.size()) return fail("truncated \\u escape");
        code = 0;
        for (int k = 0; k < 4; ++k) {
            char c = text_[pos_++];
            code <<= 4;
            if (c >= '0' && c <= '9') code |= static_cast<unsigned long>(c - '0');
            else if (c >= 'a' && c <= 'f') code |= static_cast<unsigned long>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') code |= static_cast<unsigned long>(c - 'A' + 10);
            else return fail("invalid \\u escape");
        }
        return true;
    }

    bool readString(std::string& out) {
        ++pos_;  // opening quote
        out.clear();
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) break;
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
                    unsigned long code = 0;
                    if (!readHex4(code)) return false;
                    // Surrogate pair
                    if (code >= 0xD800 && code < 0xDC00) {
                        unsigned long low = 0;
                        if (!consume('\\') || !consume('u') || !readHex4(low) ||
                            low < 0xDC00 || low >= 0xE000) {
                            return fail("invalid surrogate pair");
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    bool readNumber(JsonValue& value) {
        const size_t start = pos_;
        consume('-');
        if (pos_ >= text_.size()) return fail("invalid number");
        if (text_[pos_] == '0') {
            ++pos_;
        } else if (text_[pos_] >= '1' && text_[pos_] <= '9') {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        } else {
            return fail("unexpected character");
        }
        if (consume('.')) {
            if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                return fail("invalid number");
            }
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (!consume('+')) consume('-');
            if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                return fail("invalid number");
            }
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }

        const std::string token = text_.substr(start, pos_ - start);
        errno = 0;
        double number = std::strtod(token.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(number)) {
            pos_ = start;
            return fail("number out of range");
        }

        value.type = JsonValue::NUMBER;
        value.numberValue = number;
        return true;
    }
};

} // anonymous namespace

int parse(const std::string& text, JsonValue& value, std::string& cError) {
    Reader reader(text);
    JsonValue root;
    if (!reader.readDocument(root)) {
        cError = reader.error();
        return ErrorCode::kJSONParseError;
    }
    value = std::move(root);
    cError.clear();
    return ErrorCode::kSuccess;
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                    out += buffer;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

} // namespace Json
} // namespace Adiabat
