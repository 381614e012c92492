/// @file JsonValue.hpp
/// @brief Minimal JSON document model and parser
/// @details Covers the documents read and written by the command-line driver:
/// objects, arrays, strings, numbers, booleans and null. Object keys keep
/// their document order in objectKeys; lookup goes through objectValue.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Adiabat {

/// @brief One JSON value
struct JsonValue {
    enum Type { OBJECT, ARRAY, STRING, NUMBER, BOOLEAN, NULL_TYPE };
    Type type;
    std::string stringValue;
    double numberValue;
    bool boolValue;
    std::map<std::string, JsonValue> objectValue;
    std::vector<std::string> objectKeys;    ///< Keys in document order
    std::vector<JsonValue> arrayValue;

    JsonValue() : type(NULL_TYPE), numberValue(0.0), boolValue(false) {}

    bool isObject() const { return type == OBJECT; }
    bool isArray() const { return type == ARRAY; }
    bool isString() const { return type == STRING; }
    bool isNumber() const { return type == NUMBER; }

    /// @brief Member lookup (nullptr if absent or not an object)
    const JsonValue* find(const std::string& key) const;
};

namespace Json {

/// @brief Parse a complete JSON document
/// @param text Document text
/// @param value Output: root value
/// @param cError Output: description of the first syntax error
/// @return Error code (0 = success, kJSONParseError)
int parse(const std::string& text, JsonValue& value, std::string& cError);

/// @brief Quote and escape a string for output
std::string quote(const std::string& text);

} // namespace Json
} // namespace Adiabat
