/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <format>
#include <fstream>
#include <sstream>

namespace StrataEngine {

namespace {
constexpr int MAX_DEPTH = 128;

const JsonValue& nullValue() {
    static const JsonValue null_value;
    return null_value;
}

void writeEscaped(std::string& out, const std::string& text) {
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void newline(std::string& out, int indent, int depth) {
    if (indent <= 0) return;
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
}
} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
    if (isBool()) return asBool();
    return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
    if (isNumber()) return asNumber();
    return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
    if (isString()) return asString();
    return std::nullopt;
}

bool JsonValue::hasKey(const std::string& key) const {
    return isObject() && asObject().count(key) > 0;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!isObject()) return nullValue();
    const auto& obj = asObject();
    auto it = obj.find(key);
    return it != obj.end() ? it->second : nullValue();
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (!isObject()) {
        m_value = JsonObject{};
    }
    return asObject()[key];
}

size_t JsonValue::size() const {
    if (isArray()) return asArray().size();
    if (isObject()) return asObject().size();
    return 0;
}

std::string JsonValue::toString(int indent) const {
    std::string out;
    write(out, indent, 0);
    return out;
}

void JsonValue::write(std::string& out, int indent, int depth) const {
    switch (getType()) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Boolean:
            out += asBool() ? "true" : "false";
            break;
        case JsonType::Number: {
            double num = asNumber();
            if (std::floor(num) == num && std::abs(num) < 1e15) {
                out += std::format("{}", static_cast<long long>(num));
            } else {
                out += std::format("{}", num);
            }
            break;
        }
        case JsonType::String:
            writeEscaped(out, asString());
            break;
        case JsonType::Array: {
            const auto& arr = asArray();
            out += '[';
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ',';
                newline(out, indent, depth + 1);
                arr[i].write(out, indent, depth + 1);
            }
            if (!arr.empty()) newline(out, indent, depth);
            out += ']';
            break;
        }
        case JsonType::Object: {
            const auto& obj = asObject();
            out += '{';
            bool first = true;
            for (const auto& [key, value] : obj) {
                if (!first) out += ',';
                first = false;
                newline(out, indent, depth + 1);
                writeEscaped(out, key);
                out += indent > 0 ? ": " : ":";
                value.write(out, indent, depth + 1);
            }
            if (!obj.empty()) newline(out, indent, depth);
            out += '}';
            break;
        }
    }
}

bool JsonReader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_lastError = "Could not open file: " + path;
        m_root = JsonValue();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool JsonReader::parse(const std::string& jsonString) {
    m_input = jsonString;
    m_position = 0;
    m_line = 1;
    m_column = 1;
    m_lastError.clear();

    JsonValue root;
    skipWhitespace();
    if (m_position >= m_input.size()) {
        fail("Empty JSON input");
    } else if (parseValue(root, 0)) {
        skipWhitespace();
        if (m_position < m_input.size()) {
            fail("Unexpected data after JSON value");
        }
    }

    m_root = m_lastError.empty() ? std::move(root) : JsonValue();
    return m_lastError.empty();
}

char JsonReader::advance() {
    if (m_position >= m_input.size()) return '\0';
    char c = m_input[m_position++];
    if (c == '\n') {
        ++m_line;
        m_column = 1;
    } else {
        ++m_column;
    }
    return c;
}

void JsonReader::skipWhitespace() {
    while (m_position < m_input.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
        advance();
    }
}

bool JsonReader::expect(char c, const char* context) {
    skipWhitespace();
    if (peek() != c) {
        return fail(std::format("Expected '{}' {}", c, context));
    }
    advance();
    return true;
}

bool JsonReader::fail(const std::string& message) {
    if (m_lastError.empty()) {
        m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
    }
    return false;
}

bool JsonReader::parseValue(JsonValue& out, int depth) {
    if (depth > MAX_DEPTH) {
        return fail("Maximum nesting depth exceeded");
    }

    skipWhitespace();
    char c = peek();
    switch (c) {
        case '{': return parseObject(out, depth);
        case '[': return parseArray(out, depth);
        case '"': {
            std::string text;
            if (!parseString(text)) return false;
            out = JsonValue(std::move(text));
            return true;
        }
        case 't': return parseLiteral("true", JsonValue(true), out);
        case 'f': return parseLiteral("false", JsonValue(false), out);
        case 'n': return parseLiteral("null", JsonValue(), out);
        default:
            if (c == '-' || (c >= '0' && c <= '9')) {
                return parseNumber(out);
            }
            if (c == '\0') {
                return fail("Unexpected end of input");
            }
            return fail(std::format("Unexpected character: {}", c));
    }
}

bool JsonReader::parseObject(JsonValue& out, int depth) {
    advance(); // '{'
    JsonObject object;

    skipWhitespace();
    if (peek() == '}') {
        advance();
        out = JsonValue(std::move(object));
        return true;
    }

    while (true) {
        skipWhitespace();
        if (peek() != '"') {
            return fail("Expected string key in object");
        }
        std::string key;
        if (!parseString(key)) return false;
        if (!expect(':', "after object key")) return false;

        JsonValue value;
        if (!parseValue(value, depth + 1)) return false;
        object[key] = std::move(value);

        skipWhitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (!expect('}', "or ',' in object")) return false;
        break;
    }

    out = JsonValue(std::move(object));
    return true;
}

bool JsonReader::parseArray(JsonValue& out, int depth) {
    advance(); // '['
    JsonArray array;

    skipWhitespace();
    if (peek() == ']') {
        advance();
        out = JsonValue(std::move(array));
        return true;
    }

    while (true) {
        JsonValue value;
        if (!parseValue(value, depth + 1)) return false;
        array.push_back(std::move(value));

        skipWhitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (!expect(']', "or ',' in array")) return false;
        break;
    }

    out = JsonValue(std::move(array));
    return true;
}

bool JsonReader::parseString(std::string& out) {
    advance(); // opening quote
    out.clear();

    while (m_position < m_input.size()) {
        char c = advance();
        if (c == '"') {
            return true;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return fail("Unescaped control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
            case '"':
            case '\\':
            case '/': out += escaped; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u':
                if (!appendUnicodeEscape(out)) return false;
                break;
            case '\0': return fail("Unexpected end of input in string escape");
            default: return fail(std::format("Invalid escape sequence: \\{}", escaped));
        }
    }

    return fail("Unterminated string");
}

bool JsonReader::appendUnicodeEscape(std::string& out) {
    uint32_t codepoint = 0;
    for (int i = 0; i < 4; ++i) {
        char c = advance();
        uint32_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return fail("Invalid Unicode escape sequence");
        }
        codepoint = (codepoint << 4) | digit;
    }

    // UTF-8 encode; surrogate pairs are not combined
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    return true;
}

bool JsonReader::parseNumber(JsonValue& out) {
    const size_t start = m_position;
    auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

    if (peek() == '-') advance();

    if (peek() == '0') {
        advance();
    } else if (isDigit(peek())) {
        while (isDigit(peek())) advance();
    } else {
        return fail("Invalid number format");
    }

    if (peek() == '.') {
        advance();
        if (!isDigit(peek())) {
            return fail("Invalid number format: expected digit after decimal point");
        }
        while (isDigit(peek())) advance();
    }

    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-') advance();
        if (!isDigit(peek())) {
            return fail("Invalid number format: expected digit in exponent");
        }
        while (isDigit(peek())) advance();
    }

    const std::string text = m_input.substr(start, m_position - start);
    try {
        out = JsonValue(std::stod(text));
    } catch (const std::out_of_range&) {
        return fail("Number out of range: " + text);
    }
    return true;
}

bool JsonReader::parseLiteral(const char* word, JsonValue value, JsonValue& out) {
    const std::string literal(word);
    if (m_input.compare(m_position, literal.size(), literal) != 0) {
        return fail(std::format("Invalid token starting with '{}'", peek()));
    }
    for (size_t i = 0; i < literal.size(); ++i) {
        advance();
    }
    out = std::move(value);
    return true;
}

} // namespace StrataEngine
