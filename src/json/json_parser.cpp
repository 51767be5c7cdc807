//! # JSON Parser Implementation
//!
//! Single-pass recursive descent: strings are unescaped as they are scanned,
//! numbers without a fraction or exponent stay integers when they fit in
//! `int64_t`.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace exprc::json {

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (!at_end()) {
        return error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return error("Maximum nesting depth exceeded");
    }
    skip_whitespace();
    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        if (at_end()) {
            return error("Unexpected end of input");
        }
        return error("Unexpected NUL character");
    default:
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
            return parse_number();
        }
        return error("Unexpected character: " + std::string(1, peek()));
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'
    JsonObject obj;

    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            break;
        }
        if (c != ',') {
            return error("Expected ',' or '}' in object");
        }
        skip_whitespace();
        if (peek() == '}') {
            return error("Trailing comma in object");
        }
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['
    JsonArray arr;

    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            break;
        }
        if (c != ',') {
            return error("Expected ',' or ']' in array");
        }
        skip_whitespace();
        if (peek() == ']') {
            return error("Trailing comma in array");
        }
    }

    --depth_;
    return JsonValue(std::move(arr));
}

static void append_utf8(std::string& out, unsigned int cp) {
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
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    advance(); // opening quote

    std::string value;
    auto read_hex4 = [this](unsigned int& out) -> bool {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        auto hex = input_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, out, 16);
        if (ec != std::errc{} || ptr != hex.data() + 4) {
            return false;
        }
        pos_ += 4;
        column_ += 4;
        return true;
    };

    while (!at_end()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            unsigned int cp = 0;
            if (!read_hex4(cp)) {
                return error("Invalid unicode escape sequence");
            }
            // Surrogate pair
            if (cp >= 0xD800 && cp <= 0xDBFF && input_.substr(pos_, 2) == "\\u") {
                advance();
                advance();
                unsigned int low = 0;
                if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                    return error("Invalid unicode surrogate pair");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return error("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }

    return JsonError::make("Unterminated string", start_line, start_col);
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
    } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    } else {
        return error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit after decimal point");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit in exponent");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
        // Out of int64 range: keep it as a double
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }
    std::string_view word = input_.substr(start, pos_ - start);
    if (word == "true") {
        return JsonValue(true);
    }
    if (word == "false") {
        return JsonValue(false);
    }
    if (word == "null") {
        return JsonValue();
    }
    return error("Unknown keyword: " + std::string(word));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace exprc::json
