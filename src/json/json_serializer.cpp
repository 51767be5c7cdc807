//! # JSON Serialization
//!
//! Compact and pretty printers for `JsonValue`. Objects are written in key
//! order (`std::map`), so lookup tables and reports are byte-stable across
//! runs.

#include "json/json_value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace exprc::json {

namespace {

void write_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
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
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

void write_number(const JsonNumber& num, std::string& out) {
    if (num.is_integer()) {
        out += std::to_string(num.i64);
        return;
    }
    if (!std::isfinite(num.f64)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), num.f64);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf, ptr);
}

void write_value(const JsonValue& value, std::string& out, int indent, int depth) {
    const bool pretty = indent > 0;
    auto newline = [&](int level) {
        if (pretty) {
            out += '\n';
            out.append(static_cast<size_t>(indent * level), ' ');
        }
    };

    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        write_number(value.as_number(), out);
    } else if (value.is_string()) {
        write_escaped(value.as_string(), out);
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            write_value(arr[i], out, indent, depth + 1);
        }
        if (!arr.empty()) {
            newline(depth);
        }
        out += ']';
    } else {
        const auto& obj = value.as_object();
        out += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            newline(depth + 1);
            write_escaped(key, out);
            out += pretty ? ": " : ":";
            write_value(member, out, indent, depth + 1);
        }
        if (!obj.empty()) {
            newline(depth);
        }
        out += '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    write_value(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    write_value(*this, out, indent, 0);
    return out;
}

} // namespace exprc::json
