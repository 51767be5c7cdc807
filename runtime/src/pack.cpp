// Binary packing for the template letters tag conversions use:
//
//   A  space-padded text        a  NUL-padded text
//   C  unsigned byte            c  signed byte
//   n  uint16 big-endian        N  uint32 big-endian
//   v  uint16 little-endian     V  uint32 little-endian
//   H  hex string, high nybble  h  hex string, low nybble first
//   x  NUL byte / skip a byte
//
// Each letter takes an optional repeat count or `*`.

#include "exprc_rt/runtime.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string_view>
#include <vector>

namespace exprc::rt {

namespace {

struct TemplateItem {
    char code = 0;
    size_t count = 1;
    bool star = false;
    bool explicit_count = false;
};

constexpr std::string_view TEMPLATE_CODES = "AaCcnNvVHhx";

auto parse_template(const std::string& fmt, std::string& bad_code)
    -> std::optional<std::vector<TemplateItem>> {
    std::vector<TemplateItem> items;
    size_t i = 0;
    while (i < fmt.size()) {
        char c = fmt[i++];
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (TEMPLATE_CODES.find(c) == std::string_view::npos) {
            bad_code = std::string(1, c);
            return std::nullopt;
        }
        TemplateItem item;
        item.code = c;
        if (i < fmt.size() && fmt[i] == '*') {
            item.star = true;
            ++i;
        } else if (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
            item.count = 0;
            item.explicit_count = true;
            while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
                item.count = item.count * 10 + static_cast<size_t>(fmt[i++] - '0');
            }
        }
        items.push_back(item);
    }
    return items;
}

auto integer_width(char code) -> size_t {
    switch (code) {
    case 'n':
    case 'v':
        return 2;
    case 'N':
    case 'V':
        return 4;
    default:
        return 1;
    }
}

auto is_big_endian(char code) -> bool {
    return code == 'n' || code == 'N';
}

auto read_integer(std::string_view bytes, char code) -> Value {
    size_t width = integer_width(code);
    uint64_t v = 0;
    for (size_t k = 0; k < width; ++k) {
        size_t idx = is_big_endian(code) ? k : width - 1 - k;
        v = (v << 8) | static_cast<unsigned char>(bytes[idx]);
    }
    if (code == 'c') {
        return Value::integer(static_cast<int8_t>(v));
    }
    return Value::integer(static_cast<int64_t>(v));
}

void write_integer(std::string& out, uint64_t v, char code) {
    size_t width = integer_width(code);
    for (size_t k = 0; k < width; ++k) {
        size_t shift = is_big_endian(code) ? (width - 1 - k) * 8 : k * 8;
        out += static_cast<char>((v >> shift) & 0xFF);
    }
}

auto hex_digit(int v) -> char {
    return "0123456789abcdef"[v & 0xF];
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return 0;
}

} // namespace

auto unpack(const Value& format, const Value& data) -> Value {
    if (format.is_invalid()) {
        return format;
    }
    if (data.is_invalid()) {
        return data;
    }
    std::string bad_code;
    auto items = parse_template(format.as_string(), bad_code);
    if (!items) {
        return Value::invalid("unsupported unpack template letter '" + bad_code + "'");
    }

    std::string bytes = data.as_string();
    std::vector<Value> out;
    size_t pos = 0;

    for (const auto& item : *items) {
        size_t remaining = bytes.size() - pos;
        switch (item.code) {
        case 'A':
        case 'a': {
            size_t n = item.star ? remaining : std::min(item.count, remaining);
            std::string field = bytes.substr(pos, n);
            pos += n;
            if (item.code == 'A') {
                while (!field.empty() &&
                       (field.back() == ' ' || field.back() == '\0' || field.back() == '\n' ||
                        field.back() == '\t' || field.back() == '\r')) {
                    field.pop_back();
                }
            }
            out.push_back(Value::text(std::move(field)));
            break;
        }
        case 'H':
        case 'h': {
            size_t nybbles = item.star ? remaining * 2
                             : item.explicit_count ? std::min(item.count, remaining * 2)
                                                   : std::min<size_t>(1, remaining * 2);
            std::string hex;
            for (size_t k = 0; k < nybbles; ++k) {
                auto byte = static_cast<unsigned char>(bytes[pos + k / 2]);
                bool high_first = item.code == 'H';
                bool high = (k % 2 == 0) == high_first;
                hex += hex_digit(high ? byte >> 4 : byte);
            }
            pos += (nybbles + 1) / 2;
            out.push_back(Value::text(std::move(hex)));
            break;
        }
        case 'x':
            pos += std::min(item.star ? 0 : item.count, remaining);
            break;
        default: {
            size_t width = integer_width(item.code);
            size_t available = remaining / width;
            size_t n = item.star ? available : std::min(item.count, available);
            for (size_t k = 0; k < n; ++k) {
                out.push_back(read_integer(std::string_view(bytes).substr(pos, width), item.code));
                pos += width;
            }
            break;
        }
        }
    }
    return Value::list(std::move(out));
}

auto pack(const Value& format, std::initializer_list<Value> args) -> Value {
    if (format.is_invalid()) {
        return format;
    }
    std::vector<Value> values;
    for (const auto& arg : args) {
        if (arg.is_invalid()) {
            return arg;
        }
        if (arg.is_list()) {
            values.insert(values.end(), arg.items().begin(), arg.items().end());
        } else {
            values.push_back(arg);
        }
    }

    std::string bad_code;
    auto items = parse_template(format.as_string(), bad_code);
    if (!items) {
        return Value::invalid("unsupported pack template letter '" + bad_code + "'");
    }

    std::string out;
    size_t next = 0;
    auto take = [&]() -> Value { return next < values.size() ? values[next++] : Value(); };

    for (const auto& item : *items) {
        switch (item.code) {
        case 'A':
        case 'a': {
            std::string s = take().as_string();
            if (!item.star) {
                s.resize(item.count, item.code == 'A' ? ' ' : '\0');
            }
            out += s;
            break;
        }
        case 'H':
        case 'h': {
            std::string hex = take().as_string();
            size_t nybbles = item.star ? hex.size()
                             : item.explicit_count ? item.count
                                                   : std::min<size_t>(1, hex.size());
            for (size_t k = 0; k < nybbles; k += 2) {
                int first = k < hex.size() ? hex_value(hex[k]) : 0;
                int second = k + 1 < hex.size() && k + 1 < nybbles ? hex_value(hex[k + 1]) : 0;
                int byte = item.code == 'H' ? (first << 4) | second : (second << 4) | first;
                out += static_cast<char>(byte);
            }
            break;
        }
        case 'x':
            out.append(item.star ? 0 : item.count, '\0');
            break;
        default: {
            size_t n = item.star ? values.size() - std::min(next, values.size()) : item.count;
            for (size_t k = 0; k < n; ++k) {
                write_integer(out, static_cast<uint64_t>(take().as_integer()), item.code);
            }
            break;
        }
        }
    }
    return Value::text(std::move(out));
}

} // namespace exprc::rt
