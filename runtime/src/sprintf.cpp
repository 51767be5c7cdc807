// Formatted printing with the expression language's conversion rules. Each
// conversion is rebuilt as a C format spec and handed to snprintf; the
// argument is coerced to whatever the conversion expects.

#include "exprc_rt/runtime.hpp"

#include <algorithm>
#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <vector>

namespace exprc::rt {

namespace {

struct ConversionSpec {
    std::string flags;
    int width = -1;
    int precision = -1;
    char conversion = 0;
};

auto format_c(const std::string& spec, auto value) -> std::string {
    int needed = std::snprintf(nullptr, 0, spec.c_str(), value);
    if (needed <= 0) {
        return {};
    }
    std::vector<char> buf(static_cast<size_t>(needed) + 1);
    std::snprintf(buf.data(), buf.size(), spec.c_str(), value);
    return std::string(buf.data(), static_cast<size_t>(needed));
}

auto build_spec(const ConversionSpec& c, const char* length_and_conversion) -> std::string {
    std::string spec = "%" + c.flags;
    if (c.width >= 0) {
        spec += std::to_string(c.width);
    }
    if (c.precision >= 0) {
        spec += "." + std::to_string(c.precision);
    }
    spec += length_and_conversion;
    return spec;
}

auto pad(std::string body, const ConversionSpec& c) -> std::string {
    if (c.width < 0 || body.size() >= static_cast<size_t>(c.width)) {
        return body;
    }
    size_t fill = static_cast<size_t>(c.width) - body.size();
    if (c.flags.find('-') != std::string::npos) {
        return body + std::string(fill, ' ');
    }
    char pad_char = c.flags.find('0') != std::string::npos ? '0' : ' ';
    return std::string(fill, pad_char) + body;
}

auto to_binary(uint64_t v) -> std::string {
    if (v == 0) {
        return "0";
    }
    std::string out;
    while (v != 0) {
        out.insert(out.begin(), static_cast<char>('0' + (v & 1)));
        v >>= 1;
    }
    return out;
}

auto convert(const ConversionSpec& c, const Value& arg) -> std::string {
    switch (c.conversion) {
    case 'd':
    case 'i':
        return format_c(build_spec(c, PRId64), arg.as_integer());
    case 'u':
        return format_c(build_spec(c, PRIu64), static_cast<uint64_t>(arg.as_integer()));
    case 'x':
        return format_c(build_spec(c, PRIx64), static_cast<uint64_t>(arg.as_integer()));
    case 'X':
        return format_c(build_spec(c, PRIX64), static_cast<uint64_t>(arg.as_integer()));
    case 'o':
        return format_c(build_spec(c, PRIo64), static_cast<uint64_t>(arg.as_integer()));
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G': {
        const char conv[2] = {c.conversion, '\0'};
        return format_c(build_spec(c, conv), arg.as_double());
    }
    case 'b':
    case 'B': {
        std::string digits = to_binary(static_cast<uint64_t>(arg.as_integer()));
        if (c.precision > 0 && digits.size() < static_cast<size_t>(c.precision)) {
            digits.insert(0, static_cast<size_t>(c.precision) - digits.size(), '0');
        }
        if (c.flags.find('#') != std::string::npos && digits != "0") {
            digits.insert(0, c.conversion == 'b' ? "0b" : "0B");
        }
        return pad(std::move(digits), c);
    }
    case 'c':
        return pad(chr(arg).as_string(), c);
    case 's':
    default: {
        std::string s = arg.as_string();
        if (c.precision >= 0 && s.size() > static_cast<size_t>(c.precision)) {
            s.resize(static_cast<size_t>(c.precision));
        }
        ConversionSpec plain = c;
        plain.flags.erase(std::remove(plain.flags.begin(), plain.flags.end(), '0'),
                          plain.flags.end());
        return pad(std::move(s), plain);
    }
    }
}

} // namespace

auto sprintf(const Value& format, std::initializer_list<Value> args) -> Value {
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

    std::string fmt = format.as_string();
    std::string out;
    size_t next_arg = 0;
    auto take = [&]() -> Value { return next_arg < values.size() ? values[next_arg++] : Value(); };

    size_t i = 0;
    while (i < fmt.size()) {
        char ch = fmt[i];
        if (ch != '%') {
            out += ch;
            ++i;
            continue;
        }
        if (i + 1 < fmt.size() && fmt[i + 1] == '%') {
            out += '%';
            i += 2;
            continue;
        }

        size_t start = i++;
        ConversionSpec spec;
        while (i < fmt.size() && std::string_view("-+ 0#").find(fmt[i]) != std::string_view::npos) {
            spec.flags += fmt[i++];
        }
        if (i < fmt.size() && fmt[i] == '*') {
            int64_t w = take().as_integer();
            if (w < 0) {
                spec.flags += '-';
                w = -w;
            }
            spec.width = static_cast<int>(w);
            ++i;
        } else {
            while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
                spec.width = (spec.width < 0 ? 0 : spec.width * 10) + (fmt[i++] - '0');
            }
        }
        if (i < fmt.size() && fmt[i] == '.') {
            ++i;
            spec.precision = 0;
            if (i < fmt.size() && fmt[i] == '*') {
                spec.precision = static_cast<int>(take().as_integer());
                ++i;
            } else {
                while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
                    spec.precision = spec.precision * 10 + (fmt[i++] - '0');
                }
            }
        }
        // Size modifiers carry no meaning for 64-bit values
        while (i < fmt.size() && std::string_view("hlqLV").find(fmt[i]) != std::string_view::npos) {
            ++i;
        }
        if (i >= fmt.size()) {
            out += fmt.substr(start);
            break;
        }

        spec.conversion = fmt[i++];
        if (std::string_view("diuxXoeEfFgGbBcs").find(spec.conversion) == std::string_view::npos) {
            // Unknown conversions are copied through
            out += fmt.substr(start, i - start);
            continue;
        }
        out += convert(spec, take());
    }
    return Value::text(std::move(out));
}

} // namespace exprc::rt
