// Pattern matching and splitting. Patterns are compiled once per thread and
// cached by (modifiers, pattern).

#include "exprc_rt/runtime.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <unordered_map>

namespace exprc::rt {

namespace {

/// Rewrites the few Perl-only constructs that std::regex's ECMAScript grammar lacks.
auto to_ecmascript(std::string_view pattern, bool extended) -> std::string {
    std::string out;
    out.reserve(pattern.size());
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            char next = pattern[++i];
            if (!in_class && next == 'A') {
                out += '^';
            } else if (!in_class && (next == 'z' || next == 'Z')) {
                out += '$';
            } else {
                out += c;
                out += next;
            }
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == ']') {
            in_class = false;
        }
        if (extended && !in_class) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                continue;
            }
            if (c == '#') {
                while (i < pattern.size() && pattern[i] != '\n') {
                    ++i;
                }
                continue;
            }
        }
        out += c;
    }
    return out;
}

/// nullptr when the pattern does not compile.
auto compiled(std::string_view pattern, std::string_view modifiers) -> const std::regex* {
    thread_local std::unordered_map<std::string, std::optional<std::regex>> cache;

    std::string key = std::string(modifiers) + "/" + std::string(pattern);
    auto it = cache.find(key);
    if (it == cache.end()) {
        auto flags = std::regex::ECMAScript;
        if (modifiers.find('i') != std::string_view::npos) {
            flags |= std::regex::icase;
        }
        std::optional<std::regex> re;
        try {
            re.emplace(to_ecmascript(pattern, modifiers.find('x') != std::string_view::npos),
                       flags);
        } catch (const std::regex_error&) {
            re.reset();
        }
        it = cache.emplace(std::move(key), std::move(re)).first;
    }
    return it->second ? &*it->second : nullptr;
}

auto split_whitespace(const std::string& s, int64_t limit) -> std::vector<Value> {
    std::vector<Value> fields;
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
    while (i < s.size()) {
        if (limit > 0 && static_cast<int64_t>(fields.size()) + 1 >= limit) {
            fields.push_back(Value::text(s.substr(i)));
            return fields;
        }
        size_t end = i;
        while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end]))) {
            ++end;
        }
        fields.push_back(Value::text(s.substr(i, end - i)));
        i = end;
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
    }
    return fields;
}

} // namespace

auto split(const Value& pattern, const Value& text) -> Value {
    return split(pattern, text, Value::integer(0));
}

auto split(const Value& pattern, const Value& text, const Value& limit) -> Value {
    for (const Value* v : {&pattern, &text, &limit}) {
        if (v->is_invalid()) {
            return *v;
        }
    }
    std::string s = text.as_string();
    std::string pat = pattern.as_string();
    int64_t max_fields = limit.as_integer();
    if (s.empty()) {
        return Value::list({});
    }
    if (pat == " ") {
        return Value::list(split_whitespace(s, max_fields));
    }

    const std::regex* re = compiled(pat, "");
    if (re == nullptr) {
        return Value::invalid("invalid split pattern '" + pat + "'");
    }

    std::vector<Value> fields;
    size_t pos = 0;
    while (pos < s.size() &&
           (max_fields <= 0 || static_cast<int64_t>(fields.size()) + 1 < max_fields)) {
        std::smatch m;
        auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                             : std::regex_constants::match_default;
        if (!std::regex_search(s.cbegin() + static_cast<std::ptrdiff_t>(pos), s.cend(), m, *re,
                               flags)) {
            break;
        }
        size_t match_start = pos + static_cast<size_t>(m.position(0));
        auto match_length = static_cast<size_t>(m.length(0));
        if (match_length == 0) {
            // Empty match: split between characters
            if (match_start == pos) {
                ++match_start;
            }
            if (match_start >= s.size()) {
                break;
            }
            fields.push_back(Value::text(s.substr(pos, match_start - pos)));
            pos = match_start;
            continue;
        }
        fields.push_back(Value::text(s.substr(pos, match_start - pos)));
        pos = match_start + match_length;
    }
    fields.push_back(Value::text(s.substr(std::min(pos, s.size()))));

    if (max_fields <= 0) {
        while (!fields.empty() && fields.back().as_string().empty()) {
            fields.pop_back();
        }
    }
    return Value::list(std::move(fields));
}

auto matches(const Value& subject, std::string_view pattern, std::string_view modifiers)
    -> Value {
    if (subject.is_invalid()) {
        return subject;
    }
    const std::regex* re = compiled(pattern, modifiers);
    if (re == nullptr) {
        return Value::invalid("invalid pattern '" + std::string(pattern) + "'");
    }
    std::string s = subject.as_string();
    return Value::boolean(std::regex_search(s, *re));
}

} // namespace exprc::rt
