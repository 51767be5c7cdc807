// C++ Code Generator Implementation
//
// A FunctionWriter is created per expression. Expressions are rendered
// bottom-up into C++ expression strings of type rt::Value; top-level
// conditionals become statements. The first unsupported shape is recorded
// and generation stops reporting it.

#include "codegen/cpp_gen.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <optional>

namespace exprc::codegen {

using namespace ast;

namespace {

// ============================================================================
// Function Table
// ============================================================================

struct RuntimeFunction {
    std::string_view name;    ///< Name in the expression language
    std::string_view runtime; ///< Name in the runtime library
    size_t min_args;
    size_t max_args;
    bool defaults_to_value; ///< Called with no arguments it reads the input value
    bool variadic_tail;     ///< Arguments past the first are passed as one initializer list
};

constexpr std::array<RuntimeFunction, 25> RUNTIME_FUNCTIONS = {{
    {"length", "length", 1, 1, true, false},
    {"int", "int_part", 1, 1, true, false},
    {"abs", "abs_value", 1, 1, true, false},
    {"sqrt", "sqrt", 1, 1, true, false},
    {"exp", "exp", 1, 1, true, false},
    {"log", "log", 1, 1, true, false},
    {"sin", "sin", 1, 1, true, false},
    {"cos", "cos", 1, 1, true, false},
    {"hex", "hex", 1, 1, true, false},
    {"oct", "oct", 1, 1, true, false},
    {"ord", "ord", 1, 1, true, false},
    {"chr", "chr", 1, 1, true, false},
    {"uc", "uc", 1, 1, true, false},
    {"lc", "lc", 1, 1, true, false},
    {"ucfirst", "ucfirst", 1, 1, true, false},
    {"lcfirst", "lcfirst", 1, 1, true, false},
    {"defined", "defined", 1, 1, true, false},
    {"atan2", "atan2", 2, 2, false, false},
    {"substr", "substr", 2, 3, false, false},
    {"index", "index", 2, 3, false, false},
    {"split", "split", 1, 3, false, false},
    {"unpack", "unpack", 1, 2, false, false},
    {"join", "join", 1, SIZE_MAX, false, true},
    {"pack", "pack", 1, SIZE_MAX, false, true},
    {"sprintf", "sprintf", 1, SIZE_MAX, false, true},
}};

auto find_function(std::string_view name) -> const RuntimeFunction* {
    for (const auto& fn : RUNTIME_FUNCTIONS) {
        if (fn.name == name) {
            return &fn;
        }
    }
    return nullptr;
}

/// Runtime function for comparison and bitwise operators.
auto named_operator(std::string_view op) -> std::string_view {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 20> TABLE = {{
        {"==", "num_eq"},  {"!=", "num_ne"},  {"<", "num_lt"},   {">", "num_gt"},
        {"<=", "num_le"},  {">=", "num_ge"},  {"<=>", "num_cmp"}, {"eq", "str_eq"},
        {"ne", "str_ne"},  {"lt", "str_lt"},  {"gt", "str_gt"},  {"le", "str_le"},
        {"ge", "str_ge"},  {"cmp", "str_cmp"}, {"&", "bit_and"}, {"|", "bit_or"},
        {"^", "bit_xor"},  {"<<", "shl"},     {">>", "shr"},     {"**", "power"},
    }};
    for (const auto& [text, fn] : TABLE) {
        if (text == op) {
            return fn;
        }
    }
    return {};
}

/// Runtime function taking the right operand lazily.
auto short_circuit_operator(std::string_view op) -> std::string_view {
    if (op == "&&" || op == "and") {
        return "logical_and";
    }
    if (op == "||" || op == "or") {
        return "logical_or";
    }
    if (op == "//") {
        return "defined_or";
    }
    return {};
}

auto is_arithmetic(std::string_view op) -> bool {
    return op == "+" || op == "-" || op == "*" || op == "/" || op == "%";
}

// ============================================================================
// Literals
// ============================================================================

auto is_all_digits(std::string_view s) -> bool {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

/// C++ spelling of a real number literal.
auto real_literal(std::string text) -> std::string {
    if (text.starts_with(".")) {
        text.insert(0, "0");
    }
    if (text.ends_with(".")) {
        text += "0";
    }
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

void append_utf8(std::string& out, uint32_t cp) {
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

auto is_hex_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto hex_value(char c) -> uint32_t {
    if (c >= '0' && c <= '9') {
        return static_cast<uint32_t>(c - '0');
    }
    return static_cast<uint32_t>((c | 0x20) - 'a' + 10);
}

auto is_ident_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

/// Single-quoted body: only `\\` and `\'` are escapes.
auto decode_single_quoted(std::string_view body) -> std::string {
    std::string out;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\\' && i + 1 < body.size() && (body[i + 1] == '\\' || body[i + 1] == '\'')) {
            ++i;
        }
        out += body[i];
    }
    return out;
}

/// Piece of an interpolating string: literal text or a scalar reference.
struct StringPart {
    bool is_variable = false;
    std::string text; ///< Decoded text, or the variable spelling
};

/// Splits a double-quoted body into decoded text and variables.
auto split_interpolated(std::string_view body) -> std::vector<StringPart> {
    std::vector<StringPart> parts;
    auto text = [&]() -> std::string& {
        if (parts.empty() || parts.back().is_variable) {
            parts.push_back({false, {}});
        }
        return parts.back().text;
    };

    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            char e = body[i + 1];
            i += 2;
            switch (e) {
            case 'n':
                text() += '\n';
                break;
            case 't':
                text() += '\t';
                break;
            case 'r':
                text() += '\r';
                break;
            case 'a':
                text() += '\a';
                break;
            case 'e':
                text() += '\x1b';
                break;
            case '0':
                text() += '\0';
                break;
            case 'x': {
                uint32_t cp = 0;
                if (i < body.size() && body[i] == '{') {
                    size_t close = body.find('}', i);
                    if (close == std::string_view::npos) {
                        close = body.size();
                    }
                    std::string_view digits = body.substr(i + 1, close - i - 1);
                    std::from_chars(digits.data(), digits.data() + digits.size(), cp, 16);
                    i = close + 1;
                } else {
                    size_t n = 0;
                    while (n < 2 && i < body.size() && is_hex_digit(body[i])) {
                        cp = cp * 16 + hex_value(body[i]);
                        ++i;
                        ++n;
                    }
                }
                if (cp < 0x100) {
                    text() += static_cast<char>(cp);
                } else {
                    append_utf8(text(), cp);
                }
                break;
            }
            default:
                text() += e;
                break;
            }
            continue;
        }

        if (c == '$' && i + 1 < body.size()) {
            size_t start = i;
            size_t j = i + 1;
            if (body.substr(j).starts_with("$self{")) {
                size_t close = body.find('}', j);
                if (close != std::string_view::npos) {
                    parts.push_back({true, std::string(body.substr(start, close + 1 - start))});
                    i = close + 1;
                    continue;
                }
            }
            if (body[j] == '{') {
                size_t close = body.find('}', j);
                if (close != std::string_view::npos && close > j + 1) {
                    parts.push_back({true, "$" + std::string(body.substr(j + 1, close - j - 1))});
                    i = close + 1;
                    continue;
                }
            }
            if (is_ident_char(body[j]) || body[j] == '_') {
                while (j < body.size() && is_ident_char(body[j])) {
                    ++j;
                }
                parts.push_back({true, std::string(body.substr(start, j - start))});
                i = j;
                continue;
            }
        }
        if (c == '@' && i + 1 < body.size() && (is_ident_char(body[i + 1]) || body[i + 1] == '{')) {
            parts.push_back({true, std::string(body.substr(i, 2))});
            i += 2;
            continue;
        }
        text() += c;
        ++i;
    }
    return parts;
}

// ============================================================================
// Function Writer
// ============================================================================

class FunctionWriter {
public:
    FunctionWriter(const CppGenOptions& options, ExpressionContext context)
        : options_(options), context_(context), rt_(options.runtime_namespace + "::") {}

    void write(const NormalizedNode& root) {
        statement(root, 1);
    }

    [[nodiscard]] auto body() const -> const std::string& {
        return body_;
    }

    [[nodiscard]] auto error() const -> const std::optional<UnsupportedConstruct>& {
        return error_;
    }

private:
    const CppGenOptions& options_;
    ExpressionContext context_;
    std::string rt_;
    std::string body_;
    std::optional<UnsupportedConstruct> error_;
    int temporaries_ = 0;

    void fail(std::string message, std::string fragment = {}) {
        if (!error_) {
            error_ = UnsupportedConstruct{std::move(message), std::move(fragment)};
        }
    }

    auto fresh(std::string_view stem) -> std::string {
        return std::string(stem) + "_" + std::to_string(++temporaries_);
    }

    void line(int depth, const std::string& text) {
        body_.append(static_cast<size_t>(depth * options_.indent), ' ');
        body_ += text;
        body_ += '\n';
    }

    // ========================================================================
    // Statements
    // ========================================================================

    /// Return statement delivering an rt::Value expression in this context.
    void emit_return(const std::string& expr, int depth) {
        switch (context_) {
        case ExpressionContext::ValueTransform:
            line(depth, "return " + rt_ + "finish(" + expr + ");");
            break;
        case ExpressionContext::DisplayFormat:
            line(depth, "return " + rt_ + "display_or_raw(" + expr + ", val);");
            break;
        case ExpressionContext::BooleanGate:
            line(depth, "return " + rt_ + "truthy(" + expr + ");");
            break;
        }
    }

    /// Early exit when a guard value cannot be evaluated.
    void emit_invalid_check(const std::string& temp, int depth) {
        line(depth, "if (" + temp + ".is_invalid()) {");
        switch (context_) {
        case ExpressionContext::ValueTransform:
            line(depth + 1, "return " + rt_ + "finish(" + temp + ");");
            break;
        case ExpressionContext::DisplayFormat:
            line(depth + 1, "return " + rt_ + "stringify(val);");
            break;
        case ExpressionContext::BooleanGate:
            line(depth + 1, "return false;");
            break;
        }
        line(depth, "}");
    }

    /// Binds `expr` to a named temporary and checks it.
    auto bind_guard(std::string_view stem, const std::string& expr, int depth) -> std::string {
        std::string temp = fresh(stem);
        line(depth, "const " + rt_ + "Value " + temp + " = " + expr + ";");
        emit_invalid_check(temp, depth);
        return temp;
    }

    void statement(const NormalizedNode& node, int depth) {
        if (node.is<Ternary>()) {
            const auto& t = node.as<Ternary>();
            std::string cond = bind_guard("condition", expr(*t.condition), depth);
            line(depth, "if (" + rt_ + "truthy(" + cond + ")) {");
            statement(*t.if_true, depth + 1);
            line(depth, "} else {");
            statement(*t.if_false, depth + 1);
            line(depth, "}");
            return;
        }
        if (node.is<SafeDivision>()) {
            const auto& d = node.as<SafeDivision>();
            std::string divisor = bind_guard("divisor", expr(*d.divisor), depth);
            line(depth, "if (" + rt_ + "truthy(" + divisor + ")) {");
            emit_return(expr(*d.numerator) + " / " + divisor, depth + 1);
            line(depth, "} else {");
            emit_return(rt_ + "Value::integer(0)", depth + 1);
            line(depth, "}");
            return;
        }
        if (node.is<PostfixConditional>()) {
            const auto& p = node.as<PostfixConditional>();
            std::string pred = bind_guard("predicate", expr(*p.predicate), depth);
            std::string test = rt_ + "truthy(" + pred + ")";
            line(depth, "if (" + (p.negated ? "!" + test : test) + ") {");
            statement(*p.body, depth + 1);
            line(depth, "} else {");
            emit_return(pred, depth + 1);
            line(depth, "}");
            return;
        }
        if (node.is<ConditionalAssignment>()) {
            const auto& ca = node.as<ConditionalAssignment>();
            for (const auto& guard : ca.guards) {
                assignment(guard, depth);
            }
            statement(*ca.result, depth);
            return;
        }
        emit_return(expr(node), depth);
    }

    void assignment(const GuardedAssignment& guard, int depth) {
        if (guard.target.kind != SymbolKind::Value) {
            fail("assignment to '" + guard.target.source + "'", guard.target.source);
            return;
        }
        std::string cond = bind_guard("guard", expr(*guard.condition), depth);
        std::string value = expr(*guard.value);

        std::string assigned;
        std::string_view op = guard.op;
        if (op == "=") {
            assigned = value;
        } else if (op == "||=" || op == "&&=" || op == "//=") {
            assigned = binary_code(op.substr(0, op.size() - 1), "val", value);
        } else if (op == ".=") {
            assigned = rt_ + "concat({val, " + value + "})";
        } else if (op == "x=") {
            assigned = rt_ + "repeat(val, " + value + ")";
        } else {
            assigned = binary_code(op.substr(0, op.size() - 1), "val", value);
        }

        line(depth, "if (" + rt_ + "truthy(" + cond + ")) {");
        line(depth + 1, "val = " + assigned + ";");
        line(depth, "}");
    }

    // ========================================================================
    // Expressions
    // ========================================================================

    /// Combines already rendered operands. Empty when the operator is unknown.
    auto binary_code(std::string_view op, const std::string& lhs, const std::string& rhs)
        -> std::string {
        if (is_arithmetic(op)) {
            return "(" + lhs + " " + std::string(op) + " " + rhs + ")";
        }
        if (auto fn = named_operator(op); !fn.empty()) {
            return rt_ + std::string(fn) + "(" + lhs + ", " + rhs + ")";
        }
        if (auto fn = short_circuit_operator(op); !fn.empty()) {
            return rt_ + std::string(fn) + "(" + lhs + ", [&] { return " + rhs + "; })";
        }
        if (op == "xor") {
            return rt_ + "logical_xor(" + lhs + ", " + rhs + ")";
        }
        if (op == ".") {
            return rt_ + "concat({" + lhs + ", " + rhs + "})";
        }
        if (op == "x") {
            return rt_ + "repeat(" + lhs + ", " + rhs + ")";
        }
        fail("operator '" + std::string(op) + "'", std::string(op));
        return {};
    }

    auto match_code(const std::string& subject, const Literal& regex) -> std::string {
        return rt_ + "matches(" + subject + ", " + cpp_string_literal(regex.text) + ", " +
               cpp_string_literal(regex.modifiers) + ")";
    }

    auto symbol_code(const Symbol& symbol) -> std::string {
        if (symbol.kind == SymbolKind::Value) {
            return "val";
        }
        if (context_ != ExpressionContext::BooleanGate) {
            fail("context field '" + symbol.source + "' outside a condition", symbol.source);
            return {};
        }
        return "ctx.field(" + cpp_string_literal(symbol.name) + ")";
    }

    auto text_code(const std::string& text) -> std::string {
        return rt_ + "Value::text(" + cpp_string_literal(text) + ")";
    }

    auto literal_code(const Literal& lit) -> std::string {
        switch (lit.kind) {
        case LiteralKind::Undef:
            return rt_ + "Value()";
        case LiteralKind::Regex:
            return match_code("val", lit);
        case LiteralKind::Number: {
            int64_t parsed = 0;
            if (is_all_digits(lit.text)) {
                auto [ptr, ec] =
                    std::from_chars(lit.text.data(), lit.text.data() + lit.text.size(), parsed);
                if (ec == std::errc{} && ptr == lit.text.data() + lit.text.size()) {
                    return rt_ + "Value::integer(" + lit.text + ")";
                }
            }
            return rt_ + "Value::real(" + real_literal(lit.text) + ")";
        }
        case LiteralKind::String:
            break;
        }

        if (!lit.interpolate) {
            return text_code(decode_single_quoted(lit.text));
        }
        std::vector<std::string> pieces;
        for (const auto& part : split_interpolated(lit.text)) {
            if (!part.is_variable) {
                pieces.push_back(text_code(part.text));
                continue;
            }
            Symbol symbol;
            if (!classify_symbol(part.text, symbol)) {
                fail("interpolated variable '" + part.text + "'", lit.text);
                return {};
            }
            pieces.push_back(symbol_code(symbol));
        }
        if (pieces.empty()) {
            return text_code("");
        }
        if (pieces.size() == 1 && pieces[0].starts_with(rt_ + "Value::text(")) {
            return pieces[0];
        }
        return rt_ + "concat({" + join_codes(pieces) + "})";
    }

    static auto join_codes(const std::vector<std::string>& codes) -> std::string {
        std::string out;
        for (size_t i = 0; i < codes.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += codes[i];
        }
        return out;
    }

    auto exprs(const std::vector<NormalizedPtr>& nodes) -> std::vector<std::string> {
        std::vector<std::string> out;
        out.reserve(nodes.size());
        for (const auto& n : nodes) {
            out.push_back(expr(*n));
        }
        return out;
    }

    /// Folds a format built only from constant strings.
    static auto constant_text(const NormalizedNode& node) -> std::optional<std::string> {
        if (node.is<Literal>()) {
            const auto& lit = node.as<Literal>();
            if (lit.kind != LiteralKind::String) {
                return std::nullopt;
            }
            if (!lit.interpolate) {
                return decode_single_quoted(lit.text);
            }
            std::string out;
            for (const auto& part : split_interpolated(lit.text)) {
                if (part.is_variable) {
                    return std::nullopt;
                }
                out += part.text;
            }
            return out;
        }
        if (node.is<StringConcat>()) {
            std::string out;
            for (const auto& part : node.as<StringConcat>().parts) {
                auto text = constant_text(*part);
                if (!text) {
                    return std::nullopt;
                }
                out += *text;
            }
            return out;
        }
        if (node.is<StringRepeat>()) {
            const auto& rep = node.as<StringRepeat>();
            auto text = constant_text(*rep.text);
            if (!text || !rep.count->is<Literal>()) {
                return std::nullopt;
            }
            const auto& count = rep.count->as<Literal>();
            if (count.kind != LiteralKind::Number || !is_all_digits(count.text) ||
                count.text.size() > 4) {
                return std::nullopt;
            }
            std::string out;
            for (int k = std::stoi(count.text); k > 0; --k) {
                out += *text;
            }
            return out;
        }
        return std::nullopt;
    }

    auto call_code(const FunctionCall& call) -> std::string {
        const RuntimeFunction* fn = find_function(call.name);
        if (fn == nullptr) {
            fail("function '" + call.name + "'", call.name + "(...)");
            return {};
        }
        if (call.name == "sprintf") {
            return formatted_code(call.args);
        }

        std::vector<std::string> args;
        if (call.args.empty() && fn->defaults_to_value) {
            args.push_back("val");
        } else {
            args = exprs(call.args);
        }
        if (args.size() < fn->min_args || args.size() > fn->max_args) {
            fail("function '" + call.name + "' with " + std::to_string(args.size()) +
                     " arguments",
                 call.name + "(...)");
            return {};
        }

        if (call.name == "split") {
            // split /PATTERN/, TEXT takes the pattern as text
            const auto& pattern = *call.args[0];
            if (pattern.is<Literal>() && pattern.as<Literal>().kind == LiteralKind::Regex) {
                args[0] = text_code(pattern.as<Literal>().text);
            }
            if (args.size() == 1) {
                args.push_back("val");
            }
        }
        if (call.name == "unpack" && args.size() == 1) {
            args.push_back("val");
        }

        std::string name = rt_ + std::string(fn->runtime);
        if (fn->variadic_tail) {
            std::vector<std::string> tail(args.begin() + 1, args.end());
            return name + "(" + args[0] + ", {" + join_codes(tail) + "})";
        }
        return name + "(" + join_codes(args) + ")";
    }

    auto formatted_code(const std::vector<NormalizedPtr>& format_and_args) -> std::string {
        if (format_and_args.empty()) {
            fail("sprintf without a format", "sprintf()");
            return {};
        }
        std::string format;
        if (auto folded = constant_text(*format_and_args[0])) {
            format = text_code(*folded);
        } else {
            format = expr(*format_and_args[0]);
        }
        std::vector<std::string> args;
        for (size_t i = 1; i < format_and_args.size(); ++i) {
            args.push_back(expr(*format_and_args[i]));
        }
        return rt_ + "sprintf(" + format + ", {" + join_codes(args) + "})";
    }

    auto expr(const NormalizedNode& node) -> std::string {
        if (error_) {
            return {};
        }
        return std::visit([this](const auto& n) { return render(n); }, node.kind);
    }

    auto render(const Literal& lit) -> std::string {
        return literal_code(lit);
    }

    auto render(const Symbol& symbol) -> std::string {
        return symbol_code(symbol);
    }

    auto render(const BinaryOp& bin) -> std::string {
        if (bin.op == "=~" || bin.op == "!~") {
            if (!bin.rhs->is<Literal>() || bin.rhs->as<Literal>().kind != LiteralKind::Regex) {
                fail("match against a non-literal pattern", bin.op);
                return {};
            }
            std::string match = match_code(expr(*bin.lhs), bin.rhs->as<Literal>());
            return bin.op == "=~" ? match : rt_ + "logical_not(" + match + ")";
        }
        std::string lhs = expr(*bin.lhs);
        std::string rhs = expr(*bin.rhs);
        return binary_code(bin.op, lhs, rhs);
    }

    auto render(const UnaryOp& un) -> std::string {
        if (un.op == "-" && un.operand->is<Literal>() &&
            un.operand->as<Literal>().kind == LiteralKind::Number) {
            std::string folded = literal_code(un.operand->as<Literal>());
            size_t open = folded.find('(');
            return folded.insert(open + 1, "-");
        }
        std::string operand = expr(*un.operand);
        if (un.op == "!" || un.op == "not") {
            return rt_ + "logical_not(" + operand + ")";
        }
        if (un.op == "-") {
            return "(-" + operand + ")";
        }
        if (un.op == "+") {
            return operand;
        }
        if (un.op == "~") {
            return rt_ + "bit_not(" + operand + ")";
        }
        fail("unary operator '" + un.op + "'", un.op);
        return {};
    }

    auto render(const StringConcat& cat) -> std::string {
        return rt_ + "concat({" + join_codes(exprs(cat.parts)) + "})";
    }

    auto render(const StringRepeat& rep) -> std::string {
        if (rep.text->is<ListExpr>()) {
            fail("list repetition", "(...) x N");
            return {};
        }
        return rt_ + "repeat(" + expr(*rep.text) + ", " + expr(*rep.count) + ")";
    }

    auto render(const Ternary& t) -> std::string {
        return rt_ + "choose(" + expr(*t.condition) + ", [&] { return " + expr(*t.if_true) +
               "; }, [&] { return " + expr(*t.if_false) + "; })";
    }

    auto render(const SafeDivision& d) -> std::string {
        std::string divisor = expr(*d.divisor);
        return rt_ + "choose(" + divisor + ", [&] { return " + expr(*d.numerator) + " / " +
               divisor + "; }, [&] { return " + rt_ + "Value::integer(0); })";
    }

    auto render(const FunctionCall& call) -> std::string {
        return call_code(call);
    }

    auto render(const FormattedPrint& print) -> std::string {
        std::string format;
        if (auto folded = constant_text(*print.format)) {
            format = text_code(*folded);
        } else {
            format = expr(*print.format);
        }
        return rt_ + "sprintf(" + format + ", {" + join_codes(exprs(print.args)) + "})";
    }

    auto render(const ElementAccess& access) -> std::string {
        return rt_ + "element(" + expr(*access.subject) + ", " + std::to_string(access.index) +
               ")";
    }

    auto render(const PostfixConditional& p) -> std::string {
        std::string pred = expr(*p.predicate);
        std::string body = "[&] { return " + expr(*p.body) + "; }";
        std::string otherwise = "[&] { return " + rt_ + "Value(); }";
        return rt_ + "choose(" + pred + ", " + (p.negated ? otherwise + ", " + body
                                                          : body + ", " + otherwise) + ")";
    }

    auto render(const ConditionalAssignment&) -> std::string {
        fail("assignment inside an expression", "");
        return {};
    }

    auto render(const ListExpr& list) -> std::string {
        return rt_ + "Value::list({" + join_codes(exprs(list.items)) + "})";
    }
};

} // namespace

// ============================================================================
// CppCodeGen
// ============================================================================

CppCodeGen::CppCodeGen(CppGenOptions options) : options_(std::move(options)) {}

auto CppCodeGen::signature(ExpressionContext context, const std::string& name) const
    -> std::string {
    const std::string& rt = options_.runtime_namespace;
    switch (context) {
    case ExpressionContext::ValueTransform:
        return "auto " + name + "([[maybe_unused]] " + rt + "::Value val) -> " + rt +
               "::ValueResult";
    case ExpressionContext::DisplayFormat:
        return "auto " + name + "([[maybe_unused]] " + rt + "::Value val) -> std::string";
    case ExpressionContext::BooleanGate:
        return "auto " + name + "([[maybe_unused]] " + rt + "::Value val, [[maybe_unused]] const " +
               rt + "::EvalContext& ctx) -> bool";
    }
    return {};
}

auto CppCodeGen::generate(const NormalizedNode& root, ExpressionContext context,
                          const std::string& name) const
    -> Result<std::string, UnsupportedConstruct> {
    FunctionWriter writer(options_, context);
    writer.write(root);
    if (writer.error()) {
        return *writer.error();
    }
    return signature(context, name) + " {\n" + writer.body() + "}\n";
}

auto CppCodeGen::fallback(ExpressionContext context, const std::string& name,
                          const std::string& original_text) const -> std::string {
    std::string indent(static_cast<size_t>(options_.indent), ' ');
    std::string body;
    switch (context) {
    case ExpressionContext::ValueTransform:
        body = "return " + options_.runtime_namespace + "::not_implemented(" +
               cpp_string_literal(original_text) + ");";
        break;
    case ExpressionContext::DisplayFormat:
        body = "return " + options_.runtime_namespace + "::stringify(val);";
        break;
    case ExpressionContext::BooleanGate:
        body = "return false;";
        break;
    }
    return signature(context, name) + " {\n" + indent + body + "\n}\n";
}

auto cpp_string_literal(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        default: {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20 || byte >= 0x7F) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\%03o", byte);
                out += buf;
            } else {
                out += c;
            }
            break;
        }
        }
    }
    out += '"';
    return out;
}

} // namespace exprc::codegen
