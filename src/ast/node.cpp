#include "ast/node.hpp"

#include <cctype>
#include <charconv>

namespace exprc::ast {

auto node_kind_name(NodeKind kind) -> const char* {
    switch (kind) {
    case NodeKind::Document:
        return "doc";
    case NodeKind::Statement:
        return "stmt";
    case NodeKind::Expression:
        return "expr";
    case NodeKind::StructureList:
        return "list";
    case NodeKind::StructureBlock:
        return "block";
    case NodeKind::StructureSubscript:
        return "subscript";
    case NodeKind::Symbol:
        return "sym";
    case NodeKind::Cast:
        return "cast";
    case NodeKind::Number:
        return "num";
    case NodeKind::Quote:
        return "quote";
    case NodeKind::Regex:
        return "regex";
    case NodeKind::Operator:
        return "op";
    case NodeKind::Word:
        return "word";
    case NodeKind::Punctuation:
        return "punct";
    case NodeKind::Opaque:
        return "opaque";
    case NodeKind::ArgList:
        return "args";
    case NodeKind::BinaryOp:
        return "binop";
    case NodeKind::UnaryOp:
        return "unop";
    case NodeKind::StringConcat:
        return "concat";
    case NodeKind::StringRepeat:
        return "repeat";
    case NodeKind::Ternary:
        return "ternary";
    case NodeKind::SafeDivision:
        return "safediv";
    case NodeKind::FunctionCall:
        return "call";
    case NodeKind::FormattedPrint:
        return "sprintf";
    case NodeKind::ElementAccess:
        return "elem";
    case NodeKind::PostfixConditional:
        return "postfix";
    case NodeKind::GuardedAssignment:
        return "guarded";
    case NodeKind::ConditionalAssignment:
        return "condassign";
    }
    return "?";
}

auto is_canonical_kind(NodeKind kind) -> bool {
    return kind >= NodeKind::ArgList;
}

auto Node::leaf(NodeKind kind, std::string content, std::string value) -> Node {
    Node node;
    node.kind = kind;
    node.content = std::move(content);
    node.value = std::move(value);
    return node;
}

auto Node::branch(NodeKind kind, std::string content, std::vector<Node> children) -> Node {
    Node node;
    node.kind = kind;
    node.content = std::move(content);
    node.children = std::move(children);
    return node;
}

auto sym(std::string name) -> Node {
    return Node::leaf(NodeKind::Symbol, std::move(name));
}

auto num(std::string text) -> Node {
    std::string value = decimal_spelling(text);
    return Node::leaf(NodeKind::Number, std::move(text), std::move(value));
}

auto dquote(std::string body) -> Node {
    return Node::leaf(NodeKind::Quote, "\"" + body + "\"", body);
}

auto squote(std::string body) -> Node {
    return Node::leaf(NodeKind::Quote, "'" + body + "'", body);
}

auto op(std::string text) -> Node {
    return Node::leaf(NodeKind::Operator, std::move(text));
}

auto word(std::string text) -> Node {
    return Node::leaf(NodeKind::Word, std::move(text));
}

auto statement(std::vector<Node> children) -> Node {
    return Node::branch(NodeKind::Statement, "", std::move(children));
}

auto document(std::vector<Node> statements) -> Node {
    return Node::branch(NodeKind::Document, "", std::move(statements));
}

auto paren_list(std::vector<Node> children) -> Node {
    return Node::branch(NodeKind::StructureList, "()",
                        {Node::branch(NodeKind::Expression, "", std::move(children))});
}

auto decimal_spelling(std::string_view text) -> std::string {
    std::string digits;
    for (char c : text) {
        if (c != '_') {
            digits += c;
        }
    }
    if (digits.empty()) {
        return {};
    }

    int base = 10;
    size_t start = 0;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        start = 2;
    } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'b' || digits[1] == 'B')) {
        base = 2;
        start = 2;
    } else if (digits.size() > 1 && digits[0] == '0' &&
               digits.find_first_of(".eE") == std::string::npos) {
        base = 8;
        start = 1;
    }

    if (base != 10) {
        uint64_t value = 0;
        auto [ptr, ec] =
            std::from_chars(digits.data() + start, digits.data() + digits.size(), value, base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return {};
        }
        return std::to_string(value);
    }

    // Decimal integer or float: digits, at most one '.', optional exponent
    bool seen_digit = false;
    bool seen_dot = false;
    size_t i = 0;
    for (; i < digits.size(); ++i) {
        char c = digits[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (!seen_digit) {
        return {};
    }
    if (i < digits.size() && (digits[i] == 'e' || digits[i] == 'E')) {
        ++i;
        if (i < digits.size() && (digits[i] == '+' || digits[i] == '-')) {
            ++i;
        }
        size_t exp_start = i;
        while (i < digits.size() && std::isdigit(static_cast<unsigned char>(digits[i]))) {
            ++i;
        }
        if (i == exp_start) {
            return {};
        }
    }
    if (i != digits.size()) {
        return {};
    }
    return digits;
}

auto is_interpolating(const Node& quote) -> bool {
    if (quote.kind != NodeKind::Quote) {
        return false;
    }
    std::string_view raw = quote.content;
    return raw.starts_with("\"") || raw.starts_with("qq");
}

static void append_quoted(std::string& out, const std::string& text) {
    out += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

static void write_sexpr(const Node& node, std::string& out) {
    out += '(';
    out += node_kind_name(node.kind);
    if (!node.content.empty() || !node.value.empty()) {
        out += ' ';
        append_quoted(out, node.content);
    }
    if (!node.value.empty()) {
        out += ' ';
        append_quoted(out, node.value);
    }
    for (const auto& child : node.children) {
        out += ' ';
        write_sexpr(child, out);
    }
    out += ')';
}

auto to_sexpr(const Node& node) -> std::string {
    std::string out;
    write_sexpr(node, out);
    return out;
}

} // namespace exprc::ast
