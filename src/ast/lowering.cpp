//! # Lowering
//!
//! Node tree -> NormalizedNode. Container nodes (document, statement,
//! expression, single-item argument lists) are unwrapped when they hold exactly
//! one meaningful child; any other leftover raw shape means no pass recognized
//! it and the expression is unsupported.

#include "ast/normalized.hpp"

#include <cctype>
#include <charconv>
#include <optional>

namespace exprc::ast {

namespace {

using LowerResult = Result<NormalizedNode, UnsupportedConstruct>;

auto unsupported(std::string message, const Node& node) -> UnsupportedConstruct {
    return UnsupportedConstruct{std::move(message), to_sexpr(node)};
}

auto wrap(NormalizedNode node) -> NormalizedPtr {
    return make_box<NormalizedNode>(std::move(node));
}

/// Lowers `node` into `out`; returns the error, if any.
auto lower_into(const Node& node, NormalizedPtr& out) -> std::optional<UnsupportedConstruct> {
    auto result = lower(node);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    out = wrap(std::move(unwrap(result)));
    return std::nullopt;
}

auto lower_all(const std::vector<Node>& nodes, std::vector<NormalizedPtr>& out)
    -> std::optional<UnsupportedConstruct> {
    for (const auto& node : nodes) {
        NormalizedPtr item;
        if (auto err = lower_into(node, item)) {
            return err;
        }
        out.push_back(std::move(item));
    }
    return std::nullopt;
}

auto is_identifier(std::string_view s) -> bool {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

auto lower_sequence(const Node& node) -> LowerResult {
    std::vector<const Node*> items;
    for (const auto& child : node.children) {
        if (child.is(NodeKind::Punctuation) && child.content == ";") {
            continue;
        }
        if (items.empty() && child.is_word("return")) {
            continue;
        }
        items.push_back(&child);
    }
    if (items.size() == 1) {
        if (items[0]->is(NodeKind::GuardedAssignment)) {
            return unsupported("assignment without a result expression", *items[0]);
        }
        return lower(*items[0]);
    }
    if (items.empty()) {
        return unsupported("empty expression", node);
    }
    return unsupported("sequence not reduced to a single expression", node);
}

auto lower_guard(const Node& node, GuardedAssignment& out) -> std::optional<UnsupportedConstruct> {
    if (!node.is(NodeKind::GuardedAssignment) || node.children.size() != 3) {
        return unsupported("malformed guarded assignment", node);
    }
    const Node& target = node.children[1];
    if (!target.is(NodeKind::Symbol) || !classify_symbol(target.content, out.target)) {
        return unsupported("assignment target is not a scalar", target);
    }
    out.op = node.content;
    if (auto err = lower_into(node.children[0], out.condition)) {
        return err;
    }
    return lower_into(node.children[2], out.value);
}

} // namespace

auto classify_symbol(const std::string& spelling, Symbol& out) -> bool {
    out.source = spelling;
    if (spelling == "$val" || spelling == "$_") {
        out.kind = SymbolKind::Value;
        out.name.clear();
        return true;
    }

    std::string_view s = spelling;
    if (s.starts_with("$$self{") && s.ends_with("}")) {
        // $$self{A}{B} -> "A.B"
        std::string key;
        std::string_view rest = s.substr(6);
        while (rest.starts_with("{")) {
            size_t close = rest.find('}');
            if (close == std::string_view::npos) {
                return false;
            }
            if (!key.empty()) {
                key += '.';
            }
            key += rest.substr(1, close - 1);
            rest = rest.substr(close + 1);
        }
        if (!rest.empty() || key.empty()) {
            return false;
        }
        out.kind = SymbolKind::ContextField;
        out.name = key;
        return true;
    }

    if (s.starts_with("$") && is_identifier(s.substr(1))) {
        out.kind = SymbolKind::ContextField;
        out.name = std::string(s.substr(1));
        return true;
    }
    return false;
}

auto lower(const Node& node) -> LowerResult {
    switch (node.kind) {
    case NodeKind::Document:
    case NodeKind::Statement:
    case NodeKind::Expression:
        return lower_sequence(node);

    case NodeKind::ArgList:
    case NodeKind::StructureList: {
        if (node.children.size() == 1) {
            return lower(node.children[0]);
        }
        ListExpr list;
        if (auto err = lower_all(node.children, list.items)) {
            return *err;
        }
        return NormalizedNode{std::move(list)};
    }

    case NodeKind::Symbol: {
        Symbol symbol;
        if (!classify_symbol(node.content, symbol)) {
            return unsupported("unsupported variable '" + node.content + "'", node);
        }
        return NormalizedNode{std::move(symbol)};
    }

    case NodeKind::Number:
        return NormalizedNode{Literal{LiteralKind::Number, node.value, false, ""}};

    case NodeKind::Quote:
        return NormalizedNode{Literal{LiteralKind::String, node.value, is_interpolating(node), ""}};

    case NodeKind::Regex:
        return NormalizedNode{Literal{LiteralKind::Regex, node.value, false, node.content}};

    case NodeKind::Word:
        if (node.content == "undef") {
            return NormalizedNode{Literal{}};
        }
        return unsupported("bareword '" + node.content + "'", node);

    case NodeKind::Cast:
        return unsupported("dereference '" + node.content + "'", node);
    case NodeKind::Opaque:
        return unsupported("unsupported token " + node.value + " '" + node.content + "'", node);
    case NodeKind::Operator:
        return unsupported("dangling operator '" + node.content + "'", node);
    case NodeKind::Punctuation:
    case NodeKind::StructureBlock:
    case NodeKind::StructureSubscript:
        return unsupported("unsupported structure", node);

    case NodeKind::BinaryOp: {
        if (node.children.size() != 2) {
            return unsupported("malformed binary operation", node);
        }
        BinaryOp bin;
        bin.op = node.content;
        if (auto err = lower_into(node.children[0], bin.lhs)) {
            return *err;
        }
        if (auto err = lower_into(node.children[1], bin.rhs)) {
            return *err;
        }
        return NormalizedNode{std::move(bin)};
    }

    case NodeKind::UnaryOp: {
        if (node.children.size() != 1) {
            return unsupported("malformed unary operation", node);
        }
        UnaryOp un;
        un.op = node.content;
        if (auto err = lower_into(node.children[0], un.operand)) {
            return *err;
        }
        return NormalizedNode{std::move(un)};
    }

    case NodeKind::StringConcat: {
        if (node.children.size() < 2) {
            return unsupported("concatenation needs two operands", node);
        }
        StringConcat concat;
        if (auto err = lower_all(node.children, concat.parts)) {
            return *err;
        }
        return NormalizedNode{std::move(concat)};
    }

    case NodeKind::StringRepeat: {
        if (node.children.size() != 2) {
            return unsupported("malformed repetition", node);
        }
        StringRepeat repeat;
        if (auto err = lower_into(node.children[0], repeat.text)) {
            return *err;
        }
        if (auto err = lower_into(node.children[1], repeat.count)) {
            return *err;
        }
        return NormalizedNode{std::move(repeat)};
    }

    case NodeKind::Ternary: {
        if (node.children.size() != 3) {
            return unsupported("malformed conditional operator", node);
        }
        Ternary ternary;
        if (auto err = lower_into(node.children[0], ternary.condition)) {
            return *err;
        }
        if (auto err = lower_into(node.children[1], ternary.if_true)) {
            return *err;
        }
        if (auto err = lower_into(node.children[2], ternary.if_false)) {
            return *err;
        }
        return NormalizedNode{std::move(ternary)};
    }

    case NodeKind::SafeDivision: {
        if (node.children.size() != 2) {
            return unsupported("malformed safe division", node);
        }
        SafeDivision div;
        if (auto err = lower_into(node.children[0], div.numerator)) {
            return *err;
        }
        if (auto err = lower_into(node.children[1], div.divisor)) {
            return *err;
        }
        return NormalizedNode{std::move(div)};
    }

    case NodeKind::FunctionCall: {
        if (node.children.size() != 1 || !node.children[0].is(NodeKind::ArgList)) {
            return unsupported("malformed function call", node);
        }
        FunctionCall call;
        call.name = node.content;
        if (auto err = lower_all(node.children[0].children, call.args)) {
            return *err;
        }
        return NormalizedNode{std::move(call)};
    }

    case NodeKind::FormattedPrint: {
        if (node.children.size() != 1 || !node.children[0].is(NodeKind::ArgList) ||
            node.children[0].children.empty()) {
            return unsupported("sprintf without a format", node);
        }
        const auto& items = node.children[0].children;
        FormattedPrint print;
        if (auto err = lower_into(items[0], print.format)) {
            return *err;
        }
        std::vector<Node> rest(items.begin() + 1, items.end());
        if (auto err = lower_all(rest, print.args)) {
            return *err;
        }
        return NormalizedNode{std::move(print)};
    }

    case NodeKind::ElementAccess: {
        if (node.children.size() != 1) {
            return unsupported("malformed element access", node);
        }
        ElementAccess elem;
        auto [ptr, ec] = std::from_chars(node.content.data(),
                                         node.content.data() + node.content.size(), elem.index);
        if (ec != std::errc{} || ptr != node.content.data() + node.content.size()) {
            return unsupported("non-constant element index", node);
        }
        if (auto err = lower_into(node.children[0], elem.subject)) {
            return *err;
        }
        return NormalizedNode{std::move(elem)};
    }

    case NodeKind::PostfixConditional: {
        if (node.children.size() != 2) {
            return unsupported("malformed statement modifier", node);
        }
        PostfixConditional post;
        post.negated = node.content == "unless";
        if (auto err = lower_into(node.children[0], post.body)) {
            return *err;
        }
        if (auto err = lower_into(node.children[1], post.predicate)) {
            return *err;
        }
        return NormalizedNode{std::move(post)};
    }

    case NodeKind::GuardedAssignment:
        return unsupported("assignment outside a conditional block", node);

    case NodeKind::ConditionalAssignment: {
        if (node.children.size() < 2) {
            return unsupported("conditional block without a result", node);
        }
        ConditionalAssignment block;
        for (size_t i = 0; i + 1 < node.children.size(); ++i) {
            GuardedAssignment guard;
            if (auto err = lower_guard(node.children[i], guard)) {
                return *err;
            }
            block.guards.push_back(std::move(guard));
        }
        if (auto err = lower_into(node.children.back(), block.result)) {
            return *err;
        }
        return NormalizedNode{std::move(block)};
    }
    }
    return unsupported("unknown node kind", node);
}

} // namespace exprc::ast
