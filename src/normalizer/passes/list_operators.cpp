// List Operators Pass Implementation

#include "normalizer/passes/list_operators.hpp"

#include <optional>

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_comma(const Node& node) -> bool {
    return node.is_operator(",") || node.is_operator("=>");
}

auto is_terminator(const Node& node) -> bool {
    return node.is(NodeKind::Punctuation) && node.content == ";";
}

/// Ends the argument list of a list operator written without parentheses.
auto ends_list(const Node& node) -> bool {
    if (is_terminator(node) || node.is_word("if") || node.is_word("unless")) {
        return true;
    }
    return node.is(NodeKind::Operator) &&
           (node.content == "not" || low_logical_operator(node.content) != nullptr);
}

/// Splits `[first, last)` at commas; every item must be a single operand.
/// A trailing comma is allowed.
auto split_items(std::vector<Node>& children, size_t first, size_t last)
    -> std::optional<std::vector<Node>> {
    std::vector<Node> items;
    bool expect_item = true;
    for (size_t k = first; k < last; ++k) {
        Node& child = children[k];
        if (is_comma(child)) {
            if (expect_item) {
                return std::nullopt;
            }
            expect_item = true;
            continue;
        }
        if (!expect_item || !is_operand(child)) {
            return std::nullopt;
        }
        items.push_back(child);
        expect_item = false;
    }
    if (items.empty()) {
        return std::nullopt;
    }
    return items;
}

auto make_args(std::vector<Node> items, std::string bounds) -> Node {
    return Node::branch(NodeKind::ArgList, std::move(bounds), std::move(items));
}

/// `join ",", unpack "C*", $val`: rightmost operator first, so the inner call
/// becomes a single argument of the outer one.
void reduce_rightward_calls(std::vector<Node>& children) {
    size_t limit = children.size();
    while (true) {
        size_t k = limit;
        while (k-- > 0) {
            if (children[k].is(NodeKind::Word) && is_list_operator(children[k].content) &&
                k + 1 < children.size() && !children[k + 1].is(NodeKind::ArgList)) {
                break;
            }
        }
        if (k >= limit) {
            return;
        }

        size_t end = k + 1;
        while (end < children.size() && !ends_list(children[end])) {
            ++end;
        }

        auto items = split_items(children, k + 1, end);
        if (!items) {
            limit = k;
            continue;
        }

        NodeKind kind =
            children[k].content == "sprintf" ? NodeKind::FormattedPrint : NodeKind::FunctionCall;
        std::vector<Node> call_children;
        call_children.push_back(make_args(std::move(*items), ""));
        children[k] = Node::branch(kind, children[k].content, std::move(call_children));
        children.erase(children.begin() + static_cast<std::ptrdiff_t>(k + 1),
                       children.begin() + static_cast<std::ptrdiff_t>(end));
        limit = k;
    }
}

auto has_top_level_comma(const std::vector<Node>& children) -> bool {
    for (const auto& child : children) {
        if (is_comma(child)) {
            return true;
        }
    }
    return false;
}

} // namespace

auto ListOperatorsPass::transform(Node node) const -> Node {
    reduce_rightward_calls(node.children);

    switch (node.kind) {
    case NodeKind::Expression:
    case NodeKind::Statement: {
        if (!has_top_level_comma(node.children)) {
            return node;
        }
        size_t end = node.children.size();
        if (end > 0 && is_terminator(node.children[end - 1])) {
            --end;
        }
        auto items = split_items(node.children, 0, end);
        if (!items) {
            return node;
        }
        return make_args(std::move(*items), "");
    }

    case NodeKind::StructureList: {
        if (node.children.empty()) {
            return make_args({}, "()");
        }
        if (node.children.size() != 1) {
            return node;
        }
        Node inner = std::move(node.children[0]);
        if (inner.is(NodeKind::ArgList)) {
            inner.content = "()";
            return inner;
        }
        if (inner.is(NodeKind::Expression) && inner.children.size() == 1) {
            Node only = std::move(inner.children[0]);
            inner = std::move(only);
        }
        std::vector<Node> items;
        items.push_back(std::move(inner));
        return make_args(std::move(items), "()");
    }

    default:
        return node;
    }
}

} // namespace exprc::normalizer
