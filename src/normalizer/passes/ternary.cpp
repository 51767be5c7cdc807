// Ternary Pass Implementation

#include "normalizer/passes/ternary.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_expression_operator(const Node& node) -> bool {
    return node.is(NodeKind::Operator) &&
           (binary_operator(node.content) != nullptr || is_prefix_operator(node.content));
}

/// `children[q]` is a `?` with single-node parts and nothing tighter around them.
auto is_reducible(const std::vector<Node>& children, size_t q) -> bool {
    if (q == 0 || q + 3 >= children.size()) {
        return false;
    }
    if (!is_operand(children[q - 1]) || !is_operand(children[q + 1]) ||
        !children[q + 2].is_operator(":") || !is_operand(children[q + 3])) {
        return false;
    }
    if (q >= 2 && is_expression_operator(children[q - 2])) {
        return false;
    }
    return q + 4 >= children.size() || !is_expression_operator(children[q + 4]);
}

} // namespace

auto TernaryPass::transform(Node node) const -> Node {
    auto& children = node.children;

    while (true) {
        size_t q = children.size();
        for (size_t k = children.size(); k-- > 0;) {
            if (children[k].is_operator("?")) {
                q = k;
                break;
            }
        }
        if (q == children.size() || !is_reducible(children, q)) {
            break;
        }

        std::vector<Node> parts;
        parts.push_back(std::move(children[q - 1]));
        parts.push_back(std::move(children[q + 1]));
        parts.push_back(std::move(children[q + 3]));
        children[q - 1] = Node::branch(NodeKind::Ternary, "?:", std::move(parts));
        children.erase(children.begin() + static_cast<std::ptrdiff_t>(q),
                       children.begin() + static_cast<std::ptrdiff_t>(q + 4));
    }
    return node;
}

} // namespace exprc::normalizer
