// Conditional Assignment Pass Implementation

#include "normalizer/passes/conditional_assignment.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto negate(Node condition) -> Node {
    std::vector<Node> children;
    children.push_back(std::move(condition));
    return Node::branch(NodeKind::UnaryOp, "!", std::move(children));
}

/// `COND and $x OP= VALUE [;]`
auto rewrite_statement(Node node) -> Node {
    auto& c = node.children;
    size_t count = c.size();
    if (count > 0 && c[count - 1].is(NodeKind::Punctuation) && c[count - 1].content == ";") {
        --count;
    }
    if (count != 5) {
        return node;
    }

    const Node& joiner = c[1];
    bool is_and = joiner.is_operator("and");
    bool is_or = joiner.is_operator("or");
    if (!is_operand(c[0]) || (!is_and && !is_or) || !c[2].is(NodeKind::Symbol) ||
        !c[3].is(NodeKind::Operator) || !is_assignment_operator(c[3].content) ||
        !is_operand(c[4])) {
        return node;
    }

    std::string op = c[3].content;
    Node condition = is_or ? negate(std::move(c[0])) : std::move(c[0]);
    std::vector<Node> parts;
    parts.push_back(std::move(condition));
    parts.push_back(std::move(c[2]));
    parts.push_back(std::move(c[4]));
    return Node::branch(NodeKind::GuardedAssignment, std::move(op), std::move(parts));
}

/// Guarded assignments followed by one result expression.
auto rewrite_document(Node node) -> Node {
    auto& c = node.children;
    if (c.size() < 2 || c.back().is(NodeKind::GuardedAssignment)) {
        return node;
    }
    for (size_t i = 0; i + 1 < c.size(); ++i) {
        if (!c[i].is(NodeKind::GuardedAssignment)) {
            return node;
        }
    }
    node.kind = NodeKind::ConditionalAssignment;
    return node;
}

} // namespace

auto ConditionalAssignmentPass::transform(Node node) const -> Node {
    switch (node.kind) {
    case NodeKind::Statement:
        return rewrite_statement(std::move(node));
    case NodeKind::Document:
        return rewrite_document(std::move(node));
    default:
        return node;
    }
}

} // namespace exprc::normalizer
