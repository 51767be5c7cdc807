// Postfix Conditional Pass Implementation

#include "normalizer/passes/postfix_conditional.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

auto PostfixConditionalPass::transform(Node node) const -> Node {
    if (!node.is(NodeKind::Statement)) {
        return node;
    }

    auto& c = node.children;
    size_t end = c.size();
    if (end > 0 && c[end - 1].is(NodeKind::Punctuation) && c[end - 1].content == ";") {
        --end;
    }
    size_t begin = (end > 0 && c[0].is_word("return")) ? 1 : 0;
    if (end < begin + 3) {
        return node;
    }

    const Node& modifier = c[end - 2];
    if (!(modifier.is_word("if") || modifier.is_word("unless")) || !is_operand(c[end - 1])) {
        return node;
    }
    bool negated = modifier.is_word("unless");
    size_t body_size = end - 2 - begin;

    if (body_size == 1 && is_operand(c[begin])) {
        std::vector<Node> parts;
        parts.push_back(std::move(c[begin]));
        parts.push_back(std::move(c[end - 1]));
        return Node::branch(NodeKind::PostfixConditional, negated ? "unless" : "if",
                            std::move(parts));
    }

    // $x OP= VALUE if PRED
    if (begin == 0 && body_size == 3 && c[0].is(NodeKind::Symbol) &&
        c[1].is(NodeKind::Operator) && is_assignment_operator(c[1].content) &&
        is_operand(c[2])) {
        Node condition = std::move(c[end - 1]);
        if (negated) {
            std::vector<Node> operand;
            operand.push_back(std::move(condition));
            condition = Node::branch(NodeKind::UnaryOp, "!", std::move(operand));
        }
        std::string op = c[1].content;
        std::vector<Node> parts;
        parts.push_back(std::move(condition));
        parts.push_back(std::move(c[0]));
        parts.push_back(std::move(c[2]));
        return Node::branch(NodeKind::GuardedAssignment, std::move(op), std::move(parts));
    }
    return node;
}

} // namespace exprc::normalizer
