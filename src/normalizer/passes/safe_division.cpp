// Safe Division Pass Implementation

#include "normalizer/passes/safe_division.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

constexpr size_t IDIOM_LENGTH = 7; // C ? N / D : 0

/// Tokens that end an expression on the left, so nothing can claim the guard symbol.
auto opens_expression(const std::vector<Node>& children, size_t start) -> bool {
    if (start == 0) {
        return true;
    }
    const Node& prev = children[start - 1];
    switch (prev.kind) {
    case NodeKind::Operator:
        return prev.content == "?" || prev.content == ":" || prev.content == "," ||
               prev.content == "=>" || prev.content == "not" ||
               low_logical_operator(prev.content) != nullptr ||
               is_assignment_operator(prev.content);
    case NodeKind::Word:
        return prev.content == "return" || prev.content == "if" || prev.content == "unless";
    case NodeKind::Punctuation:
        return true;
    default:
        return false;
    }
}

auto closes_expression(const std::vector<Node>& children, size_t end) -> bool {
    if (end >= children.size()) {
        return true;
    }
    const Node& next = children[end];
    switch (next.kind) {
    case NodeKind::Operator:
        return next.content == ":" || next.content == "," || next.content == "=>" ||
               low_logical_operator(next.content) != nullptr;
    case NodeKind::Word:
        return next.content == "if" || next.content == "unless";
    case NodeKind::Punctuation:
        return next.content == ";";
    default:
        return false;
    }
}

auto matches_idiom(const std::vector<Node>& c, size_t k) -> bool {
    if (k + IDIOM_LENGTH > c.size()) {
        return false;
    }
    const Node& guard = c[k];
    const Node& numerator = c[k + 2];
    const Node& divisor = c[k + 4];
    const Node& fallback = c[k + 6];
    return guard.is(NodeKind::Symbol) && c[k + 1].is_operator("?") &&
           (numerator.is(NodeKind::Number) || numerator.is(NodeKind::Symbol)) &&
           c[k + 3].is_operator("/") && divisor.is(NodeKind::Symbol) &&
           divisor.content == guard.content && c[k + 5].is_operator(":") &&
           fallback.is(NodeKind::Number) && fallback.value == "0";
}

} // namespace

auto SafeDivisionPass::transform(Node node) const -> Node {
    auto& children = node.children;

    for (size_t k = 0; k + IDIOM_LENGTH <= children.size(); ++k) {
        if (!matches_idiom(children, k) || !opens_expression(children, k) ||
            !closes_expression(children, k + IDIOM_LENGTH)) {
            continue;
        }
        std::vector<Node> operands;
        operands.push_back(std::move(children[k + 2]));
        operands.push_back(std::move(children[k + 4]));
        children[k] = Node::branch(NodeKind::SafeDivision, "", std::move(operands));
        children.erase(children.begin() + static_cast<std::ptrdiff_t>(k + 1),
                       children.begin() + static_cast<std::ptrdiff_t>(k + IDIOM_LENGTH));
    }
    return node;
}

} // namespace exprc::normalizer
