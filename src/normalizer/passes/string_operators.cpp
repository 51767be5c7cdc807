// String Operators Pass Implementation

#include "normalizer/passes/string_operators.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

/// The operands at `first` and `last` are not claimed by a tighter (or, on the
/// left, equally tight) operator outside the span.
auto span_is_free(const std::vector<Node>& children, size_t first, size_t last, int power)
    -> bool {
    return left_binding_power(children, first) < power &&
           right_binding_power(children, last) <= power;
}

void erase_range(std::vector<Node>& children, size_t first, size_t last) {
    children.erase(children.begin() + static_cast<std::ptrdiff_t>(first),
                   children.begin() + static_cast<std::ptrdiff_t>(last));
}

void reduce_repetition(std::vector<Node>& children) {
    size_t i = 1;
    while (i + 1 < children.size()) {
        if (children[i].is_operator("x") && is_operand(children[i - 1]) &&
            is_operand(children[i + 1]) &&
            span_is_free(children, i - 1, i + 1, bp::MULTIPLICATIVE)) {
            std::vector<Node> operands;
            operands.push_back(std::move(children[i - 1]));
            operands.push_back(std::move(children[i + 1]));
            children[i - 1] = Node::branch(NodeKind::StringRepeat, "x", std::move(operands));
            erase_range(children, i, i + 2);
            continue; // "a" x 2 x 3
        }
        ++i;
    }
}

void reduce_concatenation(std::vector<Node>& children) {
    size_t start = 0;
    while (start + 2 < children.size()) {
        if (!is_operand(children[start]) || !children[start + 1].is_operator(".")) {
            ++start;
            continue;
        }

        size_t end = start;
        while (end + 2 < children.size() && children[end + 1].is_operator(".") &&
               is_operand(children[end + 2])) {
            end += 2;
        }
        if (end == start) {
            ++start;
            continue;
        }
        if (!span_is_free(children, start, end, bp::ADDITIVE)) {
            start = end + 1;
            continue;
        }

        std::vector<Node> parts;
        for (size_t k = start; k <= end; k += 2) {
            parts.push_back(std::move(children[k]));
        }
        children[start] = Node::branch(NodeKind::StringConcat, ".", std::move(parts));
        erase_range(children, start + 1, end + 1);
        ++start;
    }
}

} // namespace

auto StringOperatorsPass::transform(Node node) const -> Node {
    if (node.children.size() < 3) {
        return node;
    }
    reduce_repetition(node.children);
    reduce_concatenation(node.children);
    return node;
}

} // namespace exprc::normalizer
