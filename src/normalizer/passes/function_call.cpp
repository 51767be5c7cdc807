// Function Call Pass Implementation

#include "normalizer/passes/function_call.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_paren_args(const Node& node) -> bool {
    return node.is(NodeKind::ArgList) && node.content == "()";
}

/// `previous` is the token already emitted before `word`, if any.
auto is_callable_word(const Node& word, const Node* previous) -> bool {
    if (!word.is(NodeKind::Word) || is_keyword(word.content) || word.content == "sprintf") {
        return false;
    }
    // ->method(...)
    return previous == nullptr || !previous->is_operator("->");
}

auto make_call(std::string name, Node args) -> Node {
    std::vector<Node> children;
    children.push_back(std::move(args));
    return Node::branch(NodeKind::FunctionCall, std::move(name), std::move(children));
}

} // namespace

auto FunctionCallPass::transform(Node node) const -> Node {
    auto& children = node.children;
    if (children.size() < 2) {
        return node;
    }

    std::vector<Node> out;
    out.reserve(children.size());

    for (size_t i = 0; i < children.size(); ++i) {
        const Node* previous = out.empty() ? nullptr : &out.back();
        if (i + 1 < children.size() && is_callable_word(children[i], previous)) {
            Node& next = children[i + 1];
            if (is_paren_args(next)) {
                out.push_back(make_call(children[i].content, std::move(next)));
                ++i;
                continue;
            }
            // `int $val + 0.5` is int($val + 0.5): tighter operators stay for
            // the binary-operator pass to parse with the word as a prefix.
            if (is_named_unary(children[i].content) && is_operand(next) &&
                !next.is(NodeKind::ArgList) &&
                right_binding_power(children, i + 1) <= bp::NAMED_UNARY) {
                std::vector<Node> items;
                items.push_back(std::move(next));
                out.push_back(make_call(children[i].content,
                                        Node::branch(NodeKind::ArgList, "", std::move(items))));
                ++i;
                continue;
            }
        }
        out.push_back(std::move(children[i]));
    }

    children = std::move(out);
    return node;
}

} // namespace exprc::normalizer
