// Formatted Print Pass Implementation

#include "normalizer/passes/formatted_print.hpp"

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

auto FormattedPrintPass::transform(Node node) const -> Node {
    auto& children = node.children;
    if (children.size() < 2) {
        return node;
    }

    std::vector<Node> out;
    out.reserve(children.size());

    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i].is_word("sprintf") && i + 1 < children.size() &&
            children[i + 1].is(NodeKind::ArgList) && children[i + 1].content == "()" &&
            !children[i + 1].children.empty()) {
            std::vector<Node> args;
            args.push_back(std::move(children[i + 1]));
            out.push_back(Node::branch(NodeKind::FormattedPrint, "sprintf", std::move(args)));
            ++i;
            continue;
        }
        out.push_back(std::move(children[i]));
    }

    children = std::move(out);
    return node;
}

} // namespace exprc::normalizer
