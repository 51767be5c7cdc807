// Element Access Pass Implementation

#include "normalizer/passes/element_access.hpp"

#include <algorithm>
#include <cctype>

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_integer_key(const std::string& key) -> bool {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

auto ElementAccessPass::transform(Node node) const -> Node {
    if (node.children.size() < 2) {
        return node;
    }

    std::vector<Node> out;
    out.reserve(node.children.size());

    for (auto& child : node.children) {
        if (!child.is(NodeKind::StructureSubscript) || child.value.empty() || out.empty()) {
            out.push_back(std::move(child));
            continue;
        }

        const std::string& key = child.value;
        size_t n = out.size();
        Node& last = out.back();

        if (child.content == "{}") {
            // $$name{key}
            if (n >= 2 && last.is(NodeKind::Symbol) && out[n - 2].is(NodeKind::Cast) &&
                out[n - 2].content == "$") {
                std::string folded = "$" + last.content + "{" + key + "}";
                out.pop_back();
                out.back() = ast::sym(std::move(folded));
                continue;
            }
            // $self->{key}
            if (n >= 2 && last.is_operator("->") && out[n - 2].is(NodeKind::Symbol) &&
                out[n - 2].content == "$self") {
                out.pop_back();
                out.back() = ast::sym("$$self{" + key + "}");
                continue;
            }
            // $$self{A}{B}
            if (last.is(NodeKind::Symbol) && last.content.starts_with("$$")) {
                last.content += "{" + key + "}";
                continue;
            }
        } else if (last.is(NodeKind::Symbol) && !last.content.starts_with("$$") &&
                   is_integer_key(key)) {
            Node subject = std::move(last);
            std::vector<Node> children;
            children.push_back(std::move(subject));
            out.back() = Node::branch(NodeKind::ElementAccess, key, std::move(children));
            continue;
        }

        out.push_back(std::move(child));
    }

    node.children = std::move(out);
    return node;
}

} // namespace exprc::normalizer
