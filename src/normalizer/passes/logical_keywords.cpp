// Logical Keywords Pass Implementation

#include "normalizer/passes/logical_keywords.hpp"

#include <optional>

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_boundary(const Node& node) -> bool {
    return (node.is(NodeKind::Punctuation) && node.content == ";") || node.is_word("if") ||
           node.is_word("unless") || node.is_operator(",") || node.is_operator("=>");
}

auto is_keyword_operator(const Node& node) -> bool {
    return node.is_operator("not") ||
           (node.is(NodeKind::Operator) && low_logical_operator(node.content) != nullptr);
}

class KeywordParser {
public:
    explicit KeywordParser(std::vector<Node> tokens) : tokens_(std::move(tokens)) {}

    auto parse() -> std::optional<Node> {
        auto node = parse_expression(0);
        if (!node || pos_ != tokens_.size()) {
            return std::nullopt;
        }
        return node;
    }

private:
    auto parse_expression(int min_power) -> std::optional<Node> {
        auto lhs = parse_prefix();
        while (lhs && pos_ < tokens_.size()) {
            const OperatorInfo* info = low_logical_operator(tokens_[pos_].content);
            if (info == nullptr || !tokens_[pos_].is(NodeKind::Operator)) {
                return std::nullopt;
            }
            if (info->binding_power < min_power) {
                break;
            }
            std::string op = tokens_[pos_].content;
            ++pos_;
            auto rhs = parse_expression(info->binding_power + 1);
            if (!rhs) {
                return std::nullopt;
            }
            std::vector<Node> children;
            children.push_back(std::move(*lhs));
            children.push_back(std::move(*rhs));
            lhs = Node::branch(NodeKind::BinaryOp, op, std::move(children));
        }
        return lhs;
    }

    auto parse_prefix() -> std::optional<Node> {
        if (pos_ >= tokens_.size()) {
            return std::nullopt;
        }
        Node& tok = tokens_[pos_];
        if (tok.is_operator("not")) {
            ++pos_;
            auto operand = parse_expression(bp::LOW_NOT);
            if (!operand) {
                return std::nullopt;
            }
            std::vector<Node> children;
            children.push_back(std::move(*operand));
            return Node::branch(NodeKind::UnaryOp, "not", std::move(children));
        }
        if (is_operand(tok)) {
            ++pos_;
            return std::move(tok);
        }
        return std::nullopt;
    }

    std::vector<Node> tokens_;
    size_t pos_ = 0;
};

} // namespace

auto LogicalKeywordsPass::transform(Node node) const -> Node {
    auto& children = node.children;
    std::vector<Node> out;
    out.reserve(children.size());

    size_t i = 0;
    while (i < children.size()) {
        if (is_boundary(children[i])) {
            out.push_back(std::move(children[i++]));
            continue;
        }

        size_t end = i;
        bool has_keyword = false;
        bool parseable = true;
        while (end < children.size() && !is_boundary(children[end])) {
            const Node& tok = children[end];
            has_keyword = has_keyword || is_keyword_operator(tok);
            // Assignments under `and`/`or` belong to the conditional assignment pass
            parseable = parseable && (is_operand(tok) || is_keyword_operator(tok));
            ++end;
        }

        std::optional<Node> reduced;
        if (has_keyword && parseable) {
            KeywordParser parser(std::vector<Node>(
                children.begin() + static_cast<std::ptrdiff_t>(i),
                children.begin() + static_cast<std::ptrdiff_t>(end)));
            reduced = parser.parse();
        }

        if (reduced) {
            out.push_back(std::move(*reduced));
        } else {
            for (size_t k = i; k < end; ++k) {
                out.push_back(std::move(children[k]));
            }
        }
        i = end;
    }

    children = std::move(out);
    return node;
}

} // namespace exprc::normalizer
