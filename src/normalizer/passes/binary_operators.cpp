// Binary Operators Pass Implementation
//
// Each run of operands and operators is parsed with precedence climbing.
// Concatenation goes through a factory that extends a concat built earlier in
// the same run, so `a . b . c` comes out as one n-ary node. A bare named
// unary left by FunctionCallPass is a prefix operator at NAMED_UNARY.

#include "normalizer/passes/binary_operators.hpp"

#include <optional>

namespace exprc::normalizer {

using ast::Node;
using ast::NodeKind;

namespace {

auto is_expression_operator(const Node& node) -> bool {
    return node.is(NodeKind::Operator) &&
           (binary_operator(node.content) != nullptr || is_prefix_operator(node.content));
}

auto is_bare_named_unary(const Node& node) -> bool {
    return node.is(NodeKind::Word) && is_named_unary(node.content);
}

auto belongs_to_run(const Node& node) -> bool {
    return is_operand(node) || is_expression_operator(node) || is_bare_named_unary(node);
}

class RunParser {
public:
    explicit RunParser(std::vector<Node> tokens) : tokens_(std::move(tokens)) {}

    /// The whole run as one node, or nullopt when it does not parse.
    auto parse() -> std::optional<Node> {
        auto term = parse_expression(0);
        if (!term || pos_ != tokens_.size()) {
            return std::nullopt;
        }
        return std::move(term->node);
    }

private:
    struct Term {
        Node node;
        bool open_concat = false; ///< Concat built in this run, may be extended
    };

    auto parse_expression(int min_power) -> std::optional<Term> {
        auto lhs = parse_prefix();
        if (!lhs) {
            return std::nullopt;
        }

        while (pos_ < tokens_.size()) {
            const Node& tok = tokens_[pos_];
            const OperatorInfo* info =
                tok.is(NodeKind::Operator) ? binary_operator(tok.content) : nullptr;
            if (info == nullptr) {
                return std::nullopt;
            }
            if (info->binding_power < min_power) {
                break;
            }
            std::string op = tok.content;
            ++pos_;

            int next_min =
                info->assoc == Assoc::Right ? info->binding_power : info->binding_power + 1;
            auto rhs = parse_expression(next_min);
            if (!rhs) {
                return std::nullopt;
            }
            lhs = combine(op, std::move(*lhs), std::move(*rhs));
        }
        return lhs;
    }

    auto parse_prefix() -> std::optional<Term> {
        if (pos_ >= tokens_.size()) {
            return std::nullopt;
        }
        Node& tok = tokens_[pos_];
        if (tok.is(NodeKind::Operator) && is_prefix_operator(tok.content)) {
            std::string op = tok.content;
            ++pos_;
            auto operand = parse_expression(bp::UNARY);
            if (!operand) {
                return std::nullopt;
            }
            std::vector<Node> children;
            children.push_back(std::move(operand->node));
            return Term{Node::branch(NodeKind::UnaryOp, op, std::move(children))};
        }
        if (is_bare_named_unary(tok)) {
            std::string name = tok.content;
            ++pos_;
            auto operand = parse_expression(bp::NAMED_UNARY + 1);
            if (!operand) {
                return std::nullopt;
            }
            std::vector<Node> items;
            items.push_back(std::move(operand->node));
            std::vector<Node> children;
            children.push_back(Node::branch(NodeKind::ArgList, "", std::move(items)));
            return Term{Node::branch(NodeKind::FunctionCall, name, std::move(children))};
        }
        if (is_operand(tok)) {
            ++pos_;
            return Term{std::move(tok)};
        }
        return std::nullopt;
    }

    static auto combine(const std::string& op, Term lhs, Term rhs) -> Term {
        if (op == "." && lhs.open_concat) {
            lhs.node.children.push_back(std::move(rhs.node));
            return lhs;
        }

        std::vector<Node> children;
        children.push_back(std::move(lhs.node));
        children.push_back(std::move(rhs.node));
        if (op == ".") {
            return Term{Node::branch(NodeKind::StringConcat, ".", std::move(children)), true};
        }
        if (op == "x") {
            return Term{Node::branch(NodeKind::StringRepeat, "x", std::move(children))};
        }
        return Term{Node::branch(NodeKind::BinaryOp, op, std::move(children))};
    }

    std::vector<Node> tokens_;
    size_t pos_ = 0;
};

} // namespace

auto BinaryOperatorsPass::transform(Node node) const -> Node {
    auto& children = node.children;
    std::vector<Node> out;
    out.reserve(children.size());

    size_t i = 0;
    while (i < children.size()) {
        if (!belongs_to_run(children[i])) {
            out.push_back(std::move(children[i++]));
            continue;
        }

        size_t end = i;
        bool has_operator = false;
        while (end < children.size() && belongs_to_run(children[end])) {
            has_operator = has_operator || is_expression_operator(children[end]) ||
                           is_bare_named_unary(children[end]);
            ++end;
        }

        std::optional<Node> reduced;
        if (has_operator && end - i > 1) {
            RunParser parser(std::vector<Node>(children.begin() + static_cast<std::ptrdiff_t>(i),
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
