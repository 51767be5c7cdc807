#include "normalizer/operator_table.hpp"

#include <algorithm>
#include <iterator>

namespace exprc::normalizer {

namespace {

constexpr OperatorInfo BINARY_OPERATORS[] = {
    {"**", bp::POWER, Assoc::Right},
    {"=~", bp::BINDING, Assoc::Left},
    {"!~", bp::BINDING, Assoc::Left},
    {"*", bp::MULTIPLICATIVE, Assoc::Left},
    {"/", bp::MULTIPLICATIVE, Assoc::Left},
    {"%", bp::MULTIPLICATIVE, Assoc::Left},
    {"x", bp::MULTIPLICATIVE, Assoc::Left},
    {"+", bp::ADDITIVE, Assoc::Left},
    {"-", bp::ADDITIVE, Assoc::Left},
    {".", bp::ADDITIVE, Assoc::Left},
    {"<<", bp::SHIFT, Assoc::Left},
    {">>", bp::SHIFT, Assoc::Left},
    {"<", bp::RELATIONAL, Assoc::NonAssoc},
    {">", bp::RELATIONAL, Assoc::NonAssoc},
    {"<=", bp::RELATIONAL, Assoc::NonAssoc},
    {">=", bp::RELATIONAL, Assoc::NonAssoc},
    {"lt", bp::RELATIONAL, Assoc::NonAssoc},
    {"gt", bp::RELATIONAL, Assoc::NonAssoc},
    {"le", bp::RELATIONAL, Assoc::NonAssoc},
    {"ge", bp::RELATIONAL, Assoc::NonAssoc},
    {"==", bp::EQUALITY, Assoc::NonAssoc},
    {"!=", bp::EQUALITY, Assoc::NonAssoc},
    {"<=>", bp::EQUALITY, Assoc::NonAssoc},
    {"eq", bp::EQUALITY, Assoc::NonAssoc},
    {"ne", bp::EQUALITY, Assoc::NonAssoc},
    {"cmp", bp::EQUALITY, Assoc::NonAssoc},
    {"&", bp::BIT_AND, Assoc::Left},
    {"|", bp::BIT_OR, Assoc::Left},
    {"^", bp::BIT_OR, Assoc::Left},
    {"&&", bp::LOGICAL_AND, Assoc::Left},
    {"||", bp::LOGICAL_OR, Assoc::Left},
    {"//", bp::LOGICAL_OR, Assoc::Left},
};

constexpr OperatorInfo LOW_LOGICAL_OPERATORS[] = {
    {"and", bp::LOW_AND, Assoc::Left},
    {"or", bp::LOW_OR, Assoc::Left},
    {"xor", bp::LOW_OR, Assoc::Left},
};

constexpr std::string_view PREFIX_OPERATORS[] = {"!", "~", "\\", "+", "-"};

constexpr std::string_view ASSIGNMENT_OPERATORS[] = {
    "=", "+=", "-=", "*=", "/=", ".=", "%=", "x=", "**=", "&=", "|=", "^=", "<<=", ">>=",
    "&&=", "||=", "//=",
};

constexpr std::string_view NAMED_UNARY[] = {
    "length", "int", "abs", "sqrt", "hex", "oct", "ord", "chr", "uc", "lc",
    "ucfirst", "lcfirst", "defined", "exp", "log", "sin", "cos",
};

constexpr std::string_view LIST_OPERATORS[] = {
    "join", "split", "unpack", "pack", "sprintf", "substr", "index", "atan2",
};

constexpr std::string_view KEYWORDS[] = {
    "if", "unless", "and", "or", "not", "xor", "return", "my", "undef", "else", "elsif",
    "eq", "ne", "lt", "gt", "le", "ge", "cmp", "x",
};

template <typename Range> auto contains(const Range& range, std::string_view text) -> bool {
    return std::find(std::begin(range), std::end(range), text) != std::end(range);
}

template <typename Range> auto find_info(const Range& range, std::string_view text)
    -> const OperatorInfo* {
    for (const auto& info : range) {
        if (info.text == text) {
            return &info;
        }
    }
    return nullptr;
}

} // namespace

auto binary_operator(std::string_view text) -> const OperatorInfo* {
    return find_info(BINARY_OPERATORS, text);
}

auto low_logical_operator(std::string_view text) -> const OperatorInfo* {
    return find_info(LOW_LOGICAL_OPERATORS, text);
}

auto is_prefix_operator(std::string_view text) -> bool {
    return contains(PREFIX_OPERATORS, text);
}

auto is_assignment_operator(std::string_view text) -> bool {
    return contains(ASSIGNMENT_OPERATORS, text);
}

auto is_named_unary(std::string_view word) -> bool {
    return contains(NAMED_UNARY, word);
}

auto is_list_operator(std::string_view word) -> bool {
    return contains(LIST_OPERATORS, word);
}

auto is_keyword(std::string_view word) -> bool {
    return contains(KEYWORDS, word);
}

// ============================================================================
// Token classification
// ============================================================================

auto is_operand(const ast::Node& node) -> bool {
    using ast::NodeKind;
    switch (node.kind) {
    case NodeKind::Symbol:
    case NodeKind::Number:
    case NodeKind::Quote:
    case NodeKind::Regex:
        return true;
    case NodeKind::Word:
        return node.content == "undef";
    case NodeKind::ArgList:
        return node.content == "()";
    case NodeKind::GuardedAssignment:
    case NodeKind::ConditionalAssignment:
        return false;
    default:
        return ast::is_canonical_kind(node.kind);
    }
}

auto is_infix_position(const std::vector<ast::Node>& children, size_t index) -> bool {
    return index > 0 && index + 1 < children.size() && is_operand(children[index - 1]);
}

auto left_binding_power(const std::vector<ast::Node>& children, size_t index) -> int {
    if (index == 0) {
        return -1;
    }
    const ast::Node& prev = children[index - 1];
    if (!prev.is(ast::NodeKind::Operator)) {
        return -1;
    }
    if (index >= 2 && is_operand(children[index - 2])) {
        const OperatorInfo* info = binary_operator(prev.content);
        return info != nullptr ? info->binding_power : -1;
    }
    return is_prefix_operator(prev.content) ? bp::UNARY : -1;
}

auto right_binding_power(const std::vector<ast::Node>& children, size_t index) -> int {
    if (index + 1 >= children.size()) {
        return -1;
    }
    const ast::Node& next = children[index + 1];
    if (!next.is(ast::NodeKind::Operator)) {
        return -1;
    }
    const OperatorInfo* info = binary_operator(next.content);
    return info != nullptr ? info->binding_power : -1;
}

} // namespace exprc::normalizer
