#include "ast/node_loader.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace exprc::ast {

namespace {

constexpr size_t MAX_TREE_DEPTH = 256;

struct ClassMapping {
    std::string_view upstream_class;
    NodeKind kind;
};

constexpr ClassMapping CLASS_TABLE[] = {
    {"PPI::Document", NodeKind::Document},
    {"PPI::Statement", NodeKind::Statement},
    {"PPI::Statement::Break", NodeKind::Statement},
    {"PPI::Statement::Variable", NodeKind::Statement},
    {"PPI::Statement::Expression", NodeKind::Expression},
    {"PPI::Structure::List", NodeKind::StructureList},
    {"PPI::Structure::Block", NodeKind::StructureBlock},
    {"PPI::Structure::Constructor", NodeKind::StructureBlock},
    {"PPI::Structure::Subscript", NodeKind::StructureSubscript},
    {"PPI::Token::Symbol", NodeKind::Symbol},
    {"PPI::Token::Magic", NodeKind::Symbol},
    {"PPI::Token::Cast", NodeKind::Cast},
    {"PPI::Token::Number", NodeKind::Number},
    {"PPI::Token::Number::Float", NodeKind::Number},
    {"PPI::Token::Number::Hex", NodeKind::Number},
    {"PPI::Token::Number::Exp", NodeKind::Number},
    {"PPI::Token::Number::Octal", NodeKind::Number},
    {"PPI::Token::Number::Binary", NodeKind::Number},
    {"PPI::Token::Quote::Double", NodeKind::Quote},
    {"PPI::Token::Quote::Single", NodeKind::Quote},
    {"PPI::Token::Quote::Literal", NodeKind::Quote},
    {"PPI::Token::Quote::Interpolate", NodeKind::Quote},
    {"PPI::Token::Regexp::Match", NodeKind::Regex},
    {"PPI::Token::QuoteLike::Regexp", NodeKind::Regex},
    {"PPI::Token::Operator", NodeKind::Operator},
    {"PPI::Token::Word", NodeKind::Word},
    {"PPI::Token::Structure", NodeKind::Punctuation},
    {"PPI::Token::Regexp::Substitute", NodeKind::Opaque},
    {"PPI::Token::Regexp::Transliterate", NodeKind::Opaque},
    {"PPI::Token::HereDoc", NodeKind::Opaque},
    {"PPI::Token::QuoteLike::Words", NodeKind::Opaque},
    {"PPI::Token::QuoteLike::Backtick", NodeKind::Opaque},
    {"PPI::Token::QuoteLike::Command", NodeKind::Opaque},
    {"PPI::Token::ArrayIndex", NodeKind::Opaque},
};

constexpr std::string_view DROPPED_CLASSES[] = {
    "PPI::Token::Whitespace", "PPI::Token::Comment", "PPI::Token::Pod",
    "PPI::Token::End",        "PPI::Token::Separator",
};

auto lookup_kind(std::string_view cls) -> std::optional<NodeKind> {
    for (const auto& entry : CLASS_TABLE) {
        if (entry.upstream_class == cls) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

auto is_dropped(std::string_view cls) -> bool {
    return std::find(std::begin(DROPPED_CLASSES), std::end(DROPPED_CLASSES), cls) !=
           std::end(DROPPED_CLASSES);
}

auto is_token_kind(NodeKind kind) -> bool {
    switch (kind) {
    case NodeKind::Document:
    case NodeKind::Statement:
    case NodeKind::Expression:
    case NodeKind::StructureList:
    case NodeKind::StructureBlock:
    case NodeKind::StructureSubscript:
        return false;
    default:
        return true;
    }
}

auto fail(std::string message, std::string_view cls) -> ParseInputError {
    return ParseInputError{std::move(message), std::string(cls)};
}

/// Body of a quote token without its delimiters: "x", 'x', q{x}, qq(x).
auto strip_quote_delimiters(std::string_view raw) -> std::string {
    size_t start = 0;
    if (raw.starts_with("qq")) {
        start = 2;
    } else if (raw.starts_with("q")) {
        start = 1;
    }
    if (raw.size() < start + 2) {
        return {};
    }
    return std::string(raw.substr(start + 1, raw.size() - start - 2));
}

/// Bare key of a hash/array subscript when it is a single word, string or integer.
auto subscript_key(const Node& subscript) -> std::string {
    const Node* inner = &subscript;
    while (inner->children.size() == 1 && !is_token_kind(inner->children[0].kind)) {
        inner = &inner->children[0];
    }
    if (inner->children.size() != 1) {
        return {};
    }
    const Node& key = inner->children[0];
    switch (key.kind) {
    case NodeKind::Word:
        return key.content;
    case NodeKind::Quote:
        return key.value;
    case NodeKind::Number:
        return key.value;
    default:
        return {};
    }
}

auto load_impl(const json::JsonValue& json, size_t depth) -> Result<Node, ParseInputError> {
    if (depth > MAX_TREE_DEPTH) {
        return fail("tree exceeds maximum depth of " + std::to_string(MAX_TREE_DEPTH), "");
    }
    if (!json.is_object()) {
        return fail("node is not a JSON object", "");
    }

    auto cls = json.get_string("class");
    if (!cls) {
        return fail("node has no 'class'", "");
    }
    auto kind = lookup_kind(*cls);
    if (!kind) {
        return fail("unknown node class '" + *cls + "'", *cls);
    }

    Node node;
    node.kind = *kind;

    const json::JsonValue* children = json.get("children");
    if (children != nullptr && !children->is_null() && !children->is_array()) {
        return fail("'children' is not an array", *cls);
    }

    if (is_token_kind(node.kind)) {
        if (children != nullptr && children->is_array() && children->size() > 0) {
            return fail("token node has children", *cls);
        }

        auto content = json.get_string("content");
        if (!content && node.kind == NodeKind::Number) {
            const json::JsonValue* numeric = json.get("numeric_value");
            if (numeric != nullptr && numeric->is_number()) {
                content = numeric->to_string();
            }
        }
        if (!content || content->empty()) {
            return fail("token node has no content", *cls);
        }
        node.content = *content;

        switch (node.kind) {
        case NodeKind::Number:
            node.value = decimal_spelling(node.content);
            if (node.value.empty()) {
                return fail("malformed number '" + node.content + "'", *cls);
            }
            break;
        case NodeKind::Quote:
            node.value = json.get_string("string_value").value_or(strip_quote_delimiters(*content));
            break;
        case NodeKind::Regex: {
            std::string pattern;
            std::string modifiers;
            if (!split_regex_literal(*content, pattern, modifiers)) {
                return fail("malformed regex literal '" + *content + "'", *cls);
            }
            node.content = modifiers;
            node.value = pattern;
            break;
        }
        case NodeKind::Opaque:
            node.value = *cls;
            break;
        default:
            break;
        }
        return node;
    }

    if (children != nullptr && children->is_array()) {
        for (const auto& child_json : children->as_array()) {
            if (child_json.is_object()) {
                auto child_cls = child_json.get_string("class");
                if (child_cls && is_dropped(*child_cls)) {
                    continue;
                }
            }
            auto child = load_impl(child_json, depth + 1);
            if (is_err(child)) {
                return child;
            }
            node.children.push_back(std::move(unwrap(child)));
        }
    }

    std::string bounds =
        json.get_string("structure_bounds").value_or(json.get_string("content").value_or(""));
    switch (node.kind) {
    case NodeKind::Document:
        if (node.children.empty()) {
            return fail("empty document", *cls);
        }
        break;
    case NodeKind::StructureList:
        node.content = "()";
        break;
    case NodeKind::StructureBlock:
        node.content = bounds.starts_with("[") ? "[]" : "{}";
        break;
    case NodeKind::StructureSubscript:
        node.content = bounds.starts_with("[") ? "[]" : "{}";
        node.value = subscript_key(node);
        break;
    default:
        break;
    }
    return node;
}

} // namespace

auto split_regex_literal(std::string_view literal, std::string& pattern, std::string& modifiers)
    -> bool {
    size_t pos = 0;
    if (literal.starts_with("qr") && literal.size() > 2 &&
        !std::isalnum(static_cast<unsigned char>(literal[2]))) {
        pos = 2;
    } else if (literal.starts_with("m") && literal.size() > 1 &&
               !std::isalnum(static_cast<unsigned char>(literal[1]))) {
        pos = 1;
    }
    if (pos >= literal.size()) {
        return false;
    }

    char open = literal[pos];
    char close = open;
    switch (open) {
    case '(':
        close = ')';
        break;
    case '{':
        close = '}';
        break;
    case '[':
        close = ']';
        break;
    case '<':
        close = '>';
        break;
    default:
        break;
    }

    pattern.clear();
    int nesting = 0;
    size_t i = pos + 1;
    for (; i < literal.size(); ++i) {
        char c = literal[i];
        if (c == '\\' && i + 1 < literal.size()) {
            // An escaped delimiter is part of the pattern, minus the escape
            if (literal[i + 1] != open && literal[i + 1] != close) {
                pattern += c;
            }
            pattern += literal[++i];
            continue;
        }
        if (open != close && c == open) {
            ++nesting;
        } else if (c == close) {
            if (nesting == 0) {
                break;
            }
            --nesting;
        }
        pattern += c;
    }
    if (i >= literal.size()) {
        return false;
    }

    modifiers = std::string(literal.substr(i + 1));
    return std::all_of(modifiers.begin(), modifiers.end(),
                       [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
}

auto load_node(const json::JsonValue& json) -> Result<Node, ParseInputError> {
    return load_impl(json, 0);
}

} // namespace exprc::ast
