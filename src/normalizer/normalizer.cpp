#include "normalizer/normalizer.hpp"

#include "log/log.hpp"
#include "normalizer/passes/binary_operators.hpp"
#include "normalizer/passes/conditional_assignment.hpp"
#include "normalizer/passes/element_access.hpp"
#include "normalizer/passes/formatted_print.hpp"
#include "normalizer/passes/function_call.hpp"
#include "normalizer/passes/list_operators.hpp"
#include "normalizer/passes/logical_keywords.hpp"
#include "normalizer/passes/postfix_conditional.hpp"
#include "normalizer/passes/safe_division.hpp"
#include "normalizer/passes/string_operators.hpp"
#include "normalizer/passes/ternary.hpp"

#include <algorithm>

namespace exprc::normalizer {

namespace {

auto describe(const NormalizerPass& pass) -> std::string {
    return pass.name() + " (" + tier_name(pass.tier()) + ", " +
           std::to_string(pass.binding_power()) + ")";
}

} // namespace

auto Normalizer::standard() -> Normalizer {
    Normalizer normalizer;
    configure_standard_passes(normalizer);
    return normalizer;
}

void Normalizer::add_pass(std::unique_ptr<NormalizerPass> pass) {
    passes_.push_back(std::move(pass));
    std::stable_sort(passes_.begin(), passes_.end(),
                     [](const auto& a, const auto& b) { return runs_before(*a, *b); });
}

auto Normalizer::pass_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(passes_.size());
    for (const auto& pass : passes_) {
        names.push_back(pass->name());
    }
    return names;
}

auto Normalizer::normalize(const ast::Node& root) const -> ast::Node {
    ast::Node result = normalize_node(root);
    EXPRC_LOG_TRACE("normalize", ast::to_sexpr(root) << " => " << ast::to_sexpr(result));
    return result;
}

auto Normalizer::normalize_node(ast::Node node) const -> ast::Node {
    for (auto& child : node.children) {
        child = normalize_node(std::move(child));
    }

    const NormalizerPass* previous = nullptr;
    for (const auto& pass : passes_) {
        if (previous != nullptr && runs_before(*pass, *previous)) {
            throw InternalCompilerError(InternalErrorKind::PrecedenceInvariantViolation,
                                        "pass " + describe(*pass) + " ran after " +
                                            describe(*previous));
        }
        node = pass->transform(std::move(node));
        previous = pass.get();
    }
    return node;
}

void configure_standard_passes(Normalizer& normalizer) {
    // High tier
    normalizer.add_pass(std::make_unique<ElementAccessPass>());
    normalizer.add_pass(std::make_unique<FunctionCallPass>());
    normalizer.add_pass(std::make_unique<FormattedPrintPass>());
    normalizer.add_pass(std::make_unique<SafeDivisionPass>());
    normalizer.add_pass(std::make_unique<StringOperatorsPass>());

    // Medium tier
    normalizer.add_pass(std::make_unique<BinaryOperatorsPass>());
    normalizer.add_pass(std::make_unique<TernaryPass>());

    // Low tier
    normalizer.add_pass(std::make_unique<ListOperatorsPass>());
    normalizer.add_pass(std::make_unique<ConditionalAssignmentPass>());
    normalizer.add_pass(std::make_unique<LogicalKeywordsPass>());
    normalizer.add_pass(std::make_unique<PostfixConditionalPass>());
}

auto normalize_expression(const Normalizer& normalizer, const ast::Node& root)
    -> Result<ast::NormalizedNode, ast::UnsupportedConstruct> {
    return ast::lower(normalizer.normalize(root));
}

} // namespace exprc::normalizer
