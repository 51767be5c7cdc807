//! # Function Registry Tests
//!
//! Deduplication by normalized tree, call-site bookkeeping, fallbacks,
//! name collisions, statistics and fingerprint naming.

#include "normalizer/normalizer.hpp"
#include "registry/conversion_stats.hpp"
#include "registry/fingerprint.hpp"
#include "registry/function_registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace exprc;
using namespace exprc::ast;
using namespace exprc::registry;
using namespace exprc::test;

namespace {

auto make_spec(std::string text, ExpressionContext context, const json::JsonValue& tree)
    -> FunctionSpec {
    static const normalizer::Normalizer pipeline = normalizer::Normalizer::standard();
    FunctionSpec spec;
    spec.original_text = std::move(text);
    spec.context = context;
    spec.normalized = pipeline.normalize(load(tree));
    return spec;
}

auto times_25(bool spaced) -> json::JsonValue {
    if (spaced) {
        return ppi_doc({ppi_sym("$val"), ppi_ws(), ppi_op("*"), ppi_ws(), ppi_num("25")});
    }
    return ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_num("25")});
}

auto constant_name(ExpressionContext, const std::string&) -> std::string {
    return "value_conv_fixed";
}

} // namespace

// ============================================================================
// Deduplication
// ============================================================================

TEST(FunctionRegistryTest, WhitespaceVariantsShareOneFunction) {
    FunctionRegistry registry;
    auto spaced = registry.resolve_or_fallback(
        make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true)));
    auto tight = registry.resolve_or_fallback(
        make_spec("$val*25", ExpressionContext::ValueTransform, times_25(false)));

    EXPECT_EQ(spaced.name, tight.name);
    EXPECT_EQ(registry.function_count(), 1u);

    RegistryOutput out = registry.finish();
    ASSERT_EQ(out.functions.size(), 1u);
    const GeneratedFunction& fn = out.functions[0];
    EXPECT_FALSE(fn.is_fallback);
    EXPECT_EQ(fn.call_sites, 2u);
    EXPECT_EQ(fn.original_text, "$val * 25");
    EXPECT_EQ(fn.name.rfind("value_conv_", 0), 0u);

    ASSERT_EQ(out.call_sites.size(), 2u);
    EXPECT_EQ(out.call_sites[0].original_text, "$val * 25");
    EXPECT_EQ(out.call_sites[1].original_text, "$val*25");
    EXPECT_EQ(out.call_sites[0].function_name, fn.name);
    EXPECT_EQ(out.call_sites[1].function_name, fn.name);
}

TEST(FunctionRegistryTest, RepeatedCallSiteCountsOnce) {
    FunctionRegistry registry;
    auto spec = make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true));
    (void)registry.resolve_or_fallback(spec);
    (void)registry.resolve_or_fallback(spec);

    RegistryOutput out = registry.finish();
    ASSERT_EQ(out.functions.size(), 1u);
    EXPECT_EQ(out.functions[0].call_sites, 1u);
    EXPECT_EQ(out.call_sites.size(), 1u);
    EXPECT_EQ(out.stats.for_context(ExpressionContext::ValueTransform).registrations, 2u);
}

TEST(FunctionRegistryTest, ContextsDoNotShareFunctions) {
    FunctionRegistry registry;
    auto transform = registry.register_spec(
        make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true)));
    auto display = registry.register_spec(
        make_spec("$val * 25", ExpressionContext::DisplayFormat, times_25(true)));

    EXPECT_NE(transform, display);
    EXPECT_EQ(display.rfind("print_conv_", 0), 0u);
    EXPECT_EQ(registry.function_count(), 2u);
}

TEST(FunctionRegistryTest, UsagesAreSortedAndUnique) {
    FunctionRegistry registry;
    auto spec = make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true));
    spec.usage = UsageContext{"Canon", "Main", "FocalLength"};
    (void)registry.register_spec(spec);
    spec.usage = UsageContext{"Canon", "Main", "ExposureTime"};
    (void)registry.register_spec(spec);
    spec.usage = UsageContext{"Canon", "Main", "FocalLength"};
    (void)registry.register_spec(spec);

    RegistryOutput out = registry.finish();
    ASSERT_EQ(out.functions.size(), 1u);
    const auto& usages = out.functions[0].usages;
    ASSERT_EQ(usages.size(), 2u);
    EXPECT_EQ(usages[0].tag, "ExposureTime");
    EXPECT_EQ(usages[1].tag, "FocalLength");
}

TEST(FunctionRegistryTest, RegisteredSpecsResolveAtFinish) {
    FunctionRegistry registry;
    auto name = registry.register_spec(
        make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true)));

    RegistryOutput out = registry.finish();
    ASSERT_EQ(out.functions.size(), 1u);
    EXPECT_EQ(out.functions[0].name, name);
    EXPECT_NE(out.functions[0].source.find("rt::finish((val * rt::Value::integer(25)))"),
              std::string::npos);
    EXPECT_EQ(registry.function_count(), 0u);
}

// ============================================================================
// Fallbacks and Collisions
// ============================================================================

TEST(FunctionRegistryTest, UnsupportedExpressionFallsBack) {
    FunctionRegistry registry;
    auto fn = registry.resolve_or_fallback(
        make_spec("foo($val)", ExpressionContext::ValueTransform,
                  ppi_doc({ppi_word("foo"), ppi_list({ppi_sym("$val")})})));

    EXPECT_TRUE(fn.is_fallback);
    EXPECT_EQ(fn.fallback_reason, "function 'foo' in foo(...)");
    EXPECT_NE(fn.source.find("return rt::not_implemented(\"foo($val)\");"), std::string::npos);

    RegistryOutput out = registry.finish();
    const auto& stats = out.stats.for_context(ExpressionContext::ValueTransform);
    EXPECT_EQ(stats.fallback, 1u);
    EXPECT_EQ(stats.generated, 0u);
    ASSERT_EQ(stats.fallbacks.size(), 1u);
    EXPECT_EQ(stats.fallbacks[0].original_text, "foo($val)");
}

TEST(FunctionRegistryTest, MalformedInputFallsBack) {
    FunctionRegistry registry;
    FunctionSpec spec;
    spec.original_text = "$val =~ tr/a-z//";
    spec.context = ExpressionContext::BooleanGate;
    spec.input_error = "unknown node class 'PPI::Token::Weird'";

    auto fn = registry.resolve_or_fallback(spec);
    EXPECT_TRUE(fn.is_fallback);
    EXPECT_EQ(fn.fallback_reason, "malformed input tree: unknown node class 'PPI::Token::Weird'");
    EXPECT_NE(fn.source.find("return false;"), std::string::npos);
    EXPECT_EQ(fn.name.rfind("condition_", 0), 0u);
}

TEST(FunctionRegistryTest, NameCollisionIsAnInternalError) {
    FunctionRegistry registry(codegen::CppCodeGen{}, &constant_name);
    (void)registry.register_spec(
        make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true)));

    try {
        (void)registry.register_spec(
            make_spec("$val + 1", ExpressionContext::ValueTransform,
                      ppi_doc({ppi_sym("$val"), ppi_op("+"), ppi_num("1")})));
        FAIL() << "expected InternalCompilerError";
    } catch (const InternalCompilerError& e) {
        EXPECT_EQ(e.kind(), InternalErrorKind::DuplicateNameCollision);
        EXPECT_NE(std::string(e.what()).find("value_conv_fixed"), std::string::npos);
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(FunctionRegistryTest, ConcurrentResolutionIsDeterministic) {
    std::vector<FunctionSpec> specs = {
        make_spec("$val * 25", ExpressionContext::ValueTransform, times_25(true)),
        make_spec("$val*25", ExpressionContext::ValueTransform, times_25(false)),
        make_spec("$val + 1", ExpressionContext::ValueTransform,
                  ppi_doc({ppi_sym("$val"), ppi_op("+"), ppi_num("1")})),
        make_spec("foo($val)", ExpressionContext::DisplayFormat,
                  ppi_doc({ppi_word("foo"), ppi_list({ppi_sym("$val")})})),
    };

    auto run = [&](size_t threads) {
        FunctionRegistry registry;
        std::vector<std::thread> workers;
        for (size_t t = 0; t < threads; ++t) {
            workers.emplace_back([&registry, &specs] {
                for (const auto& spec : specs) {
                    (void)registry.resolve_or_fallback(spec);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        return registry.finish();
    };

    RegistryOutput serial = run(1);
    RegistryOutput parallel = run(4);

    ASSERT_EQ(serial.functions.size(), 3u);
    ASSERT_EQ(parallel.functions.size(), serial.functions.size());
    for (size_t i = 0; i < serial.functions.size(); ++i) {
        EXPECT_EQ(parallel.functions[i].name, serial.functions[i].name);
        EXPECT_EQ(parallel.functions[i].source, serial.functions[i].source);
        EXPECT_EQ(parallel.functions[i].call_sites, serial.functions[i].call_sites);
    }
    EXPECT_EQ(parallel.call_sites.size(), serial.call_sites.size());

    auto serial_totals = serial.stats.totals();
    auto parallel_totals = parallel.stats.totals();
    EXPECT_EQ(parallel_totals.unique_functions, serial_totals.unique_functions);
    EXPECT_EQ(parallel_totals.fallback, serial_totals.fallback);
    EXPECT_EQ(parallel_totals.registrations, 4 * serial_totals.registrations);
}

// ============================================================================
// Statistics
// ============================================================================

TEST(ConversionStatsTest, CoverageAndSummary) {
    ConversionStats stats;
    auto& transform = stats.for_context(ExpressionContext::ValueTransform);
    transform.registrations = 3;
    transform.unique_functions = 2;
    transform.generated = 1;
    transform.fallback = 1;
    transform.fallbacks.push_back({"value_conv_1", "foo($val)", "function 'foo'"});

    EXPECT_DOUBLE_EQ(transform.coverage_percent(), 50.0);
    EXPECT_DOUBLE_EQ(stats.for_context(ExpressionContext::BooleanGate).coverage_percent(), 100.0);
    EXPECT_EQ(stats.total_fallbacks(), 1u);

    std::string summary = stats.summary();
    EXPECT_NE(summary.find("  ValueTransform: 3 registered, 2 unique, 1 generated, 1 fallback "
                           "(50.0%)"),
              std::string::npos);
    EXPECT_NE(summary.find("  Total: 3 registered"), std::string::npos);
}

TEST(ConversionStatsTest, Json) {
    ConversionStats stats;
    auto& display = stats.for_context(ExpressionContext::DisplayFormat);
    display.registrations = 1;
    display.unique_functions = 1;
    display.fallback = 1;
    display.fallbacks.push_back({"print_conv_1", "$x =~ s/a//", "unsupported token"});

    json::JsonValue doc = stats.to_json();
    const json::JsonValue* contexts = doc.get("contexts");
    ASSERT_NE(contexts, nullptr);
    const json::JsonValue* entry = contexts->get("DisplayFormat");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->get("fallback")->as_number().i64, 1);
    ASSERT_EQ(entry->get("fallbacks")->size(), 1u);
    EXPECT_EQ(entry->get("fallbacks")->as_array()[0].get_string("reason"), "unsupported token");
    EXPECT_EQ(doc.get("totals")->get("registrations")->as_number().i64, 1);
}

// ============================================================================
// Fingerprints
// ============================================================================

TEST(FingerprintTest, DeterministicAndDistinct) {
    auto a = fingerprint_string("(binop \"*\" (sym \"$val\") (num \"25\" \"25\"))");
    auto b = fingerprint_string("(binop \"*\" (sym \"$val\") (num \"25\" \"25\"))");
    auto c = fingerprint_string("(binop \"+\" (sym \"$val\") (num \"25\" \"25\"))");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.to_hex().size(), 32u);
    EXPECT_TRUE(fingerprint_bytes(nullptr, 0).is_zero());
}

TEST(FingerprintTest, FunctionNames) {
    auto key = std::string("(doc (stmt (sym \"$val\")))");
    std::string name = fingerprint_name(ExpressionContext::DisplayFormat, key);
    ASSERT_EQ(name.size(), std::string("print_conv_").size() + 16);
    EXPECT_EQ(name.rfind("print_conv_", 0), 0u);
    EXPECT_EQ(name.find_first_not_of("0123456789abcdef", 11), std::string::npos);

    EXPECT_EQ(name, fingerprint_name(ExpressionContext::DisplayFormat, key));
    EXPECT_NE(name.substr(11), fingerprint_name(ExpressionContext::ValueTransform, key).substr(11));
}
