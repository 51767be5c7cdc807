#include "registry/conversion_stats.hpp"

#include <cstdio>
#include <sstream>

namespace exprc::registry {

namespace {

auto context_index(ast::ExpressionContext context) -> size_t {
    return static_cast<size_t>(context);
}

auto counters_json(const ContextStats& stats) -> json::JsonValue {
    json::JsonObject obj;
    obj["registrations"] = json::JsonValue(stats.registrations);
    obj["unique_functions"] = json::JsonValue(stats.unique_functions);
    obj["generated"] = json::JsonValue(stats.generated);
    obj["fallback"] = json::JsonValue(stats.fallback);
    obj["coverage_percent"] = json::JsonValue(stats.coverage_percent());
    return json::JsonValue(std::move(obj));
}

} // namespace

auto ContextStats::coverage_percent() const -> double {
    if (unique_functions == 0) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(generated) / static_cast<double>(unique_functions);
}

auto ConversionStats::for_context(ast::ExpressionContext context) -> ContextStats& {
    return per_context_[context_index(context)];
}

auto ConversionStats::for_context(ast::ExpressionContext context) const -> const ContextStats& {
    return per_context_[context_index(context)];
}

auto ConversionStats::totals() const -> ContextStats {
    ContextStats sum;
    for (const auto& stats : per_context_) {
        sum.registrations += stats.registrations;
        sum.unique_functions += stats.unique_functions;
        sum.generated += stats.generated;
        sum.fallback += stats.fallback;
        sum.fallbacks.insert(sum.fallbacks.end(), stats.fallbacks.begin(), stats.fallbacks.end());
    }
    return sum;
}

auto ConversionStats::to_json() const -> json::JsonValue {
    json::JsonObject contexts;
    for (auto context : ast::ALL_CONTEXTS) {
        const auto& stats = for_context(context);
        json::JsonValue entry = counters_json(stats);

        json::JsonArray fallbacks;
        for (const auto& record : stats.fallbacks) {
            json::JsonObject item;
            item["function"] = json::JsonValue(record.function_name);
            item["original_text"] = json::JsonValue(record.original_text);
            item["reason"] = json::JsonValue(record.reason);
            fallbacks.emplace_back(std::move(item));
        }
        entry.as_object_mut()["fallbacks"] = json::JsonValue(std::move(fallbacks));
        contexts[std::string(ast::context_name(context))] = std::move(entry);
    }

    json::JsonObject root;
    root["contexts"] = json::JsonValue(std::move(contexts));
    root["totals"] = counters_json(totals());
    return json::JsonValue(std::move(root));
}

auto ConversionStats::summary() const -> std::string {
    std::ostringstream out;
    auto row = [&](std::string_view label, const ContextStats& stats) {
        char pct[16];
        std::snprintf(pct, sizeof(pct), "%.1f%%", stats.coverage_percent());
        out << "  " << label << ": " << stats.registrations << " registered, "
            << stats.unique_functions << " unique, " << stats.generated << " generated, "
            << stats.fallback << " fallback (" << pct << ")\n";
    };

    out << "Conversion coverage:\n";
    for (auto context : ast::ALL_CONTEXTS) {
        row(ast::context_name(context), for_context(context));
    }
    row("Total", totals());
    return out.str();
}

} // namespace exprc::registry
