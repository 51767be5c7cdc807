// Module Emitter Implementation
//
// Lookup tables are sorted arrays of (text, function pointer) searched with
// std::lower_bound. Call sites arrive sorted by (context, text), so each
// table is already in order.

#include "driver/module_emitter.hpp"

#include "codegen/cpp_gen.hpp"
#include "log/log.hpp"

#include <fstream>

namespace exprc::driver {

namespace {

struct TableInfo {
    const char* table;
    const char* fn_type;
    const char* lookup;
};

auto table_info(ast::ExpressionContext context) -> TableInfo {
    switch (context) {
    case ast::ExpressionContext::ValueTransform:
        return {"VALUE_TRANSFORMS", "ValueTransformFn", "find_value_transform"};
    case ast::ExpressionContext::DisplayFormat:
        return {"DISPLAY_FORMATS", "DisplayFormatFn", "find_display_format"};
    case ast::ExpressionContext::BooleanGate:
        return {"BOOLEAN_GATES", "BooleanGateFn", "find_boolean_gate"};
    }
    return {"", "", ""};
}

/// Each line of `text` as a `///` comment line.
void append_comment_lines(std::string& out, std::string_view text) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        out += line.empty() ? "///" : "/// ";
        out += line;
        if (line.ends_with('\\')) {
            // A trailing backslash would splice the next line into the comment
            out += " (eol)";
        }
        out += '\n';
        start = end + 1;
    }
}

auto usage_label(const registry::UsageContext& usage) -> std::string {
    std::string label = usage.module;
    for (const std::string* part : {&usage.table, &usage.tag}) {
        if (part->empty()) {
            continue;
        }
        if (!label.empty()) {
            label += "::";
        }
        label += *part;
    }
    return label;
}

} // namespace

ModuleEmitter::ModuleEmitter(ModuleEmitterOptions options) : options_(std::move(options)) {}

void ModuleEmitter::emit_doc_comment(std::string& out, const registry::GeneratedFunction& fn) const {
    append_comment_lines(out, fn.original_text);
    if (!fn.usages.empty()) {
        out += "///\n/// Used by:\n";
        for (const auto& usage : fn.usages) {
            out += "/// - " + usage_label(usage) + "\n";
        }
    }
    if (fn.is_fallback) {
        out += "///\n";
        append_comment_lines(out, "Fallback: " + fn.fallback_reason);
    }
}

void ModuleEmitter::emit_lookup_table(std::string& out, const registry::RegistryOutput& output,
                                      ast::ExpressionContext context) const {
    TableInfo info = table_info(context);
    std::vector<const registry::CallSite*> sites;
    for (const auto& site : output.call_sites) {
        if (site.context == context) {
            sites.push_back(&site);
        }
    }

    out += "const std::array<Binding<" + std::string(info.fn_type) + ">, " +
           std::to_string(sites.size()) + "> " + info.table + " = {{\n";
    for (const auto* site : sites) {
        out += "    {" + codegen::cpp_string_literal(site->original_text) + "sv, &" +
               site->function_name + "},\n";
    }
    out += "}};\n\n";
}

auto ModuleEmitter::emit_module(const registry::RegistryOutput& output) const -> std::string {
    std::string out;
    out += "// Generated by exprc " + std::string(VERSION);
    if (!options_.source_name.empty()) {
        out += " from " + options_.source_name;
    }
    out += ". Do not edit.\n";
    if (!options_.corpus_checksum.empty()) {
        out += "// corpus crc32c: " + options_.corpus_checksum + "\n";
    }
    out += "\n#include \"exprc_rt/dispatch.hpp\"\n#include \"exprc_rt/runtime.hpp\"\n\n";
    out += "#include <algorithm>\n#include <array>\n#include <string>\n#include <string_view>\n\n";
    out += "namespace exprc::generated {\n\n";
    out += "using namespace std::string_view_literals;\n\n";

    for (const auto& fn : output.functions) {
        if (options_.emit_comments) {
            emit_doc_comment(out, fn);
        }
        out += fn.source;
        out += '\n';
    }

    out += "// ============================================================================\n";
    out += "// Lookup\n";
    out += "// ============================================================================\n\n";
    out += "namespace {\n\n";
    out += "template <typename Fn> struct Binding {\n"
           "    std::string_view text;\n"
           "    Fn fn;\n"
           "};\n\n";
    out += "template <typename Fn, std::size_t N>\n"
           "auto find_binding(const std::array<Binding<Fn>, N>& table, std::string_view text) -> "
           "Fn {\n"
           "    auto it = std::lower_bound(table.begin(), table.end(), text,\n"
           "                               [](const Binding<Fn>& b, std::string_view t) { return "
           "b.text < t; });\n"
           "    return it != table.end() && it->text == text ? it->fn : nullptr;\n"
           "}\n\n";
    for (auto context : ast::ALL_CONTEXTS) {
        emit_lookup_table(out, output, context);
    }
    out += "} // namespace\n\n";

    for (auto context : ast::ALL_CONTEXTS) {
        TableInfo info = table_info(context);
        out += "auto " + std::string(info.lookup) + "(std::string_view original_text) -> " +
               info.fn_type + " {\n";
        out += "    return find_binding(" + std::string(info.table) + ", original_text);\n";
        out += "}\n\n";
    }
    out += "} // namespace exprc::generated\n";
    return out;
}

auto ModuleEmitter::lookup_json(const registry::RegistryOutput& output) const -> json::JsonValue {
    json::JsonArray entries;
    entries.reserve(output.call_sites.size());
    for (const auto& site : output.call_sites) {
        json::JsonObject entry;
        entry["original_text"] = json::JsonValue(site.original_text);
        entry["expression_type"] = json::JsonValue(ast::context_name(site.context));
        entry["function"] = json::JsonValue(site.function_name);
        entries.emplace_back(std::move(entry));
    }
    return json::JsonValue(std::move(entries));
}

auto ModuleEmitter::report_json(const registry::RegistryOutput& output) const -> json::JsonValue {
    json::JsonValue report = output.stats.to_json();
    auto& obj = report.as_object_mut();
    obj["version"] = json::JsonValue(VERSION);
    obj["source"] = json::JsonValue(options_.source_name);
    obj["corpus_checksum"] = json::JsonValue(options_.corpus_checksum);
    obj["functions"] = json::JsonValue(output.functions.size());
    obj["call_sites"] = json::JsonValue(output.call_sites.size());
    return report;
}

auto write_text_file(const std::string& path, const std::string& content)
    -> Result<bool, std::string> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::string("cannot open '" + path + "' for writing");
    }
    file << content;
    file.flush();
    if (!file) {
        return std::string("failed writing '" + path + "'");
    }
    EXPRC_LOG_DEBUG("driver", "wrote " << content.size() << " bytes to " << path);
    return true;
}

} // namespace exprc::driver
