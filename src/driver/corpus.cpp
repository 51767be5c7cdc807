#include "driver/corpus.hpp"

#include "common/crc32c.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace exprc::driver {

namespace {

auto record_error(size_t index, const std::string& message) -> CorpusError {
    return CorpusError{"record " + std::to_string(index) + ": " + message};
}

auto parse_usage(const json::JsonValue& json) -> std::optional<registry::UsageContext> {
    if (!json.is_object()) {
        return std::nullopt;
    }
    registry::UsageContext usage;
    usage.module = json.get_string("module").value_or("");
    usage.table = json.get_string("table").value_or("");
    usage.tag = json.get_string("tag").value_or("");
    if (usage.module.empty() && usage.table.empty() && usage.tag.empty()) {
        return std::nullopt;
    }
    return usage;
}

auto parse_record(const json::JsonValue& json, size_t index) -> Result<CorpusRecord, CorpusError> {
    if (!json.is_object()) {
        return record_error(index, "not an object");
    }

    auto type = json.get_string("expression_type");
    if (!type) {
        return record_error(index, "missing 'expression_type'");
    }
    auto context = ast::parse_context(*type);
    if (!context) {
        return record_error(index, "unknown expression_type '" + *type + "'");
    }

    auto text = json.get_string("original_text");
    if (!text) {
        return record_error(index, "missing 'original_text'");
    }

    CorpusRecord record;
    record.context = *context;
    record.original_text = std::move(*text);
    if (const json::JsonValue* ast = json.get("parsed_ast")) {
        record.parsed_ast = *ast;
    }
    if (const json::JsonValue* usage = json.get("usage")) {
        record.usage = parse_usage(*usage);
    }
    return record;
}

} // namespace

auto parse_corpus(std::string_view text) -> Result<Corpus, CorpusError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return CorpusError{"invalid JSON: " + unwrap_err(parsed).to_string()};
    }

    const json::JsonValue& root = unwrap(parsed);
    const json::JsonValue* list = &root;
    if (root.is_object()) {
        list = root.get("expressions");
        if (list == nullptr) {
            return CorpusError{"object corpus has no 'expressions' array"};
        }
    }
    if (!list->is_array()) {
        return CorpusError{"corpus must be an array of records or {\"expressions\": [...]}"};
    }

    Corpus corpus;
    corpus.checksum = crc32c_hex(text);
    const auto& items = list->as_array();
    corpus.records.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        auto record = parse_record(items[i], i);
        if (is_err(record)) {
            return unwrap_err(record);
        }
        corpus.records.push_back(std::move(unwrap(record)));
    }

    EXPRC_LOG_DEBUG("driver", "corpus has " << corpus.records.size() << " records, checksum "
                                            << corpus.checksum);
    return corpus;
}

auto load_corpus_file(const std::string& path) -> Result<Corpus, CorpusError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return CorpusError{"cannot open '" + path + "'"};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto corpus = parse_corpus(buffer.str());
    if (is_err(corpus)) {
        unwrap_err(corpus).message = path + ": " + unwrap_err(corpus).message;
    }
    return corpus;
}

} // namespace exprc::driver
