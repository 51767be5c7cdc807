// Function Registry Implementation
//
// Generation runs outside the lock. Two workers racing on the same name may
// both generate; the first to store wins and the other result is dropped,
// which is harmless because generation is deterministic per name.

#include "registry/function_registry.hpp"

#include "ast/normalized.hpp"
#include "log/log.hpp"
#include "registry/fingerprint.hpp"

#include <algorithm>

namespace exprc::registry {

auto fingerprint_name(ast::ExpressionContext context, const std::string& dedup_key)
    -> std::string {
    return function_name(context, spec_fingerprint(context, dedup_key));
}

FunctionRegistry::FunctionRegistry(codegen::CppCodeGen generator, NamingFn naming)
    : generator_(std::move(generator)), naming_(naming) {}

auto FunctionRegistry::dedup_key(const FunctionSpec& spec) -> std::string {
    if (spec.normalized) {
        return ast::to_sexpr(*spec.normalized);
    }
    return "(unparsed " + spec.original_text + ")";
}

auto FunctionRegistry::name_for(const FunctionSpec& spec) const -> std::string {
    return naming_(spec.context, dedup_key(spec));
}

auto FunctionRegistry::function_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return functions_.size();
}

auto FunctionRegistry::record(const FunctionSpec& spec, const std::string& name,
                              const std::string& key) -> Entry& {
    auto [it, inserted] = functions_.try_emplace(name);
    Entry& entry = it->second;
    if (inserted) {
        entry.function.name = name;
        entry.function.context = spec.context;
        entry.function.original_text = spec.original_text;
        entry.dedup_key = key;
        entry.spec = spec;
    } else if (entry.dedup_key != key) {
        throw InternalCompilerError(InternalErrorKind::DuplicateNameCollision,
                                    "'" + name + "' is shared by " + entry.dedup_key + " and " +
                                        key);
    } else if (spec.original_text < entry.function.original_text) {
        entry.function.original_text = spec.original_text;
        entry.spec = spec;
    }

    if (spec.usage) {
        auto& usages = entry.function.usages;
        auto pos = std::lower_bound(usages.begin(), usages.end(), *spec.usage);
        if (pos == usages.end() || !(*pos == *spec.usage)) {
            usages.insert(pos, *spec.usage);
        }
    }

    ++registrations_[static_cast<size_t>(spec.context)];
    auto [site, new_site] = call_sites_.try_emplace({spec.context, spec.original_text}, name);
    if (new_site) {
        ++entry.function.call_sites;
    } else if (site->second != name) {
        EXPRC_LOG_WARN("registry", "'" << spec.original_text << "' ("
                                       << ast::context_name(spec.context) << ") maps to "
                                       << site->second << ", ignoring " << name);
    }
    return entry;
}

auto FunctionRegistry::compile(const FunctionSpec& spec, const std::string& name) const
    -> Result<std::string, ast::UnsupportedConstruct> {
    if (!spec.normalized) {
        return ast::UnsupportedConstruct{"malformed input tree: " + spec.input_error, ""};
    }
    auto lowered = ast::lower(*spec.normalized);
    if (is_err(lowered)) {
        return unwrap_err(lowered);
    }
    return generator_.generate(unwrap(lowered), spec.context, name);
}

void FunctionRegistry::store(Entry& entry, Result<std::string, ast::UnsupportedConstruct> outcome) {
    if (entry.resolved) {
        return;
    }
    entry.resolved = true;
    GeneratedFunction& fn = entry.function;
    if (is_ok(outcome)) {
        fn.source = std::move(unwrap(outcome));
        fn.is_fallback = false;
        EXPRC_LOG_TRACE("registry", "generated " << fn.name);
        return;
    }
    const auto& error = unwrap_err(outcome);
    fn.is_fallback = true;
    fn.fallback_reason = error.message;
    if (!error.fragment.empty() && error.message.find(error.fragment) == std::string::npos) {
        fn.fallback_reason += " in " + error.fragment;
    }
    fn.source = generator_.fallback(fn.context, fn.name, fn.original_text);
    EXPRC_LOG_DEBUG("registry", "fallback " << fn.name << " for '" << fn.original_text
                                            << "': " << fn.fallback_reason);
}

auto FunctionRegistry::register_spec(const FunctionSpec& spec) -> std::string {
    std::string key = dedup_key(spec);
    std::string name = naming_(spec.context, key);
    std::lock_guard<std::mutex> lock(mutex_);
    record(spec, name, key);
    return name;
}

auto FunctionRegistry::resolve_or_fallback(const FunctionSpec& spec) -> GeneratedFunction {
    std::string key = dedup_key(spec);
    std::string name = naming_(spec.context, key);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = record(spec, name, key);
        if (entry.resolved) {
            return entry.function;
        }
    }

    auto outcome = compile(spec, name);

    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = functions_.at(name);
    store(entry, std::move(outcome));
    return entry.function;
}

auto FunctionRegistry::finish() -> RegistryOutput {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryOutput out;

    for (auto& [name, entry] : functions_) {
        if (!entry.resolved) {
            store(entry, compile(entry.spec, name));
        }
        GeneratedFunction& fn = entry.function;
        if (fn.is_fallback) {
            // The representative text may have changed after the fallback was built
            fn.source = generator_.fallback(fn.context, fn.name, fn.original_text);
        }

        ContextStats& stats = out.stats.for_context(fn.context);
        ++stats.unique_functions;
        if (fn.is_fallback) {
            ++stats.fallback;
            stats.fallbacks.push_back({fn.name, fn.original_text, fn.fallback_reason});
        } else {
            ++stats.generated;
        }
        out.functions.push_back(std::move(fn));
    }

    for (auto context : ast::ALL_CONTEXTS) {
        out.stats.for_context(context).registrations =
            registrations_[static_cast<size_t>(context)];
    }
    for (auto& [site, name] : call_sites_) {
        out.call_sites.push_back({site.second, site.first, name});
    }

    EXPRC_LOG_DEBUG("registry", "drained " << out.functions.size() << " functions, "
                                           << out.call_sites.size() << " call sites");

    functions_.clear();
    call_sites_.clear();
    registrations_ = {};
    return out;
}

} // namespace exprc::registry
