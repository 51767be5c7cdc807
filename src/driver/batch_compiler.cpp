#include "driver/batch_compiler.hpp"

#include "ast/node_loader.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace exprc::driver {

auto build_spec(const normalizer::Normalizer& normalizer, const CorpusRecord& record)
    -> registry::FunctionSpec {
    registry::FunctionSpec spec;
    spec.original_text = record.original_text;
    spec.context = record.context;
    spec.usage = record.usage;

    if (record.parsed_ast.is_null()) {
        spec.input_error = "record has no parsed_ast";
        return spec;
    }
    auto loaded = ast::load_node(record.parsed_ast);
    if (is_err(loaded)) {
        const auto& error = unwrap_err(loaded);
        spec.input_error = error.message;
        if (!error.node_class.empty()) {
            spec.input_error += " (" + error.node_class + ")";
        }
        EXPRC_LOG_DEBUG("driver", "malformed tree for '" << record.original_text
                                                        << "': " << spec.input_error);
        return spec;
    }
    spec.normalized = normalizer.normalize(unwrap(loaded));
    return spec;
}

BatchCompiler::BatchCompiler(const normalizer::Normalizer& normalizer,
                             registry::FunctionRegistry& registry, size_t jobs)
    : normalizer_(normalizer), registry_(registry), jobs_(jobs) {
    if (jobs_ == 0) {
        jobs_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void BatchCompiler::run(const std::vector<CorpusRecord>& records) {
    if (records.empty()) {
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        while (!stop.load()) {
            size_t index = next.fetch_add(1);
            if (index >= records.size()) {
                return;
            }
            try {
                (void)registry_.resolve_or_fallback(build_spec(normalizer_, records[index]));
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                stop.store(true);
                return;
            }
        }
    };

    size_t thread_count = std::min(jobs_, records.size());
    EXPRC_LOG_INFO("driver", "compiling " << records.size() << " expressions with "
                                          << thread_count << " threads");

    if (thread_count == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace exprc::driver
