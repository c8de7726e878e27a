// ============================================================
// dependency_resolver.cpp -- Transitive closure implementation
// ============================================================

#include "dependency_resolver.hpp"
#include "../common/concurrent.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <exception>
#include <mutex>

DependencyResolver::DependencyResolver(const ReferenceSource& asset_source,
                                       const ReferenceSource* script_source,
                                       ThreadPool& pool,
                                       size_t batch_size)
    : asset_source_(asset_source)
    , script_source_(script_source)
    , pool_(pool)
    , batch_size_(batch_size > 0 ? batch_size : DEFAULT_RESOLVE_BATCH)
{}

PathSet DependencyResolver::resolve(const std::vector<std::string>& seeds) const {
    LOG_INFO("resolver: finding dependencies of " + std::to_string(seeds.size()) + " files");

    ConcurrentSet<std::string> visited;
    SafeQueue<std::string>     queue;

    // Same identity as the paths the sources return
    for (const auto& seed : seeds) {
        std::string path = file_io::normalize_path(seed);
        if (visited.insert(path)) queue.push(path);
    }

    size_t rounds = 0;
    while (!queue.empty()) {
        std::vector<std::string> batch = queue.pop_batch(batch_size_);
        if (batch.empty()) break;
        ++rounds;

        parallel_for_each(pool_, batch, [&](const std::string& current) {
            LOG_TRACE("resolver: searching " + current);
            PathSet refs;
            try {
                refs = asset_source_.direct_references_of(current);
            } catch (const std::exception& e) {
                LOG_ERROR("resolver: cannot read references of " + current + ": " + e.what());
                return;
            }
            for (const auto& dep : refs) {
                if (visited.insert(dep)) {
                    LOG_TRACE("resolver:  - found " + dep);
                    queue.push(dep);
                }
            }
        });
    }

    std::vector<std::string> closure_list = visited.snapshot();
    PathSet closure(closure_list.begin(), closure_list.end());
    LOG_DEBUG("resolver: asset closure has " + std::to_string(closure.size()) +
              " files after " + std::to_string(rounds) + " batches");

    if (script_source_) {
        PathSet scripts = script_pass(closure);
        closure.insert(scripts.begin(), scripts.end());
    }

    return closure;
}

PathSet DependencyResolver::script_pass(const PathSet& closure) const {
    std::vector<std::string> scripts;
    for (const auto& path : closure) {
        if (script_source_->handles(path)) scripts.push_back(path);
    }
    if (scripts.empty()) return {};

    LOG_DEBUG("resolver: script pass over " + std::to_string(scripts.size()) + " scripts");

    std::mutex result_mutex;
    PathSet results;
    parallel_for_each(pool_, scripts, [&](const std::string& script) {
        PathSet refs;
        try {
            refs = script_source_->direct_references_of(script);
        } catch (const std::exception& e) {
            LOG_ERROR("resolver: cannot read script references of " + script + ": " + e.what());
            return;
        }
        std::lock_guard<std::mutex> lk(result_mutex);
        results.insert(refs.begin(), refs.end());
    });
    return results;
}
