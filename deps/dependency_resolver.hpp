#pragma once

// ============================================================
// dependency_resolver.hpp -- Transitive closure over reference sources
//
// Two phases:
//   1. asset closure: breadth-layered, batched expansion through the
//      primary source until no new path is discovered. Each batch
//      (up to batch_size items) runs in parallel; the next batch starts
//      only after the current one has finished inserting.
//   2. script pass: the secondary source (if any) runs once over the
//      closure members it handles; its results are added without
//      further expansion.
//
// The visited set is the only dedup gate: a path is enqueued only by
// the thread whose insert succeeded. Discovery order is unspecified.
// ============================================================

#include "reference_source.hpp"
#include "../common/thread_pool.hpp"
#include <string>
#include <vector>

static constexpr size_t DEFAULT_RESOLVE_BATCH = 32;

class DependencyResolver {
public:
    // script_source may be null (no script pass)
    DependencyResolver(const ReferenceSource& asset_source,
                       const ReferenceSource* script_source,
                       ThreadPool& pool,
                       size_t batch_size = DEFAULT_RESOLVE_BATCH);

    // Seeds plus everything reachable from them. Seeds may be relative;
    // every returned path is absolute and normalized.
    PathSet resolve(const std::vector<std::string>& seeds) const;

private:
    PathSet script_pass(const PathSet& closure) const;

    const ReferenceSource& asset_source_;
    const ReferenceSource* script_source_;
    ThreadPool&            pool_;
    size_t                 batch_size_;
};
