#pragma once

// ============================================================
// asset_index.hpp -- GUID <-> file index for one resolution run
//
// Phase 1 (indexing): index_file() / index_files() insert into the
//   two tables from many worker threads; inserts are serialized by
//   one mutex.
// Phase 2 (queries): once index_files() has returned, the tables are
//   read-only and direct_references_of() / resolve_guid() read them
//   without locking. Mixing the phases is not supported.
// ============================================================

#include "identifier.hpp"
#include "reference_source.hpp"
#include "../common/thread_pool.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class AssetIndex : public ReferenceSource {
public:
    explicit AssetIndex(ThreadPool& pool) : pool_(pool) {}

    AssetIndex(const AssetIndex&) = delete;
    AssetIndex& operator=(const AssetIndex&) = delete;

    // Index one asset (or its .meta): reads the own identifier from the
    // metadata file and maps it to the asset path.
    void index_file(const std::string& path);

    // index_file() over all paths on the pool, in no particular order.
    // A failing path is logged and counted; the others still run.
    size_t index_files(const std::vector<std::string>& paths) override;

    // Resolved files referenced by asset_path. Unresolvable guids are dropped.
    PathSet direct_references_of(const std::string& asset_path) const override;

    bool handles(const std::string&) const override { return true; }

    // Asset path registered for a guid, if any
    std::optional<std::string> resolve_guid(const std::string& guid) const;

    size_t size() const { return file_by_record_.size(); }
    size_t guid_count() const { return record_by_guid_.size(); }

private:
    ThreadPool& pool_;

    std::mutex insert_mutex_;
    std::unordered_map<IdentifierRecord, std::string, IdentifierRecordHash> file_by_record_;
    std::unordered_map<std::string, IdentifierRecord> record_by_guid_;
};
