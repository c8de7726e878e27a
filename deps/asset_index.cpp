// ============================================================
// asset_index.cpp -- GUID <-> file index implementation
// ============================================================

#include "asset_index.hpp"
#include "identifier_codec.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <atomic>
#include <exception>

void AssetIndex::index_file(const std::string& path) {
    LOG_TRACE("asset_index: adding " + path);

    std::string meta_path  = file_io::meta_path_for(path);
    std::string asset_path = file_io::normalize_path(file_io::asset_path_for(meta_path));

    IdentifierRecord record = identifier_codec::extract_own_identifier(meta_path);

    std::lock_guard<std::mutex> lk(insert_mutex_);
    file_by_record_[record] = asset_path;
    if (record.has_global_id()) {
        record_by_guid_[*record.global_id] = record;
    }
}

size_t AssetIndex::index_files(const std::vector<std::string>& paths) {
    std::atomic<size_t> failed{0};

    parallel_for_each(pool_, paths, [&](const std::string& path) {
        try {
            index_file(path);
        } catch (const std::exception& e) {
            failed.fetch_add(1);
            LOG_ERROR("asset_index: failed to index " + path + ": " + e.what());
        }
    });

    LOG_DEBUG("asset_index: indexed " + std::to_string(paths.size() - failed.load()) +
              " files, " + std::to_string(record_by_guid_.size()) + " guids");
    return failed.load();
}

std::optional<std::string> AssetIndex::resolve_guid(const std::string& guid) const {
    // Lock-free: tables are read-only once indexing has finished
    auto git = record_by_guid_.find(guid);
    if (git == record_by_guid_.end()) return std::nullopt;

    auto fit = file_by_record_.find(git->second);
    if (fit == file_by_record_.end()) return std::nullopt;
    return fit->second;
}

PathSet AssetIndex::direct_references_of(const std::string& asset_path) const {
    PathSet files;
    for (const IdentifierRecord& ref : identifier_codec::extract_references(asset_path)) {
        if (!ref.has_global_id()) continue;
        auto file = resolve_guid(*ref.global_id);
        if (file) {
            files.insert(*file);
        } else {
            LOG_TRACE("asset_index: unresolved guid " + *ref.global_id + " in " + asset_path);
        }
    }
    return files;
}
