#pragma once

// ============================================================
// archive_writer.hpp -- Packs project assets into a package archive
//
// Output is gzip(tar). Each added asset becomes three consecutive
// tar entries (<guid>/asset, <guid>/asset.meta, <guid>/pathname),
// written inside one critical section so concurrent callers never
// interleave their triples. Everything else (metadata read, guid
// resolution, opening the asset) happens outside the lock.
//
// Thread safety: add_asset() may be called from many threads.
// finish() must not race with add_asset().
// ============================================================

#include "../common/platform.hpp"
#include "../common/concurrent.hpp"
#include "../common/gzip_stream.hpp"
#include "../common/tar_stream.hpp"
#include "../common/thread_pool.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

struct AddSummary {
    size_t written{0};
    size_t skipped{0};   // directories and assets already in the archive
    size_t failed{0};
};

class ArchiveWriter {
public:
    // Write into a caller-owned stream. The stream must outlive the writer.
    ArchiveWriter(const std::string& project_path, std::ostream& out, ThreadPool& pool);

    // Create (truncate) output_path and write into it.
    // Throws ArchiveStreamError if the file cannot be created.
    ArchiveWriter(const std::string& project_path, const std::string& output_path,
                  ThreadPool& pool);

    // Finishes the archive if finish() was not called; failures are logged.
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Folder inserted between the root folder and the project-relative path
    void set_sub_folder(const std::string& sub_folder) { sub_folder_ = sub_folder; }

    // Leading folder every pathname must start with (default "Assets")
    void set_root_folder(const std::string& root_folder) { root_folder_ = root_folder; }

    // Add one asset (a .meta path adds its asset).
    // Returns false for directories and assets that were already added.
    // Throws AssetNotFoundError if the asset does not exist, AssetError if
    // it cannot be read, ArchiveStreamError if the output failed.
    bool add_asset(const std::string& path);

    // add_asset() over all paths on the pool. Per-asset AssetErrors are
    // logged and counted; an ArchiveStreamError is rethrown once every
    // task has finished.
    AddSummary add_assets(const std::vector<std::string>& paths);

    // Write the end-of-archive marker and the gzip trailer. Idempotent.
    void finish();

    bool finished() const { return finished_; }

    // Absolute paths of the assets written so far
    std::vector<std::string> files() const { return added_.snapshot(); }

    u32 entry_count() const;

    // "<root>/<sub_folder>/<relative>" pathname recorded for an asset
    std::string pathname_for(const std::string& asset_path) const;

private:
    void write_triple(const std::string& guid, const std::string& pathname,
                      const std::string& metadata, const char* content,
                      u64 content_size, u64 mtime_s);

    std::string project_path_;
    std::string sub_folder_;
    std::string root_folder_{UNIPACK_DEFAULT_ROOT_FOLDER};
    ThreadPool& pool_;

    std::unique_ptr<std::ofstream>    owned_out_;
    std::ostream*                     out_;
    std::unique_ptr<gzip::GzipWriter> gz_;
    std::unique_ptr<tar::TarWriter>   tar_;

    ConcurrentSet<std::string> added_;
    mutable std::mutex         write_mutex_;
    bool                       finished_{false};
};
