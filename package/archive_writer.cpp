// ============================================================
// archive_writer.cpp -- Package archive writer implementation
// ============================================================

#include "archive_writer.hpp"
#include "archive_entry.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../deps/identifier_codec.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

ArchiveWriter::ArchiveWriter(const std::string& project_path, std::ostream& out,
                             ThreadPool& pool)
    : project_path_(file_io::normalize_path(project_path))
    , pool_(pool)
    , out_(&out)
{
    gz_  = std::make_unique<gzip::GzipWriter>(*out_);
    tar_ = std::make_unique<tar::TarWriter>(*gz_);
}

ArchiveWriter::ArchiveWriter(const std::string& project_path, const std::string& output_path,
                             ThreadPool& pool)
    : project_path_(file_io::normalize_path(project_path))
    , pool_(pool)
    , out_(nullptr)
{
    try {
        file_io::ensure_parent_dirs(output_path);
    } catch (const std::exception& e) {
        throw ArchiveStreamError("Cannot create output folder for " + output_path + ": " + e.what());
    }
    owned_out_ = std::make_unique<std::ofstream>(output_path,
                                                 std::ios::binary | std::ios::trunc);
    if (!*owned_out_) {
        throw ArchiveStreamError("Cannot create output file: " + output_path + ": " +
                                 last_os_error_str());
    }
    out_ = owned_out_.get();
    gz_  = std::make_unique<gzip::GzipWriter>(*out_);
    tar_ = std::make_unique<tar::TarWriter>(*gz_);
}

ArchiveWriter::~ArchiveWriter() {
    try {
        finish();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("packer: failed to finish archive: ") + e.what());
    }
}

u32 ArchiveWriter::entry_count() const {
    std::lock_guard<std::mutex> lk(write_mutex_);
    return tar_->entry_count();
}

std::string ArchiveWriter::pathname_for(const std::string& asset_path) const {
    std::string rel = fs::path(asset_path).lexically_relative(project_path_).generic_string();
    if (rel.empty()) rel = fs::path(asset_path).filename().generic_string();

    std::string pathname = sub_folder_.empty() ? rel : sub_folder_ + "/" + rel;
    std::replace(pathname.begin(), pathname.end(), '\\', '/');

    // Collapse doubled separators from a sub folder given with a trailing slash
    std::string collapsed;
    collapsed.reserve(pathname.size());
    for (char c : pathname) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/') continue;
        collapsed += c;
    }

    std::string prefix = root_folder_ + "/";
    if (collapsed.compare(0, prefix.size(), prefix) != 0) {
        collapsed = prefix + collapsed;
    }
    return collapsed;
}

bool ArchiveWriter::add_asset(const std::string& path) {
    std::string asset_path = file_io::normalize_path(file_io::asset_path_for(path));

    if (file_io::is_directory(asset_path)) {
        LOG_WARN("packer: skipping directory " + asset_path);
        return false;
    }
    if (!file_io::is_regular_file(asset_path)) {
        throw AssetNotFoundError(asset_path);
    }

    if (!added_.insert(asset_path)) {
        LOG_TRACE("packer: already packed " + asset_path);
        return false;
    }

    // Only assets whose triple was written stay in files()
    try {
        std::string pathname = pathname_for(asset_path);

        // Metadata and guid
        std::string meta_path = file_io::meta_path_for(asset_path);
        std::string metadata;
        std::string guid;
        auto meta_text = file_io::read_text(meta_path);
        if (!meta_text) {
            LOG_WARN("packer: missing .meta for " + pathname + ", generating a new guid");
            guid = hash::generate_guid(asset_path);
            metadata = "guid: " + guid + "\n";
        } else {
            IdentifierRecord own = identifier_codec::extract_own_identifier_from_text(*meta_text);
            if (own.has_global_id()) {
                guid = *own.global_id;
                metadata = std::move(*meta_text);
            } else {
                LOG_WARN("packer: .meta for " + pathname + " has no guid, generating a new one");
                guid = hash::generate_guid(asset_path);
                metadata = "guid: " + guid + "\n" + *meta_text;
            }
        }

        // Content
        std::unique_ptr<file_io::MmapReader> reader;
        try {
            reader = std::make_unique<file_io::MmapReader>(asset_path);
        } catch (const std::exception& e) {
            throw AssetError("Cannot read asset " + asset_path + ": " + e.what());
        }
        u64 mtime_s = file_io::get_mtime_ns(asset_path) / 1000000000ULL;

        LOG_INFO("packer: writing " + pathname + " ( " + guid + " )");
        write_triple(guid, pathname, metadata, reader->data(), reader->size(), mtime_s);
    } catch (const std::exception&) {
        added_.erase(asset_path);
        throw;
    }
    return true;
}

void ArchiveWriter::write_triple(const std::string& guid, const std::string& pathname,
                                 const std::string& metadata, const char* content,
                                 u64 content_size, u64 mtime_s) {
    std::lock_guard<std::mutex> lk(write_mutex_);
    if (finished_) {
        throw ArchiveStreamError("packer: archive already finished, cannot add " + pathname);
    }

    tar_->begin_entry(guid + "/" + kind::ASSET, content_size, mtime_s);
    if (content_size > 0) tar_->write_data(content, (size_t)content_size);
    tar_->end_entry();

    tar_->put_entry(guid + "/" + kind::META, metadata.data(), metadata.size(), mtime_s);
    tar_->put_entry(guid + "/" + kind::PATHNAME, pathname.data(), pathname.size(), mtime_s);
}

AddSummary ArchiveWriter::add_assets(const std::vector<std::string>& paths) {
    std::atomic<size_t> written{0};
    std::atomic<size_t> skipped{0};
    std::atomic<size_t> failed{0};

    parallel_for_each(pool_, paths, [&](const std::string& path) {
        try {
            if (add_asset(path)) written.fetch_add(1);
            else                 skipped.fetch_add(1);
        } catch (const AssetError& e) {
            failed.fetch_add(1);
            LOG_ERROR(std::string("packer: ") + e.what());
        }
    });

    AddSummary summary;
    summary.written = written.load();
    summary.skipped = skipped.load();
    summary.failed  = failed.load();
    LOG_DEBUG("packer: " + std::to_string(summary.written) + " written, " +
              std::to_string(summary.skipped) + " skipped, " +
              std::to_string(summary.failed) + " failed");
    return summary;
}

void ArchiveWriter::finish() {
    std::lock_guard<std::mutex> lk(write_mutex_);
    if (finished_) return;
    finished_ = true;

    tar_->finish();
    gz_->finish();
    out_->flush();
    if (!*out_) {
        throw ArchiveStreamError("Failed to flush archive output");
    }
    if (owned_out_) {
        owned_out_->close();
        if (owned_out_->fail()) {
            throw ArchiveStreamError("Failed to close archive output");
        }
    }
    LOG_DEBUG("packer: archive finished with " + std::to_string(tar_->entry_count()) + " entries");
}
