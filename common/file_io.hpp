#pragma once

// ============================================================
// file_io.hpp -- File access helpers and memory-mapped I/O
//
// Absence is routine for project files (a reference may name a
// file that is not on disk), so the query helpers here report
// "missing" through their return value and never throw. Only the
// mmap reader throws, on files the caller expects to exist.
// ============================================================

#include "platform.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- Path conventions ----

// "<asset>.meta" for an asset, unchanged for a path that already is a .meta
std::string meta_path_for(const std::string& path);

// Strip a trailing ".meta"; unchanged for any other path
std::string asset_path_for(const std::string& path);

bool is_meta_path(const std::string& path);

// Absolute, lexically normalized native path string. Used as the
// identity of a file in every index and set.
std::string normalize_path(const std::string& path);

// Join a forward-slash relative path onto root_dir.
// Throws if the path is absolute or escapes root_dir.
fs::path safe_join(const fs::path& root_dir, const std::string& relative_path);

// ---- Queries (never throw) ----

bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

// ---- Reads ----

// Whole file as text; std::nullopt if the file does not exist or cannot be opened
std::optional<std::string> read_text(const std::string& path);

// Stream a text file one line at a time (trailing '\r' stripped).
// The callback returns false to stop early.
// Returns false if the file does not exist or cannot be opened.
bool for_each_line(const std::string& path,
                   const std::function<bool(std::string_view)>& on_line);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Write a whole buffer to path (parents created). Throws on failure.
void write_file(const std::string& path, const void* data, size_t len);

} // namespace file_io
