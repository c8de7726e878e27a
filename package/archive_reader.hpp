#pragma once

// ============================================================
// archive_reader.hpp -- Decodes a package archive back into assets
//
// Entries are grouped by their folder name (the guid). Entry data
// is read in READ_BUFFER_SIZE blocks; the first block of each entry
// decides whether it is text. Text entries get every bare "\n"
// rewritten to "\r\n"; binary entries are copied unchanged.
// ============================================================

#include "archive_entry.hpp"
#include "../common/platform.hpp"
#include <istream>
#include <string>
#include <vector>

static constexpr size_t READ_BUFFER_SIZE  = 4096;
static constexpr size_t BINARY_SCAN_SIZE = 200;

// Streaming line-ending normalizer for one entry
class LineEndingNormalizer {
public:
    // Append the normalized form of one block to out. The first call
    // decides text or binary from its leading BINARY_SCAN_SIZE bytes.
    void feed(const char* data, size_t len, std::string& out);

    bool binary() const { return binary_; }

    // A byte below 8, in 14..31, or 0xFF within the first
    // BINARY_SCAN_SIZE bytes marks the data as binary.
    static bool looks_binary(const char* data, size_t len);

private:
    bool decided_{false};
    bool binary_{false};
    bool prev_cr_{false};
};

class ArchiveReader {
public:
    // Decode a gzip(tar) stream. Entries are sorted by guid.
    // Throws ArchiveFormatError on a corrupt archive.
    std::vector<ArchiveEntry> decode(std::istream& in);

    // Throws ArchiveStreamError if the file cannot be opened.
    std::vector<ArchiveEntry> decode_file(const std::string& path);

    // Write content to dest_dir/<relative_path> and metadata to
    // dest_dir/<relative_path>.meta. Entries without a path, or with a
    // path leaving dest_dir, are skipped with a warning.
    // Returns the number of entries written.
    size_t extract(const std::vector<ArchiveEntry>& entries, const std::string& dest_dir);

    // Entries ignored by the last decode() (unknown kinds, bad names)
    size_t ignored_count() const { return ignored_; }

private:
    size_t ignored_{0};
};
