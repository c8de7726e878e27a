#pragma once

// ============================================================
// gzip_stream.hpp -- zlib gzip wrappers over std::ostream / std::istream
//
// GzipWriter deflates into a gzip member (RFC 1952 header+trailer).
// GzipReader inflates a gzip (or zlib) stream, including several
// concatenated gzip members, and reports corrupt input as
// ArchiveFormatError.
// ============================================================

#include "platform.hpp"
#include <istream>
#include <ostream>
#include <vector>

#include <zlib.h>

namespace gzip {

// Default deflate level (zlib's own default, 6)
static constexpr int GZIP_LEVEL = Z_DEFAULT_COMPRESSION;

// Internal buffer size for both directions
static constexpr size_t GZIP_BUFFER_SIZE = 64 * 1024;

class GzipWriter {
public:
    explicit GzipWriter(std::ostream& out, int level = GZIP_LEVEL);
    ~GzipWriter();

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    // Compress len bytes. Throws ArchiveStreamError on failure.
    void write(const void* data, size_t len);

    // Flush remaining output and write the gzip trailer. Idempotent.
    void finish();

    bool finished() const { return finished_; }

private:
    void drain(int flush_mode);

    std::ostream&   out_;
    z_stream        zs_{};
    std::vector<u8> buf_;
    bool            finished_{false};
};

class GzipReader {
public:
    explicit GzipReader(std::istream& in);
    ~GzipReader();

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    // Read up to cap decompressed bytes; returns 0 only at end of stream.
    size_t read(void* dst, size_t cap);

    // Read exactly len bytes; returns false on a clean end of stream
    // before any byte was read. Throws ArchiveFormatError on truncation.
    bool read_exact(void* dst, size_t len);


private:
    bool refill();

    std::istream&   in_;
    z_stream        zs_{};
    std::vector<u8> buf_;
    bool            eof_{false};
    bool            input_done_{false};
};

} // namespace gzip
