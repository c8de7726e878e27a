#pragma once

// ============================================================
// tar_stream.hpp -- Sequential ustar writer/reader over gzip streams
//
// Layout (POSIX.1-1988 ustar):
//   for each entry:
//     header      : 512 bytes (octal ASCII fields, checksum)
//     data        : size bytes
//     padding     : zero bytes up to the next 512-byte boundary
//   end of archive: two zero-filled 512-byte blocks
//
// Names longer than 100 bytes are written as a GNU "././@LongLink"
// ('L') entry ahead of the real header; the reader also honours
// pax ('x') "path" records and skips global pax ('g') headers.
//
// Thread safety: NOT thread-safe; callers serialize access.
// ============================================================

#include "platform.hpp"
#include "gzip_stream.hpp"
#include <string>
#include <vector>

namespace tar {

static constexpr size_t TAR_BLOCK_SIZE = 512;

// Entry type flags
static constexpr char TYPE_REGULAR     = '0';
static constexpr char TYPE_REGULAR_OLD = '\0';
static constexpr char TYPE_DIRECTORY   = '5';
static constexpr char TYPE_GNU_LONGNAME = 'L';
static constexpr char TYPE_PAX_HEADER  = 'x';
static constexpr char TYPE_PAX_GLOBAL  = 'g';

static constexpr u32 DEFAULT_FILE_MODE = 0644;

struct RawHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(RawHeader) == TAR_BLOCK_SIZE, "RawHeader must be 512 bytes");

struct TarEntry {
    std::string name;
    u64  size{0};
    u64  mtime{0};   // seconds since epoch
    char type{TYPE_REGULAR};

    bool is_directory() const {
        return type == TYPE_DIRECTORY || (!name.empty() && name.back() == '/');
    }
};

class TarWriter {
public:
    explicit TarWriter(gzip::GzipWriter& out) : out_(out) {}

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    // Write a header announcing `size` data bytes for `name`.
    void begin_entry(const std::string& name, u64 size, u64 mtime_s,
                     char type = TYPE_REGULAR, u32 mode = DEFAULT_FILE_MODE);

    // Append entry data; the total must not exceed the announced size.
    void write_data(const void* data, size_t len);

    // Pad to the block boundary. Throws if fewer bytes than announced were written.
    void end_entry();

    // begin_entry + write_data + end_entry
    void put_entry(const std::string& name, const void* data, size_t len, u64 mtime_s);

    // Write the end-of-archive marker. Idempotent.
    void finish();

    u32 entry_count() const { return entry_count_; }

private:
    void write_header(const std::string& name, u64 size, u64 mtime_s, char type, u32 mode);

    gzip::GzipWriter& out_;
    u64  remaining_{0};
    u64  written_in_entry_{0};
    bool in_entry_{false};
    bool finished_{false};
    u32  entry_count_{0};
};

class TarReader {
public:
    explicit TarReader(gzip::GzipReader& in) : in_(in) {}

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advance to the next entry, skipping any unread data of the current one.
    // Returns false at the end of the archive.
    // Throws ArchiveFormatError on a corrupt header.
    bool next_entry(TarEntry& out);

    // Read up to cap bytes of the current entry's data; 0 when exhausted.
    size_t read(void* dst, size_t cap);

private:
    bool read_header_block(RawHeader& hdr);
    void skip_rest();
    std::string read_payload_string(u64 size);

    gzip::GzipReader& in_;
    u64  remaining_{0};
    u64  padding_{0};
    bool done_{false};
};

// ---- Header field helpers (exposed for tests) ----

// Parse an octal or GNU base-256 numeric field
u64 parse_number(const char* field, size_t width);

// Compute the header checksum (chksum field counted as spaces)
u32 header_checksum(const RawHeader& hdr);

} // namespace tar
