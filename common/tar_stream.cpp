// ============================================================
// tar_stream.cpp -- Sequential ustar writer/reader implementation
// ============================================================

#include "tar_stream.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace tar;

namespace {

const char ZERO_BLOCK[TAR_BLOCK_SIZE] = {0};

const char* LONGLINK_NAME = "././@LongLink";

// width-1 octal digits followed by NUL; falls back to GNU base-256
// when the value does not fit.
void write_number(char* field, size_t width, u64 value) {
    u64 max_octal = (width - 1) * 3 >= 64 ? ~0ULL : (1ULL << ((width - 1) * 3)) - 1;
    if (value <= max_octal) {
        std::memset(field, '0', width - 1);
        field[width - 1] = '\0';
        for (size_t i = width - 1; i > 0 && value > 0; --i) {
            field[i - 1] = (char)('0' + (value & 7));
            value >>= 3;
        }
        return;
    }
    std::memset(field, 0, width);
    field[0] = (char)0x80;
    for (size_t i = width; i > 1 && value > 0; --i) {
        field[i - 1] = (char)(value & 0xFF);
        value >>= 8;
    }
}

void copy_field(char* field, size_t width, const std::string& s) {
    std::memset(field, 0, width);
    std::memcpy(field, s.data(), std::min(width, s.size()));
}

std::string field_string(const char* field, size_t width) {
    size_t n = 0;
    while (n < width && field[n] != '\0') ++n;
    return std::string(field, n);
}

u64 padding_for(u64 size) {
    return (TAR_BLOCK_SIZE - size % TAR_BLOCK_SIZE) % TAR_BLOCK_SIZE;
}

} // namespace

// ============================================================
// Field helpers
// ============================================================

u64 tar::parse_number(const char* field, size_t width) {
    const u8* p = reinterpret_cast<const u8*>(field);
    if (p[0] & 0x80) {
        // GNU base-256: big-endian, high bit of the first byte is the marker
        u64 value = p[0] & 0x7F;
        for (size_t i = 1; i < width; ++i) {
            value = (value << 8) | p[i];
        }
        return value;
    }

    u64 value = 0;
    size_t i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) {
        if (field[i] == '\0') return 0;
        ++i;
    }
    for (; i < width; ++i) {
        char c = field[i];
        if (c < '0' || c > '7') break;
        value = (value << 3) | (u64)(c - '0');
    }
    return value;
}

u32 tar::header_checksum(const RawHeader& hdr) {
    const u8* p = reinterpret_cast<const u8*>(&hdr);
    size_t chk_off = offsetof(RawHeader, chksum);
    u32 sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (i >= chk_off && i < chk_off + sizeof(hdr.chksum)) {
            sum += (u32)' ';
        } else {
            sum += p[i];
        }
    }
    return sum;
}

// ============================================================
// TarWriter
// ============================================================

void TarWriter::write_header(const std::string& name, u64 size, u64 mtime_s,
                             char type, u32 mode) {
    RawHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));

    copy_field(hdr.name, sizeof(hdr.name), name);
    write_number(hdr.mode,  sizeof(hdr.mode),  mode);
    write_number(hdr.uid,   sizeof(hdr.uid),   0);
    write_number(hdr.gid,   sizeof(hdr.gid),   0);
    write_number(hdr.size,  sizeof(hdr.size),  size);
    write_number(hdr.mtime, sizeof(hdr.mtime), mtime_s);
    hdr.typeflag = type;
    std::memcpy(hdr.magic, "ustar", 6);
    std::memcpy(hdr.version, "00", 2);

    // Checksum: six octal digits, NUL, space
    u32 sum = header_checksum(hdr);
    write_number(hdr.chksum, 7, sum);
    hdr.chksum[7] = ' ';

    out_.write(&hdr, sizeof(hdr));
}

void TarWriter::begin_entry(const std::string& name, u64 size, u64 mtime_s,
                            char type, u32 mode) {
    if (finished_) {
        throw ArchiveStreamError("tar: entry after end of archive: " + name);
    }
    if (in_entry_) {
        throw ArchiveStreamError("tar: previous entry not closed before " + name);
    }
    if (name.empty()) {
        throw ArchiveStreamError("tar: empty entry name");
    }

    if (name.size() > sizeof(RawHeader::name)) {
        // GNU long name: payload is the NUL-terminated name
        write_header(LONGLINK_NAME, name.size() + 1, 0, TYPE_GNU_LONGNAME, DEFAULT_FILE_MODE);
        out_.write(name.c_str(), name.size() + 1);
        u64 pad = padding_for(name.size() + 1);
        if (pad > 0) out_.write(ZERO_BLOCK, (size_t)pad);
    }

    write_header(name, size, mtime_s, type, mode);
    remaining_        = size;
    written_in_entry_ = 0;
    in_entry_         = true;
}

void TarWriter::write_data(const void* data, size_t len) {
    if (!in_entry_) {
        throw ArchiveStreamError("tar: write_data outside an entry");
    }
    if (len > remaining_) {
        throw ArchiveStreamError("tar: entry data exceeds announced size");
    }
    if (len == 0) return;
    out_.write(data, len);
    remaining_        -= len;
    written_in_entry_ += len;
}

void TarWriter::end_entry() {
    if (!in_entry_) return;
    if (remaining_ != 0) {
        throw ArchiveStreamError("tar: entry closed with " + std::to_string(remaining_) +
                                 " bytes missing");
    }
    u64 pad = padding_for(written_in_entry_);
    if (pad > 0) out_.write(ZERO_BLOCK, (size_t)pad);
    in_entry_ = false;
    ++entry_count_;
}

void TarWriter::put_entry(const std::string& name, const void* data, size_t len, u64 mtime_s) {
    begin_entry(name, len, mtime_s);
    write_data(data, len);
    end_entry();
}

void TarWriter::finish() {
    if (finished_) return;
    if (in_entry_) {
        throw ArchiveStreamError("tar: finish with an open entry");
    }
    out_.write(ZERO_BLOCK, TAR_BLOCK_SIZE);
    out_.write(ZERO_BLOCK, TAR_BLOCK_SIZE);
    finished_ = true;
}

// ============================================================
// TarReader
// ============================================================

bool TarReader::read_header_block(RawHeader& hdr) {
    if (!in_.read_exact(&hdr, sizeof(hdr))) {
        return false;
    }
    if (std::memcmp(&hdr, ZERO_BLOCK, TAR_BLOCK_SIZE) == 0) {
        return false;
    }

    u32 stored   = (u32)parse_number(hdr.chksum, sizeof(hdr.chksum));
    u32 computed = header_checksum(hdr);
    if (stored != computed) {
        throw ArchiveFormatError("tar: header checksum mismatch (stored " +
                                 std::to_string(stored) + ", computed " +
                                 std::to_string(computed) + ")");
    }
    return true;
}

void TarReader::skip_rest() {
    u8 scratch[TAR_BLOCK_SIZE * 8];
    u64 to_skip = remaining_ + padding_;
    while (to_skip > 0) {
        size_t n = (size_t)std::min<u64>(to_skip, sizeof(scratch));
        if (!in_.read_exact(scratch, n)) {
            throw ArchiveFormatError("tar: archive ends inside an entry");
        }
        to_skip -= n;
    }
    remaining_ = 0;
    padding_   = 0;
}

std::string TarReader::read_payload_string(u64 size) {
    std::string s((size_t)size, '\0');
    if (size > 0 && !in_.read_exact(&s[0], (size_t)size)) {
        throw ArchiveFormatError("tar: archive ends inside an extended header");
    }
    u64 pad = padding_for(size);
    remaining_ = 0;
    padding_   = pad;
    skip_rest();
    return s;
}

bool TarReader::next_entry(TarEntry& out) {
    if (done_) return false;
    skip_rest();

    std::string long_name;
    for (;;) {
        RawHeader hdr;
        if (!read_header_block(hdr)) {
            done_ = true;
            return false;
        }

        u64 size = parse_number(hdr.size, sizeof(hdr.size));

        if (hdr.typeflag == TYPE_GNU_LONGNAME) {
            long_name = read_payload_string(size);
            while (!long_name.empty() && long_name.back() == '\0') long_name.pop_back();
            continue;
        }
        if (hdr.typeflag == TYPE_PAX_HEADER) {
            // Records: "<len> <key>=<value>\n"
            std::string records = read_payload_string(size);
            size_t pos = 0;
            while (pos < records.size()) {
                size_t sp = records.find(' ', pos);
                if (sp == std::string::npos) break;
                u64 rec_len = std::strtoull(records.c_str() + pos, nullptr, 10);
                if (rec_len == 0 || pos + rec_len > records.size()) break;
                std::string rec = records.substr(sp + 1, pos + rec_len - sp - 2);
                if (rec.compare(0, 5, "path=") == 0) long_name = rec.substr(5);
                pos += rec_len;
            }
            continue;
        }
        if (hdr.typeflag == TYPE_PAX_GLOBAL) {
            read_payload_string(size);
            continue;
        }

        if (!long_name.empty()) {
            out.name = long_name;
        } else {
            std::string name   = field_string(hdr.name, sizeof(hdr.name));
            std::string prefix = std::memcmp(hdr.magic, "ustar", 5) == 0
                                 ? field_string(hdr.prefix, sizeof(hdr.prefix))
                                 : std::string();
            out.name = prefix.empty() ? name : prefix + "/" + name;
        }
        out.size  = size;
        out.mtime = parse_number(hdr.mtime, sizeof(hdr.mtime));
        out.type  = hdr.typeflag;

        remaining_ = size;
        padding_   = padding_for(size);
        return true;
    }
}

size_t TarReader::read(void* dst, size_t cap) {
    size_t n = (size_t)std::min<u64>(cap, remaining_);
    if (n == 0) return 0;
    if (!in_.read_exact(dst, n)) {
        throw ArchiveFormatError("tar: archive ends inside an entry");
    }
    remaining_ -= n;
    return n;
}
