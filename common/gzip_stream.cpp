// ============================================================
// gzip_stream.cpp -- zlib gzip wrappers implementation
// ============================================================

#include "gzip_stream.hpp"
#include "errors.hpp"
#include <algorithm>
#include <climits>
#include <string>

using namespace gzip;

namespace {

std::string zlib_message(const z_stream& zs, int rc) {
    std::string msg = zs.msg ? zs.msg : "";
    if (msg.empty()) msg = "zlib error " + std::to_string(rc);
    return msg;
}

} // namespace

// ============================================================
// GzipWriter
// ============================================================

GzipWriter::GzipWriter(std::ostream& out, int level)
    : out_(out), buf_(GZIP_BUFFER_SIZE)
{
    // windowBits 15 + 16 selects the gzip wrapper instead of zlib's
    int rc = deflateInit2(&zs_, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw ArchiveStreamError("deflateInit2 failed: " + zlib_message(zs_, rc));
    }
}

GzipWriter::~GzipWriter() {
    deflateEnd(&zs_);
}

void GzipWriter::write(const void* data, size_t len) {
    if (finished_) {
        throw ArchiveStreamError("write after gzip stream was finished");
    }
    const u8* p = static_cast<const u8*>(data);
    while (len > 0) {
        uInt n = (uInt)std::min(len, (size_t)UINT_MAX);
        zs_.next_in  = const_cast<Bytef*>(p);
        zs_.avail_in = n;
        drain(Z_NO_FLUSH);
        p         += n;
        len       -= n;
    }
}

void GzipWriter::finish() {
    if (finished_) return;
    zs_.next_in  = nullptr;
    zs_.avail_in = 0;
    drain(Z_FINISH);
    out_.flush();
    if (!out_) {
        throw ArchiveStreamError("Failed to flush archive output stream");
    }
    finished_ = true;
}

void GzipWriter::drain(int flush_mode) {
    for (;;) {
        zs_.next_out  = buf_.data();
        zs_.avail_out = (uInt)buf_.size();

        int rc = deflate(&zs_, flush_mode);
        if (rc == Z_STREAM_ERROR) {
            throw ArchiveStreamError("deflate failed: " + zlib_message(zs_, rc));
        }

        size_t produced = buf_.size() - zs_.avail_out;
        if (produced > 0) {
            out_.write(reinterpret_cast<const char*>(buf_.data()), (std::streamsize)produced);
            if (!out_) {
                throw ArchiveStreamError("Failed to write archive output stream");
            }
        }

        if (flush_mode == Z_FINISH) {
            if (rc == Z_STREAM_END) return;
        } else if (zs_.avail_in == 0 && zs_.avail_out != 0) {
            return;
        }
    }
}

// ============================================================
// GzipReader
// ============================================================

GzipReader::GzipReader(std::istream& in)
    : in_(in), buf_(GZIP_BUFFER_SIZE)
{
    // windowBits 15 + 32: auto-detect gzip or zlib header
    int rc = inflateInit2(&zs_, 15 + 32);
    if (rc != Z_OK) {
        throw ArchiveStreamError("inflateInit2 failed: " + zlib_message(zs_, rc));
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&zs_);
}

bool GzipReader::refill() {
    if (input_done_) return false;
    in_.read(reinterpret_cast<char*>(buf_.data()), (std::streamsize)buf_.size());
    std::streamsize n = in_.gcount();
    if (n <= 0) {
        if (in_.bad()) {
            throw ArchiveStreamError("Failed to read archive input stream");
        }
        input_done_ = true;
        return false;
    }
    zs_.next_in  = buf_.data();
    zs_.avail_in = (uInt)n;
    return true;
}

size_t GzipReader::read(void* dst, size_t cap) {
    if (eof_ || cap == 0) return 0;

    uInt want = (uInt)std::min(cap, (size_t)UINT_MAX);
    zs_.next_out  = static_cast<Bytef*>(dst);
    zs_.avail_out = want;

    while (zs_.avail_out > 0) {
        if (zs_.avail_in == 0 && !refill()) {
            throw ArchiveFormatError("Unexpected end of gzip stream");
        }

        int rc = inflate(&zs_, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            // Another gzip member may follow; anything else ends the stream
            if (zs_.avail_in == 0) refill();
            if (zs_.avail_in == 0 || zs_.next_in[0] != 0x1f) {
                eof_ = true;
                break;
            }
            inflateReset(&zs_);
            continue;
        }
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR ||
            rc == Z_STREAM_ERROR) {
            throw ArchiveFormatError("Corrupt gzip stream: " + zlib_message(zs_, rc));
        }
    }

    return want - zs_.avail_out;
}

bool GzipReader::read_exact(void* dst, size_t len) {
    u8* p = static_cast<u8*>(dst);
    size_t got = 0;
    while (got < len) {
        size_t n = read(p + got, len - got);
        if (n == 0) {
            if (got == 0) return false;
            throw ArchiveFormatError("Truncated archive: expected " +
                                     std::to_string(len) + " bytes, got " +
                                     std::to_string(got));
        }
        got += n;
    }
    return true;
}
