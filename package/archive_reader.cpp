// ============================================================
// archive_reader.cpp -- Package archive reader implementation
// ============================================================

#include "archive_reader.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/gzip_stream.hpp"
#include "../common/logger.hpp"
#include "../common/tar_stream.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <map>

// ============================================================
// LineEndingNormalizer
// ============================================================

bool LineEndingNormalizer::looks_binary(const char* data, size_t len) {
    size_t scan = std::min(len, BINARY_SCAN_SIZE);
    for (size_t i = 0; i < scan; ++i) {
        u8 b = (u8)data[i];
        if (b < 8 || (b > 13 && b < 32) || b == 255) return true;
    }
    return false;
}

void LineEndingNormalizer::feed(const char* data, size_t len, std::string& out) {
    if (len == 0) return;
    if (!decided_) {
        binary_  = looks_binary(data, len);
        decided_ = true;
    }
    if (binary_) {
        out.append(data, len);
        return;
    }

    out.reserve(out.size() + len + len / 16);
    for (size_t i = 0; i < len; ++i) {
        char c = data[i];
        if (c == '\n' && !prev_cr_) out += '\r';
        out += c;
        prev_cr_ = (c == '\r');
    }
}

// ============================================================
// ArchiveReader
// ============================================================

namespace {

std::string read_entry_data(tar::TarReader& tar) {
    std::string data;
    LineEndingNormalizer normalizer;
    char buf[READ_BUFFER_SIZE];
    for (;;) {
        size_t n = tar.read(buf, sizeof(buf));
        if (n == 0) break;
        normalizer.feed(buf, n, data);
    }
    return data;
}

// "<guid>/<kind>"; a leading "./" is ignored. False when there is no folder.
bool split_entry_name(const std::string& name, std::string& guid, std::string& kind_name) {
    std::string n = name;
    while (n.compare(0, 2, "./") == 0) n.erase(0, 2);

    size_t slash = n.find('/');
    if (slash == std::string::npos) return false;
    guid = n.substr(0, slash);
    kind_name = n.substr(slash + 1);
    return !guid.empty();
}

// First line of a pathname entry, without line terminators
std::string first_line(const std::string& text) {
    size_t end = text.find_first_of("\r\n");
    return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

std::vector<ArchiveEntry> ArchiveReader::decode(std::istream& in) {
    ignored_ = 0;

    gzip::GzipReader gz(in);
    tar::TarReader tar(gz);
    std::map<std::string, ArchiveEntry> by_guid;

    tar::TarEntry te;
    while (tar.next_entry(te)) {
        if (te.is_directory()) continue;

        std::string guid, kind_name;
        if (!split_entry_name(te.name, guid, kind_name)) {
            LOG_WARN("unpacker: skipping " + te.name + " because it has no folder");
            ++ignored_;
            continue;
        }

        // The folder is an entry even if none of its files are recognized
        ArchiveEntry& entry = by_guid[guid];
        if (entry.guid.empty()) {
            LOG_TRACE("unpacker: new entry " + guid);
            entry.guid = guid;
        }

        if (kind_name != kind::ASSET && kind_name != kind::META && kind_name != kind::PATHNAME) {
            LOG_WARN("unpacker: skipping " + te.name + " because it is an unknown file");
            ++ignored_;
            continue;
        }

        std::string data = read_entry_data(tar);
        if (kind_name == kind::ASSET) {
            entry.content = std::move(data);
        } else if (kind_name == kind::META) {
            entry.metadata = std::move(data);
        } else {
            entry.relative_path = std::move(data);
        }
    }

    std::vector<ArchiveEntry> entries;
    entries.reserve(by_guid.size());
    for (auto& kv : by_guid) entries.push_back(std::move(kv.second));

    LOG_DEBUG("unpacker: decoded " + std::to_string(entries.size()) + " entries, " +
              std::to_string(ignored_) + " ignored");
    return entries;
}

std::vector<ArchiveEntry> ArchiveReader::decode_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArchiveStreamError("Cannot open package " + path + ": " + last_os_error_str());
    }
    return decode(in);
}

size_t ArchiveReader::extract(const std::vector<ArchiveEntry>& entries,
                              const std::string& dest_dir) {
    fs::path root(file_io::normalize_path(dest_dir));
    size_t written = 0;

    for (const auto& entry : entries) {
        if (!entry.has_relative_path()) {
            LOG_WARN("unpacker: skipping " + entry.guid + " because it has no pathname");
            continue;
        }

        std::string rel = first_line(*entry.relative_path);
        fs::path target;
        try {
            target = file_io::safe_join(root, rel);
        } catch (const std::exception& e) {
            LOG_WARN("unpacker: skipping " + entry.guid + ": " + e.what());
            continue;
        }

        if (entry.has_content()) {
            file_io::write_file(target.string(), entry.content->data(), entry.content->size());
        }
        if (entry.has_metadata()) {
            file_io::write_file(file_io::meta_path_for(target.string()),
                                entry.metadata->data(), entry.metadata->size());
        }
        LOG_INFO("unpacker: extracted " + rel + " ( " + entry.guid + " )");
        ++written;
    }
    return written;
}
