// ============================================================
// file_io.cpp -- File access helpers and memory-mapped I/O
// ============================================================

#include "file_io.hpp"
#include <algorithm>
#include <vector>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path + ": " + last_os_error_str());
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;

    if (size_ == 0) {
        // Empty file: no mapping needed
        data_ = nullptr;
        return;
    }

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const char*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        map_handle_  = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + last_os_error_str());
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// Path conventions
// ============================================================

bool file_io::is_meta_path(const std::string& path) {
    static const size_t n = std::strlen(UNIPACK_META_SUFFIX);
    return path.size() >= n &&
           path.compare(path.size() - n, n, UNIPACK_META_SUFFIX) == 0;
}

std::string file_io::meta_path_for(const std::string& path) {
    return is_meta_path(path) ? path : path + UNIPACK_META_SUFFIX;
}

std::string file_io::asset_path_for(const std::string& path) {
    if (!is_meta_path(path)) return path;
    return path.substr(0, path.size() - std::strlen(UNIPACK_META_SUFFIX));
}

std::string file_io::normalize_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) abs = fs::path(path);
    return abs.lexically_normal().string();
}

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& relative_path) {
    // Security: reject absolute paths and path traversal
    if (relative_path.empty()) {
        throw std::runtime_error("Empty relative path");
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\' ||
        (relative_path.size() > 1 && relative_path[1] == ':')) {
        throw std::runtime_error("Absolute path rejected: " + relative_path);
    }

    fs::path rel = fs::path(relative_path).lexically_normal();
    for (const auto& part : rel) {
        if (part == "..") {
            throw std::runtime_error("Path traversal rejected: " + relative_path);
        }
    }

    fs::path full = (root_dir / rel).lexically_normal();

    // Verify result is still under root_dir
    fs::path check = full.lexically_relative(root_dir.lexically_normal());
    if (check.empty() || check == "." || *check.begin() == "..") {
        throw std::runtime_error("Path escapes root directory: " + relative_path);
    }

    return full;
}

// ============================================================
// Queries
// ============================================================

bool file_io::is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool file_io::is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

u64 file_io::get_mtime_ns(const std::string& path) {
#ifdef _WIN32
    WIN32_FILE_ATTRIBUTE_DATA info{};
    if (!GetFileAttributesExA(path.c_str(), GetFileExInfoStandard, &info)) return 0;
    // FILETIME: 100-ns intervals since 1601-01-01; convert to ns since Unix epoch
    u64 ft = ((u64)info.ftLastWriteTime.dwHighDateTime << 32) | info.ftLastWriteTime.dwLowDateTime;
    if (ft < 116444736000000000ULL) return 0;
    return (ft - 116444736000000000ULL) * 100ULL;
#else
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
#  if defined(__linux__)
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
#  elif defined(__APPLE__)
    return (u64)st.st_mtimespec.tv_sec * 1000000000ULL + (u64)st.st_mtimespec.tv_nsec;
#  else
    return (u64)st.st_mtime * 1000000000ULL;
#  endif
#endif
}

// ============================================================
// Reads / writes
// ============================================================

std::optional<std::string> file_io::read_text(const std::string& path) {
    if (!is_regular_file(path)) return std::nullopt;
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    f.seekg(0, std::ios::end);
    size_t sz = (size_t)f.tellg();
    f.seekg(0, std::ios::beg);
    std::string buf(sz, '\0');
    if (sz > 0 && !f.read(&buf[0], (std::streamsize)sz)) {
        return std::nullopt;
    }
    return buf;
}

bool file_io::for_each_line(const std::string& path,
                            const std::function<bool(std::string_view)>& on_line) {
    if (!is_regular_file(path)) return false;
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;

    std::string line;
    while (std::getline(f, line)) {
        std::string_view view(line);
        if (!view.empty() && view.back() == '\r') view.remove_suffix(1);
        if (!on_line(view)) break;
    }
    return true;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

void file_io::write_file(const std::string& path, const void* data, size_t len) {
    ensure_parent_dirs(path);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot create file: " + path + ": " + last_os_error_str());
    }
    if (len > 0) out.write(static_cast<const char*>(data), (std::streamsize)len);
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}
