#pragma once

// ============================================================
// errors.hpp -- Exception types raised by the packer
//
//   AssetError          one asset could not be packed; callers
//                       that fan out over many assets isolate it
//   AssetNotFoundError  an asset selected for packing is missing
//   ArchiveStreamError  the archive stream itself failed (fatal)
//   ArchiveFormatError  the archive being decoded is corrupt
// ============================================================

#include <stdexcept>
#include <string>

class AssetError : public std::runtime_error {
public:
    explicit AssetError(const std::string& msg) : std::runtime_error(msg) {}
};

class AssetNotFoundError : public AssetError {
public:
    explicit AssetNotFoundError(const std::string& path)
        : AssetError("Could not find the file " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ArchiveStreamError : public std::runtime_error {
public:
    explicit ArchiveStreamError(const std::string& msg) : std::runtime_error(msg) {}
};

class ArchiveFormatError : public std::runtime_error {
public:
    explicit ArchiveFormatError(const std::string& msg) : std::runtime_error(msg) {}
};
