#pragma once

// ============================================================
// archive_entry.hpp -- One decoded asset of a package archive
//
// An archive stores every asset as up to three entries under a
// folder named after its guid:
//   <guid>/asset       raw bytes
//   <guid>/asset.meta  metadata text
//   <guid>/pathname    project path ("Assets/...")
// Any of the three may be missing in a partial archive.
// ============================================================

#include <optional>
#include <string>

namespace kind {
static constexpr const char* ASSET    = "asset";
static constexpr const char* META     = "asset.meta";
static constexpr const char* PATHNAME = "pathname";
} // namespace kind

struct ArchiveEntry {
    std::string guid;
    std::optional<std::string> relative_path;
    std::optional<std::string> metadata;
    std::optional<std::string> content;

    bool has_relative_path() const { return relative_path.has_value(); }
    bool has_metadata() const { return metadata.has_value(); }
    bool has_content() const { return content.has_value(); }
};
