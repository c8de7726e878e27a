#pragma once

// ============================================================
// export_settings.hpp -- Options for one "pack" run
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>

struct ExportSettings {
    std::string source;         // project folder
    std::string output;         // package file to create

    // Seed selection, matched relative to source
    std::vector<std::string> asset_patterns{"**.*"};
    std::vector<std::string> exclude_patterns{"Library/**.*", "**/.*"};

    bool        skip_dependency_check{false};
    std::string asset_root{UNIPACK_DEFAULT_ROOT_FOLDER};  // indexed for guids, relative to source
    std::string sub_folder;     // inserted after "Assets/" in every pathname
    size_t      num_threads{0}; // 0 = hardware concurrency
};

struct ExportResult {
    size_t selected{0};      // assets matched by the patterns
    size_t dependencies{0};  // closure members that were not selected
    size_t written{0};
    size_t skipped{0};
    size_t failed{0};
    u64    elapsed_ms{0};
};
