// ============================================================
// export_service.cpp -- "pack" pipeline implementation
// ============================================================

#include "export_service.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../deps/asset_index.hpp"
#include "../deps/dependency_resolver.hpp"
#include "../deps/file_matcher.hpp"
#include "../package/archive_writer.hpp"
#include <chrono>
#include <exception>
#include <set>
#include <stdexcept>

ExportResult ExportService::run() {
    try {
        return run_impl();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("export: failed to pack ") + settings_.source + ": " + e.what());
        throw;
    }
}

ExportResult ExportService::run_impl() {
    auto t0 = std::chrono::steady_clock::now();
    ExportResult result;

    if (!file_io::is_directory(settings_.source)) {
        throw std::runtime_error("Source folder does not exist: " + settings_.source);
    }
    std::string source = file_io::normalize_path(settings_.source);

    ThreadPool pool(settings_.num_threads);
    ArchiveWriter writer(source, settings_.output, pool);
    writer.set_sub_folder(settings_.sub_folder);

    // 1. Seeds
    FileMatcher matcher;
    matcher.add_includes(settings_.asset_patterns);
    matcher.add_excludes(settings_.exclude_patterns);
    std::vector<std::string> matched = matcher.match(source);

    // foo.png and foo.png.meta both select foo.png. The package being
    // written is never one of its own assets.
    std::string output = file_io::normalize_path(settings_.output);
    std::set<std::string> seed_set;
    for (const auto& path : matched) {
        std::string asset = file_io::normalize_path(file_io::asset_path_for(path));
        if (asset == output) continue;
        seed_set.insert(asset);
    }
    std::vector<std::string> seeds(seed_set.begin(), seed_set.end());
    result.selected = seeds.size();
    LOG_INFO("export: " + std::to_string(seeds.size()) + " assets selected under " + source);

    // 2. Pack seeds
    AddSummary summary = writer.add_assets(seeds);
    result.written += summary.written;
    result.skipped += summary.skipped;
    result.failed  += summary.failed;

    // 3. Dependencies
    if (!settings_.skip_dependency_check) {
        std::string asset_root = (fs::path(source) / settings_.asset_root).string();

        FileMatcher meta_matcher;
        meta_matcher.add_include("**/*.meta");
        meta_matcher.add_excludes(settings_.exclude_patterns);

        AssetIndex index(pool);
        size_t index_failed = index.index_files(meta_matcher.match(asset_root));
        if (index_failed > 0) {
            LOG_WARN("export: " + std::to_string(index_failed) + " metadata files could not be indexed");
        }
        LOG_DEBUG("export: indexed " + std::to_string(index.guid_count()) + " guids under " + asset_root);

        DependencyResolver resolver(index, nullptr, pool);
        PathSet closure = resolver.resolve(seeds);

        std::vector<std::string> extra;
        for (const auto& path : closure) {
            if (!seed_set.count(path) && path != output) extra.push_back(path);
        }
        result.dependencies = extra.size();
        LOG_INFO("export: " + std::to_string(extra.size()) + " additional dependencies found");

        summary = writer.add_assets(extra);
        result.written += summary.written;
        result.skipped += summary.skipped;
        result.failed  += summary.failed;
    }

    // 4. Finish
    writer.finish();

    auto t1 = std::chrono::steady_clock::now();
    result.elapsed_ms = (u64)std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    LOG_INFO("export: finished packing " + std::to_string(result.written) + " assets in " +
             std::to_string(result.elapsed_ms) + "ms");
    return result;
}
