#pragma once

// ============================================================
// export_service.hpp -- "pack" pipeline
//
//   1. select seed assets under source with the asset/exclude patterns
//   2. pack the seeds
//   3. unless skipped: index every .meta under the asset root,
//      resolve the dependency closure of the seeds, pack the rest
//   4. finish the archive
// Any failure is logged and rethrown.
// ============================================================

#include "export_settings.hpp"
#include <utility>

class ExportService {
public:
    explicit ExportService(ExportSettings settings) : settings_(std::move(settings)) {}

    ExportResult run();

    const ExportSettings& settings() const { return settings_; }

private:
    ExportResult run_impl();

    ExportSettings settings_;
};
