// ============================================================
// cli/main.cpp -- unipack entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../package/archive_reader.hpp"
#include "export_service.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " pack <source> <output> [options]\n"
        << "  " << prog << " unpack <package> <dest_dir> [--log-level L] [--log-file F]\n"
        << "  " << prog << " list <package> [--log-level L] [--log-file F]\n"
        << "\n"
        << "  source                    project folder to pack\n"
        << "  output                    package file to create\n"
        << "\nPack options:\n"
        << "  --assets P                asset glob, repeatable (default: **.*)\n"
        << "  --exclude P               exclude glob, repeatable (default: Library/**.* and **/.*)\n"
        << "  --skip-dependency-check   pack only the selected assets\n"
        << "  --asset-root DIR          folder indexed for guids (default: Assets)\n"
        << "  --sub-folder DIR          folder inserted after Assets/ in every pathname\n"
        << "  --threads N               worker threads (default: hardware concurrency)\n"
        << "\nCommon options:\n"
        << "  --log-level L             trace, debug, info, warn or error (default: info)\n"
        << "  --log-file F              also append log lines to F\n"
        << "\nExample:\n"
        << "  " << prog << " pack ./MyProject out/MyProject.unitypackage --assets \"Assets/Prefabs/**.*\"\n";
}

// Handles --log-level / --log-file at argv[i]. Returns 1 if consumed,
// 0 if not a logging option, -1 on a bad value.
static int parse_log_option(int argc, char* argv[], int& i) {
    if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
        auto lvl = Logger::parse_level(argv[++i]);
        if (!lvl) {
            std::cerr << "ERROR: Invalid log level: " << argv[i] << "\n";
            return -1;
        }
        Logger::get().set_level(*lvl);
        return 1;
    }
    if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
        if (!Logger::get().set_log_file(argv[++i])) {
            std::cerr << "ERROR: Cannot open log file: " << argv[i] << "\n";
            return -1;
        }
        return 1;
    }
    return 0;
}

static int run_pack(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ExportSettings cfg;
    cfg.source = argv[2];
    cfg.output = argv[3];

    bool custom_assets   = false;
    bool custom_excludes = false;

    for (int i = 4; i < argc; ++i) {
        int log_opt = parse_log_option(argc, argv, i);
        if (log_opt < 0) return 1;
        if (log_opt > 0) continue;

        if (std::strcmp(argv[i], "--assets") == 0 && i + 1 < argc) {
            if (!custom_assets) cfg.asset_patterns.clear();
            custom_assets = true;
            cfg.asset_patterns.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--exclude") == 0 && i + 1 < argc) {
            if (!custom_excludes) cfg.exclude_patterns.clear();
            custom_excludes = true;
            cfg.exclude_patterns.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--skip-dependency-check") == 0) {
            cfg.skip_dependency_check = true;
        } else if (std::strcmp(argv[i], "--asset-root") == 0 && i + 1 < argc) {
            cfg.asset_root = argv[++i];
        } else if (std::strcmp(argv[i], "--sub-folder") == 0 && i + 1 < argc) {
            cfg.sub_folder = argv[++i];
        } else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n < 1 || n > 256) {
                std::cerr << "ERROR: --threads must be 1-256\n";
                return 1;
            }
            cfg.num_threads = (size_t)n;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!file_io::is_directory(cfg.source)) {
        std::cerr << "ERROR: Source folder does not exist: " << cfg.source << "\n";
        return 1;
    }
    if (cfg.output.empty() || file_io::is_directory(cfg.output)) {
        std::cerr << "ERROR: Invalid output file: " << cfg.output << "\n";
        return 1;
    }
    for (const auto& p : cfg.asset_patterns) {
        if (p.empty()) {
            std::cerr << "ERROR: Empty --assets pattern\n";
            return 1;
        }
    }

    try {
        ExportService service(std::move(cfg));
        ExportResult result = service.run();
        return result.failed == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}

static int run_unpack(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }
    std::string package  = argv[2];
    std::string dest_dir = argv[3];

    for (int i = 4; i < argc; ++i) {
        int log_opt = parse_log_option(argc, argv, i);
        if (log_opt < 0) return 1;
        if (log_opt == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        ArchiveReader reader;
        auto entries = reader.decode_file(package);
        size_t written = reader.extract(entries, dest_dir);
        LOG_INFO("unpacker: extracted " + std::to_string(written) + " of " +
                 std::to_string(entries.size()) + " assets into " + dest_dir);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}

static int run_list(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    std::string package = argv[2];

    for (int i = 3; i < argc; ++i) {
        int log_opt = parse_log_option(argc, argv, i);
        if (log_opt < 0) return 1;
        if (log_opt == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        ArchiveReader reader;
        for (const auto& entry : reader.decode_file(package)) {
            std::cout << entry.guid << "  "
                      << (entry.has_relative_path() ? *entry.relative_path : std::string("<no pathname>"))
                      << "  " << (entry.has_content() ? entry.content->size() : 0) << " bytes"
                      << (entry.has_metadata() ? "" : "  (no meta)") << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    Logger::get().set_level(LogLevel::INFO);

    if (std::strcmp(argv[1], "pack") == 0)   return run_pack(argc, argv);
    if (std::strcmp(argv[1], "unpack") == 0) return run_unpack(argc, argv);
    if (std::strcmp(argv[1], "list") == 0)   return run_list(argc, argv);

    std::cerr << "Unknown command: " << argv[1] << "\n";
    print_usage(argv[0]);
    return 1;
}
