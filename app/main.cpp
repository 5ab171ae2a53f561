// terrainmod - installs a custom Dota 2 terrain.
//
// Merges a custom terrain archive over the stock dota.vpk and writes the
// result to dota_tempcontent/maps/dota.vpk.
//
// Usage:
//   terrainmod [options]
//   terrainmod --list <archive.vpk>
//   terrainmod --extract <archive.vpk> <dir>

#include "core/config.hpp"
#include "core/terrain_menu.hpp"

#include "core/error.hpp"
#include "core/log.hpp"
#include "install/steam_locator.hpp"
#include "io/file_io.hpp"
#include "patch/terrain_loader.hpp"
#include "vpk/archive_reader.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifndef TERRAINMOD_VERSION
#define TERRAINMOD_VERSION "0.0.0-dev"
#endif

namespace fs = std::filesystem;

using shared::core::Error;
using shared::core::LogLevel;
using shared::core::logf;

namespace {

constexpr const char* kDefaultConfigFile = "terrainmod.ini";

void print_usage(const char* progname) {
    std::cout << "terrainmod v" << TERRAINMOD_VERSION << "\n\n";
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>           Config file (default: " << kDefaultConfigFile << ")\n";
    std::cout << "  --game-dir <dir>          Dota 2 'game' directory (default: detect via Steam)\n";
    std::cout << "  --steam-dir <dir>         Steam root used for detection\n";
    std::cout << "  --terrain <file.vpk>      Terrain archive in dota/maps (default: ask)\n";
    std::cout << "  --output <file>           Output archive path\n";
    std::cout << "  --list <archive.vpk>      Print the entries of an archive and exit\n";
    std::cout << "  --extract <archive> <dir> Unpack an archive into a directory and exit\n";
    std::cout << "  --verify-crc              Check payload CRCs while reading\n";
    std::cout << "  --verbose                 Enable debug logging\n";
    std::cout << "  --quiet                   Only log errors\n";
    std::cout << "  --help                    Show this help message\n";
}

struct Args {
    std::string configFile;
    std::string gameDir;
    std::string steamDir;
    std::string terrain;
    std::string output;
    std::string listArchive;
    std::string extractArchive;
    std::string extractDir;
    bool verifyCrc = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

bool parse_args(int argc, char* argv[], Args& args) {
    auto need_value = [&](int i, const char* opt) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << opt << " requires a value.\n";
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        } else if (std::strcmp(arg, "--config") == 0) {
            if (!need_value(i, arg)) return false;
            args.configFile = argv[++i];
        } else if (std::strcmp(arg, "--game-dir") == 0) {
            if (!need_value(i, arg)) return false;
            args.gameDir = argv[++i];
        } else if (std::strcmp(arg, "--steam-dir") == 0) {
            if (!need_value(i, arg)) return false;
            args.steamDir = argv[++i];
        } else if (std::strcmp(arg, "--terrain") == 0) {
            if (!need_value(i, arg)) return false;
            args.terrain = argv[++i];
        } else if (std::strcmp(arg, "--output") == 0 || std::strcmp(arg, "-o") == 0) {
            if (!need_value(i, arg)) return false;
            args.output = argv[++i];
        } else if (std::strcmp(arg, "--list") == 0) {
            if (!need_value(i, arg)) return false;
            args.listArchive = argv[++i];
        } else if (std::strcmp(arg, "--extract") == 0) {
            if (i + 2 >= argc) {
                std::cerr << "Error: --extract requires an archive and a directory.\n";
                return false;
            }
            args.extractArchive = argv[++i];
            args.extractDir = argv[++i];
        } else if (std::strcmp(arg, "--verify-crc") == 0) {
            args.verifyCrc = true;
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            args.verbose = true;
        } else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        }
    }

    return true;
}

int report(const Error& err) {
    logf(LogLevel::Error, "terrainmod", "%s: %s",
         shared::core::error_kind_name(err.kind), err.message.c_str());
    return 1;
}

int list_archive(const fs::path& path, const shared::vpk::ReadOptions& opts) {
    Error err;
    std::vector<std::uint8_t> data;
    if (!shared::io::read_whole_file(path, &data, &err)) {
        return report(err);
    }

    shared::vpk::ArchiveReader reader;
    if (!reader.open(std::move(data), &err)) {
        return report(err);
    }

    const auto& h = reader.header();
    std::printf("%s: VPK v%u, tree %u bytes, embedded %u bytes, %zu entries\n",
                path.string().c_str(), h.version, h.treeLength, h.embedLength, reader.entries().size());

    for (const auto& entry : reader.entries()) {
        std::printf("  %08X %10u  %s\n", entry.crc, entry.length, entry.path.c_str());
        if (opts.verify_crc && !reader.extract(entry.path, &err, opts)) {
            return report(err);
        }
    }
    return 0;
}

int extract_archive(const fs::path& path, const fs::path& outDir, const shared::vpk::ReadOptions& opts) {
    Error err;
    std::vector<std::uint8_t> data;
    shared::vpk::FileSet files;
    if (!shared::io::read_whole_file(path, &data, &err) ||
        !shared::vpk::read_archive(std::move(data), &files, &err, opts) ||
        !shared::io::extract_files(files, outDir, &err)) {
        return report(err);
    }

    logf(LogLevel::Info, "extract", "wrote %zu files to %s", files.size(), outDir.string().c_str());
    return 0;
}

int patch_terrain(const app::core::PathsConfig& paths, const shared::vpk::ReadOptions& opts) {
    Error err;

    fs::path gameDir = paths.game_dir;
    if (gameDir.empty()) {
        fs::path steamDir;
        if (!shared::install::find_steam_dir(paths.steam_dir, &steamDir, &err) ||
            !shared::install::locate_install_base_directory(steamDir, &gameDir, &err)) {
            return report(err);
        }
    }
    logf(LogLevel::Info, "terrainmod", "game directory: %s", gameDir.string().c_str());

    std::string terrain = paths.terrain;
    if (terrain.empty()) {
        const auto choice = app::core::choose_terrain(
            shared::install::list_available_terrains(gameDir), std::cin, std::cout);
        if (!choice) {
            logf(LogLevel::Info, "terrainmod", "no terrain selected");
            return 1;
        }
        terrain = *choice;
    }

    shared::install::TerrainPaths tp = shared::install::build_paths(gameDir, terrain);
    if (!paths.output.empty()) {
        tp.output = paths.output;
    }

    std::vector<std::uint8_t> archive;
    if (!shared::patch::create_terrain(tp.base, tp.target, &archive, &err, opts)) {
        return report(err);
    }

    if (!shared::io::write_whole_file(tp.output, archive, &err)) {
        return report(err);
    }

    logf(LogLevel::Info, "terrainmod", "installed %s as %s", terrain.c_str(), tp.output.string().c_str());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& config = app::core::Config::instance();
    const std::string configFile = args.configFile.empty() ? kDefaultConfigFile : args.configFile;
    const bool configLoaded = config.load_from_file(configFile);
    if (!configLoaded && !args.configFile.empty()) {
        std::cerr << "Error: cannot read config file " << configFile << "\n";
        return 2;
    }

    app::core::AppConfig& cfg = config.mutable_get();
    if (!args.gameDir.empty()) cfg.paths.game_dir = args.gameDir;
    if (!args.steamDir.empty()) cfg.paths.steam_dir = args.steamDir;
    if (!args.terrain.empty()) cfg.paths.terrain = args.terrain;
    if (!args.output.empty()) cfg.paths.output = args.output;
    if (args.verifyCrc) cfg.archive.verify_crc = true;
    if (args.verbose) cfg.logging.level = LogLevel::Debug;
    if (args.quiet) cfg.logging.level = LogLevel::Error;

    shared::core::Logger::instance().init(cfg.logging);
    if (configLoaded) {
        logf(LogLevel::Debug, "config", "loaded %s", config.loaded_from_path().c_str());
    }

    shared::vpk::ReadOptions opts;
    opts.verify_crc = cfg.archive.verify_crc;

    int rc = 0;
    try {
        if (!args.listArchive.empty()) {
            rc = list_archive(args.listArchive, opts);
        } else if (!args.extractArchive.empty()) {
            rc = extract_archive(args.extractArchive, args.extractDir, opts);
        } else {
            rc = patch_terrain(cfg.paths, opts);
        }
    } catch (const std::exception& e) {
        logf(LogLevel::Fatal, "terrainmod", "unexpected error: %s", e.what());
        rc = 1;
    }

    shared::core::Logger::instance().shutdown();
    return rc;
}
