#pragma once

#include "../core/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shared::install {

// Steam app id of Dota 2.
constexpr const char* kDotaAppId = "570";

struct SteamLibrary {
    std::filesystem::path path;
    std::vector<std::string> appIds;
};

// Paths of one terrain patch run, all below the game directory.
struct TerrainPaths {
    std::filesystem::path base;    // dota/maps/dota.vpk
    std::filesystem::path target;  // dota/maps/<terrain>
    std::filesystem::path output;  // dota_tempcontent/maps/dota.vpk
};

// Returns overrideDir when set, otherwise the first existing default Steam root
// ($HOME/.steam/steam, $HOME/.local/share/Steam). Fails with NotFound.
bool find_steam_dir(const std::filesystem::path& overrideDir,
                    std::filesystem::path* outDir,
                    core::Error* outError = nullptr);

// Parse the text of steamapps/libraryfolders.vdf.
// Fails with NotFound if the text is not a library folder list.
bool parse_library_folders(const std::string& text,
                           std::vector<SteamLibrary>* outLibraries,
                           core::Error* outError = nullptr);

// Locate `<library>/steamapps/common/dota 2 beta/game` via libraryfolders.vdf.
// Fails with NotFound (no library owns app 570) or IoError (vdf unreadable).
bool locate_install_base_directory(const std::filesystem::path& steamDir,
                                   std::filesystem::path* outGameDir,
                                   core::Error* outError = nullptr);

TerrainPaths build_paths(const std::filesystem::path& gameDir, const std::string& terrain);

// Returns the directory holding the stock and custom terrain archives.
std::filesystem::path maps_dir(const std::filesystem::path& gameDir);

// Lists selectable terrain archives (every *.vpk in maps_dir except dota.vpk), sorted by name.
std::vector<std::string> list_available_terrains(const std::filesystem::path& gameDir);

} // namespace shared::install
