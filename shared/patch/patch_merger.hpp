#pragma once

#include "../core/error.hpp"
#include "../vpk/vpk_format.hpp"

#include <string>

namespace shared::patch {

// File name the game loads the terrain map from.
constexpr const char* kMapFileName = "dota.vmap_c";
constexpr const char* kMapFileSuffix = ".vmap_c";

// Returns the path of the override's map file, or an empty string if there is none.
// With several candidates the lexicographically smallest path is chosen.
std::string find_map_file(const vpk::FileSet& files);

// Path with the same directory but file name `dota.vmap_c`.
std::string canonical_map_path(const std::string& mapPath);

// Merge base archive contents into the override (target) archive.
// The target's map file is renamed to dota.vmap_c; base entries only fill paths
// the renamed target does not already have.
// Fails with NoMapFile if the target has no .vmap_c entry.
bool merge_file_sets(vpk::FileSet base,
                     vpk::FileSet target,
                     vpk::FileSet* outMerged,
                     core::Error* outError = nullptr);

} // namespace shared::patch
