#pragma once

#include "../core/error.hpp"
#include "../vpk/archive_reader.hpp"
#include "../vpk/vpk_format.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace shared::patch {

// Parse the base and override archives concurrently.
// The override is parsed on a worker thread while the base is parsed on the
// calling thread; the worker's result is handed back once, through a future.
// If either side fails the whole call fails (the base error wins if both do).
bool load_archive_pair(std::vector<std::uint8_t> baseData,
                       std::vector<std::uint8_t> overrideData,
                       vpk::FileSet* outBase,
                       vpk::FileSet* outOverride,
                       core::Error* outError = nullptr,
                       const vpk::ReadOptions& opts = {});

// Read both archives from disk, load them concurrently, merge and encode.
// outArchive receives the bytes of the patched VPK.
bool create_terrain(const std::filesystem::path& basePath,
                    const std::filesystem::path& targetPath,
                    std::vector<std::uint8_t>* outArchive,
                    core::Error* outError = nullptr,
                    const vpk::ReadOptions& opts = {});

} // namespace shared::patch
