#pragma once

#include "../core/error.hpp"
#include "../vpk/vpk_format.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace shared::io {

// Read a whole file into memory. Fails with IoError.
bool read_whole_file(const std::filesystem::path& path,
                     std::vector<std::uint8_t>* outData,
                     core::Error* outError = nullptr);

// Write bytes to a file, creating parent directories. Fails with IoError.
bool write_whole_file(const std::filesystem::path& path,
                      std::span<const std::uint8_t> data,
                      core::Error* outError = nullptr);

// Write every entry of a file set below outputDir.
// Entries whose path would escape outputDir fail with InvalidPath.
bool extract_files(const vpk::FileSet& files,
                   const std::filesystem::path& outputDir,
                   core::Error* outError = nullptr);

} // namespace shared::io
