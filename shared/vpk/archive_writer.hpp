#pragma once

#include "vpk_format.hpp"
#include "../core/error.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shared::vpk {

// Write-side grouping: extension -> directory -> base names.
// Names are stored as they appear in the tree (" " for root / no extension).
using DirectoryTree = std::map<std::string, std::map<std::string, std::vector<std::string>>>;

// Split a logical path into tree components.
// Fails with InvalidPath for empty paths, empty file stems, absolute paths or NUL bytes.
bool split_path(const std::string& path,
                std::string* outDir,
                std::string* outName,
                std::string* outExt,
                core::Error* outError = nullptr);

bool build_directory_tree(const FileSet& files, DirectoryTree* outTree, core::Error* outError = nullptr);

// Exact byte length of the encoded tree section, terminators included.
std::uint64_t compute_tree_length(const DirectoryTree& tree);

// VPK archive writer.
// Collects files and encodes them into a single in-memory archive.
class ArchiveWriter {
public:
    ArchiveWriter();
    ~ArchiveWriter();

    // Non-copyable.
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Add a file to the archive. A later add with the same path replaces the data.
    // @param archivePath  Path inside the archive (e.g., "maps/dota.vmap_c").
    // @param data         File contents.
    void add_file(const std::string& archivePath, std::vector<std::uint8_t> data);

    void add_files(FileSet files);

    // Encode all added files.
    // On failure returns false and fills outError (if provided).
    bool build(std::vector<std::uint8_t>* outArchive, core::Error* outError = nullptr) const;

    // Get number of files added so far.
    std::uint32_t file_count() const { return static_cast<std::uint32_t>(files_.size()); }

private:
    FileSet files_;
};

bool write_archive(const FileSet& files, std::vector<std::uint8_t>* outArchive, core::Error* outError = nullptr);

} // namespace shared::vpk
