#pragma once

#include "vpk_format.hpp"
#include "../core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shared::core {
class ByteReader;
}

namespace shared::vpk {

struct ReadOptions {
    // Compare every loaded payload against the CRC-32 stored in the tree.
    bool verify_crc{false};
};

// VPK archive reader.
// Takes ownership of an in-memory archive, parses its header and tree,
// and provides access to the contained files.
class ArchiveReader {
public:
    ArchiveReader();
    ~ArchiveReader();

    // Non-copyable, movable.
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;

    // Parse header and tree of an archive held in memory.
    // On failure returns false and fills outError (if provided).
    bool open(std::vector<std::uint8_t> data, core::Error* outError = nullptr);

    // Release the archive bytes and the parsed index.
    void close();

    bool is_open() const { return open_; }

    const VpkHeader& header() const { return header_; }

    // Entries in tree order. Offsets are already absolute.
    const std::vector<VpkEntry>& entries() const { return entries_; }

    bool has_file(const std::string& path) const;

    const VpkEntry* get_entry(const std::string& path) const;

    // Payload of a single file, or std::nullopt if missing or unreadable.
    std::optional<std::vector<std::uint8_t>> extract(const std::string& path,
                                                     core::Error* outError = nullptr,
                                                     const ReadOptions& opts = {}) const;

    // List files in a directory within the archive.
    // @param dirPath  Directory path (e.g., "maps/"). Empty string for root.
    // @return Sorted entry names (files end without '/', dirs end with '/').
    std::vector<std::string> list_directory(const std::string& dirPath) const;

    // Load every payload into outFiles, keyed by logical path.
    bool load_all(FileSet* outFiles, core::Error* outError = nullptr, const ReadOptions& opts = {}) const;

private:
    bool read_header(core::ByteReader& in, core::Error* outError);
    bool read_tree(core::ByteReader& in, core::Error* outError);
    bool validate_entry(VpkEntry& entry, core::Error* outError) const;
    bool read_payload(const VpkEntry& entry,
                      std::vector<std::uint8_t>* out,
                      core::Error* outError,
                      const ReadOptions& opts) const;

    std::vector<std::uint8_t> data_;
    VpkHeader header_{};
    std::vector<VpkEntry> entries_;
    std::unordered_map<std::string, std::size_t> pathIndex_;  // path -> index in entries_
    bool open_{false};
};

// Parse a whole archive into a FileSet.
// On failure returns false and fills outError (if provided).
bool read_archive(std::vector<std::uint8_t> data,
                  FileSet* outFiles,
                  core::Error* outError = nullptr,
                  const ReadOptions& opts = {});

} // namespace shared::vpk
