#pragma once

// Valve VPK v2 single-file archive (as shipped for Dota 2 maps).
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Header (28 bytes, 7 x u32 LE)       │
// │   signature         = 0x55AA1234    │
// │   version           = 2             │
// │   tree_length                       │
// │   embed_length                      │
// │   chunk_hash_length                 │
// │   self_hash_length  = 48            │
// │   signature_length                  │
// ├─────────────────────────────────────┤
// │ Tree (tree_length bytes)            │
// │   for each extension:   cstring     │
// │     for each directory: cstring     │
// │       for each name:    cstring     │
// │         entry record (18 bytes)     │
// │         preload bytes               │
// │       ""                            │
// │     ""                              │
// │   ""                                │
// ├─────────────────────────────────────┤
// │ Payload (embed_length bytes)        │
// ├─────────────────────────────────────┤
// │ Self hashes (3 x MD5)               │
// │   tree, chunk hashes, whole file    │
// └─────────────────────────────────────┘

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace shared::vpk {

constexpr std::uint32_t VPK_SIGNATURE = 0x55AA1234;

// Version written by ArchiveWriter.
constexpr std::uint32_t VPK_VERSION = 2;

constexpr std::size_t VPK_HEADER_SIZE = 28;

// crc(4) + preload_length(2) + archive_index(2) + offset(4) + length(4) + terminator(2)
constexpr std::size_t VPK_ENTRY_RECORD_SIZE = 18;

// Archive index marking payload stored in this file, after the tree.
constexpr std::uint16_t VPK_INLINE_ARCHIVE_INDEX = 0x7FFF;

constexpr std::uint16_t VPK_ENTRY_TERMINATOR = 0xFFFF;

// Tree placeholder for "archive root" (directory) and "no extension".
constexpr const char* VPK_EMPTY_NAME = " ";

constexpr std::size_t VPK_SELF_HASH_SIZE = 48;

struct VpkHeader {
    std::uint32_t signature{VPK_SIGNATURE};
    std::uint32_t version{VPK_VERSION};
    std::uint32_t treeLength{0};
    std::uint32_t embedLength{0};
    std::uint32_t chunkHashLength{0};
    std::uint32_t selfHashLength{0};
    std::uint32_t signatureLength{0};
};

// One record of the tree section.
struct VpkEntry {
    std::string path;
    std::vector<std::uint8_t> preload;
    std::uint32_t crc{0};
    std::uint16_t archiveIndex{VPK_INLINE_ARCHIVE_INDEX};
    // Stored as u32 relative to the payload section; widened and made
    // absolute (header + tree added) once parsed.
    std::uint64_t offset{0};
    std::uint32_t length{0};
    std::uint16_t terminator{VPK_ENTRY_TERMINATOR};
};

// Logical path -> payload bytes. The unit exchanged between reader, merger and writer.
using FileSet = std::unordered_map<std::string, std::vector<std::uint8_t>>;

} // namespace shared::vpk
