/**
 * @file test_archive_writer.cpp
 * @brief Unit tests for VPK encoding: tree layout, header, checksums, round-trip.
 */

#include <catch2/catch.hpp>

#include "core/byte_buffer.hpp"
#include "crypto/checksum.hpp"
#include "vpk/archive_reader.hpp"
#include "vpk/archive_writer.hpp"

#include "../../helpers/vpk_test_utils.hpp"

#include <algorithm>
#include <span>

using namespace shared::vpk;
using shared::core::ByteReader;
using shared::core::Error;
using shared::core::ErrorKind;
using test_helpers::as_string;
using test_helpers::bytes;
using test_helpers::make_file_set;

namespace {

VpkHeader decode_header(const std::vector<std::uint8_t>& archive) {
    ByteReader in(archive);
    VpkHeader h;
    h.signature = in.read_u32();
    h.version = in.read_u32();
    h.treeLength = in.read_u32();
    h.embedLength = in.read_u32();
    h.chunkHashLength = in.read_u32();
    h.selfHashLength = in.read_u32();
    h.signatureLength = in.read_u32();
    return h;
}

std::vector<std::uint8_t> encode(const FileSet& files) {
    std::vector<std::uint8_t> out;
    Error err;
    REQUIRE(write_archive(files, &out, &err));
    return out;
}

} // namespace

// =============================================================================
// Path decomposition
// =============================================================================

TEST_CASE("split_path decomposes logical paths", "[vpk][writer]") {
    std::string dir, name, ext;

    SECTION("directory, stem and extension") {
        REQUIRE(split_path("maps/sub/dota.vmap_c", &dir, &name, &ext));
        REQUIRE(dir == "maps/sub");
        REQUIRE(name == "dota");
        REQUIRE(ext == "vmap_c");
    }

    SECTION("root files use the blank directory") {
        REQUIRE(split_path("readme.txt", &dir, &name, &ext));
        REQUIRE(dir == " ");
        REQUIRE(name == "readme");
    }

    SECTION("files without extension use the blank extension") {
        REQUIRE(split_path("bin/tool", &dir, &name, &ext));
        REQUIRE(name == "tool");
        REQUIRE(ext == " ");
    }

    SECTION("only the last dot separates the extension") {
        REQUIRE(split_path("a/b.c.d", &dir, &name, &ext));
        REQUIRE(name == "b.c");
        REQUIRE(ext == "d");
    }

    SECTION("leading and trailing dots stay in the name") {
        REQUIRE(split_path("cfg/.hidden", &dir, &name, &ext));
        REQUIRE(name == ".hidden");
        REQUIRE(ext == " ");

        REQUIRE(split_path("cfg/odd.", &dir, &name, &ext));
        REQUIRE(name == "odd.");
        REQUIRE(ext == " ");
    }

    SECTION("undecomposable paths are rejected") {
        Error err;
        REQUIRE_FALSE(split_path("", &dir, &name, &ext, &err));
        REQUIRE(err.kind == ErrorKind::InvalidPath);
        REQUIRE_FALSE(split_path("maps/", &dir, &name, &ext, &err));
        REQUIRE_FALSE(split_path("/abs/file.txt", &dir, &name, &ext, &err));
        REQUIRE_FALSE(split_path(std::string("a\0b.txt", 7), &dir, &name, &ext, &err));
    }
}

// =============================================================================
// Tree length
// =============================================================================

TEST_CASE("compute_tree_length follows the tree layout", "[vpk][writer]") {
    SECTION("empty tree is a single terminator") {
        REQUIRE(compute_tree_length(DirectoryTree{}) == 1);
    }

    SECTION("single file") {
        DirectoryTree tree;
        REQUIRE(build_directory_tree(make_file_set({{"maps/dota.vmap_c", "BASE"}}), &tree));
        // 1 + (6 + 2) + (4 + 2) + (4 + 19)
        REQUIRE(compute_tree_length(tree) == 38);
    }

    SECTION("shared extension and directory are counted once") {
        DirectoryTree tree;
        REQUIRE(build_directory_tree(make_file_set({
            {"maps/a.txt", "1"},
            {"maps/bb.txt", "2"},
            {"c.txt", "3"},
        }), &tree));

        REQUIRE(tree.size() == 1);
        REQUIRE(tree.at("txt").size() == 2);
        REQUIRE(tree.at("txt").at("maps") == std::vector<std::string>{"a", "bb"});
        // 1 + (3 + 2) + [(4 + 2) + (1 + 19) + (2 + 19)] + [(1 + 2) + (1 + 19)]
        REQUIRE(compute_tree_length(tree) == 76);
    }
}

// =============================================================================
// Encoding
// =============================================================================

TEST_CASE("write_archive produces a valid header", "[vpk][writer]") {
    const FileSet files = make_file_set({
        {"maps/dota.vmap_c", "BASE"},
        {"maps/extra.vpk_c", "X"},
        {"materials/rock.vtex_c", "ROCK!"},
    });

    const auto archive = encode(files);
    const VpkHeader h = decode_header(archive);

    DirectoryTree tree;
    REQUIRE(build_directory_tree(files, &tree));

    REQUIRE(h.signature == 0x55AA1234);
    REQUIRE(h.version == 2);
    REQUIRE(h.treeLength == compute_tree_length(tree));
    REQUIRE(h.embedLength == 10);
    REQUIRE(h.chunkHashLength == 0);
    REQUIRE(h.selfHashLength == 48);
    REQUIRE(h.signatureLength == 0);
    REQUIRE(archive.size() == VPK_HEADER_SIZE + h.treeLength + h.embedLength + VPK_SELF_HASH_SIZE);
}

TEST_CASE("write_archive stores CRC-32, inline index and relative offsets", "[vpk][writer]") {
    const auto archive = encode(make_file_set({
        {"a/first.txt", "123456789"},
        {"a/second.txt", "xyz"},
    }));

    ArchiveReader reader;
    REQUIRE(reader.open(archive));

    const VpkEntry* first = reader.get_entry("a/first.txt");
    const VpkEntry* second = reader.get_entry("a/second.txt");
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);

    REQUIRE(first->crc == 0xCBF43926u);
    REQUIRE(second->crc == shared::crypto::crc32(bytes("xyz")));
    REQUIRE(first->archiveIndex == VPK_INLINE_ARCHIVE_INDEX);
    REQUIRE(first->preload.empty());

    // Names are emitted in order, payload follows the tree directly.
    const std::uint64_t payloadStart = VPK_HEADER_SIZE + reader.header().treeLength;
    REQUIRE(first->offset == payloadStart);
    REQUIRE(second->offset == payloadStart + 9);
}

TEST_CASE("write_archive appends tree, chunk and file MD5 digests", "[vpk][writer]") {
    const auto archive = encode(make_file_set({
        {"maps/dota.vmap_c", "BASE"},
        {"readme.txt", "hello"},
    }));
    const VpkHeader h = decode_header(archive);

    const std::span<const std::uint8_t> all(archive);
    const auto tree = all.subspan(VPK_HEADER_SIZE, h.treeLength);
    const auto hashes = all.subspan(archive.size() - VPK_SELF_HASH_SIZE);

    const auto treeDigest = shared::crypto::md5(tree);
    REQUIRE(std::equal(treeDigest.begin(), treeDigest.end(), hashes.begin()));

    // MD5 of nothing: d41d8cd98f00b204e9800998ecf8427e
    const std::vector<std::uint8_t> emptyMd5{0xd4, 0x1d, 0x8c, 0xd9, 0x8f, 0x00, 0xb2, 0x04,
                                             0xe9, 0x80, 0x09, 0x98, 0xec, 0xf8, 0x42, 0x7e};
    REQUIRE(std::equal(emptyMd5.begin(), emptyMd5.end(), hashes.begin() + 16));

    // Whole-file digest covers everything before it.
    const auto fileDigest = shared::crypto::md5(all.first(archive.size() - 16));
    REQUIRE(std::equal(fileDigest.begin(), fileDigest.end(), hashes.begin() + 32));
}

TEST_CASE("write_archive output reads back unchanged", "[vpk][writer]") {
    FileSet files = make_file_set({
        {"maps/dota.vmap_c", "BASE"},
        {"maps/extra.vpk_c", "X"},
        {"readme.txt", "root file"},
        {"bin/noext", "no extension"},
        {"deep/a/b/c/file.name.txt", "dots"},
        {"empty/zero.dat", ""},
    });
    std::vector<std::uint8_t> big(70000);
    for (std::size_t i = 0; i < big.size(); ++i) {
        big[i] = static_cast<std::uint8_t>(i * 31);
    }
    files["maps/big.bin"] = big;

    FileSet loaded;
    Error err;
    ReadOptions verify;
    verify.verify_crc = true;
    REQUIRE(read_archive(encode(files), &loaded, &err, verify));
    REQUIRE(loaded == files);
}

TEST_CASE("write_archive handles an empty file set", "[vpk][writer]") {
    const auto archive = encode(FileSet{});
    REQUIRE(archive.size() == VPK_HEADER_SIZE + 1 + VPK_SELF_HASH_SIZE);

    FileSet loaded;
    REQUIRE(read_archive(archive, &loaded));
    REQUIRE(loaded.empty());
}

TEST_CASE("write_archive is deterministic", "[vpk][writer]") {
    const FileSet files = make_file_set({
        {"z/last.txt", "1"},
        {"a/first.txt", "2"},
        {"m/mid.vmap_c", "3"},
        {"a/alpha.vmap_c", "4"},
    });
    REQUIRE(encode(files) == encode(files));
}

TEST_CASE("write_archive rejects paths it cannot encode", "[vpk][writer]") {
    std::vector<std::uint8_t> out;
    Error err;
    REQUIRE_FALSE(write_archive(make_file_set({{"ok.txt", "1"}, {"dir/", "2"}}), &out, &err));
    REQUIRE(err.kind == ErrorKind::InvalidPath);
    REQUIRE(out.empty());
}

TEST_CASE("ArchiveWriter collects files before encoding", "[vpk][writer]") {
    ArchiveWriter writer;
    writer.add_file("maps/dota.vmap_c", bytes("old"));
    writer.add_files(make_file_set({{"maps/extra.vpk_c", "X"}, {"maps/dota.vmap_c", "new"}}));
    REQUIRE(writer.file_count() == 2);

    std::vector<std::uint8_t> archive;
    REQUIRE(writer.build(&archive));

    FileSet loaded;
    REQUIRE(read_archive(archive, &loaded));
    REQUIRE(as_string(loaded.at("maps/dota.vmap_c")) == "new");
    REQUIRE(as_string(loaded.at("maps/extra.vpk_c")) == "X");
}

TEST_CASE("write_archive reports a missing output buffer", "[vpk][writer]") {
    Error err;
    REQUIRE_FALSE(write_archive(make_file_set({{"maps/a.txt", "1"}}), nullptr, &err));
    REQUIRE(err.kind == ErrorKind::IoError);
    REQUIRE_FALSE(err.message.empty());
}

// Runs only under an OpenSSL configuration that loads the base provider alone,
// where MD5 is unavailable (see the write_archive_without_md5 test in CMakeLists.txt).
TEST_CASE("write_archive reports an unavailable MD5 backend", "[.][openssl-base]") {
    std::vector<std::uint8_t> out;
    Error err;
    REQUIRE_FALSE(write_archive(make_file_set({{"maps/a.txt", "abc"}}), &out, &err));
    REQUIRE(err.kind == ErrorKind::SystemError);
    REQUIRE(err.message.find("cannot hash archive") != std::string::npos);
    REQUIRE(out.empty());
}
