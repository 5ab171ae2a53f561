/**
 * @file test_file_io.cpp
 * @brief Tests for whole-file reads/writes and archive extraction to disk.
 */

#include <catch2/catch.hpp>

#include "io/file_io.hpp"

#include "../../helpers/vpk_test_utils.hpp"

using namespace shared::io;
using shared::core::Error;
using shared::core::ErrorKind;
using test_helpers::TempDir;
using test_helpers::as_string;
using test_helpers::bytes;
using test_helpers::make_file_set;

namespace fs = std::filesystem;

TEST_CASE("write_whole_file creates parents and read_whole_file reads it back", "[io]") {
    TempDir dir;
    const fs::path path = dir.path() / "a" / "b" / "out.bin";
    const auto data = bytes(std::string("binary\0data", 11));

    Error err;
    REQUIRE(write_whole_file(path, data, &err));

    std::vector<std::uint8_t> back;
    REQUIRE(read_whole_file(path, &back, &err));
    REQUIRE(back == data);
}

TEST_CASE("write_whole_file truncates an existing file", "[io]") {
    TempDir dir;
    const fs::path path = dir.path() / "file.txt";

    REQUIRE(write_whole_file(path, bytes("a much longer first version")));
    REQUIRE(write_whole_file(path, bytes("short")));

    std::vector<std::uint8_t> back;
    REQUIRE(read_whole_file(path, &back));
    REQUIRE(as_string(back) == "short");
}

TEST_CASE("read_whole_file handles empty and missing files", "[io]") {
    TempDir dir;
    dir.create_file("empty.bin", std::string());

    std::vector<std::uint8_t> back{1, 2, 3};
    REQUIRE(read_whole_file(dir.path() / "empty.bin", &back));
    REQUIRE(back.empty());

    Error err;
    REQUIRE_FALSE(read_whole_file(dir.path() / "missing.bin", &back, &err));
    REQUIRE(err.kind == ErrorKind::IoError);
}

TEST_CASE("extract_files writes every entry below the output directory", "[io]") {
    TempDir dir;
    const auto files = make_file_set({
        {"maps/dota.vmap_c", "map"},
        {"readme", "text"},
    });

    REQUIRE(extract_files(files, dir.path()));

    std::vector<std::uint8_t> back;
    REQUIRE(read_whole_file(dir.path() / "maps" / "dota.vmap_c", &back));
    REQUIRE(as_string(back) == "map");
    REQUIRE(read_whole_file(dir.path() / "readme", &back));
    REQUIRE(as_string(back) == "text");
}

TEST_CASE("extract_files refuses paths escaping the output directory", "[io]") {
    TempDir dir;
    Error err;

    SECTION("parent traversal") {
        REQUIRE_FALSE(extract_files(make_file_set({{"../escape.txt", "x"}}), dir.path() / "out", &err));
        REQUIRE(err.kind == ErrorKind::InvalidPath);
        REQUIRE_FALSE(fs::exists(dir.path() / "escape.txt"));
    }

    SECTION("traversal after normalisation") {
        REQUIRE_FALSE(extract_files(make_file_set({{"a/../../escape.txt", "x"}}), dir.path() / "out", &err));
        REQUIRE(err.kind == ErrorKind::InvalidPath);
    }

    SECTION("absolute path") {
        REQUIRE_FALSE(extract_files(make_file_set({{"/tmp/escape.txt", "x"}}), dir.path() / "out", &err));
        REQUIRE(err.kind == ErrorKind::InvalidPath);
    }
}
