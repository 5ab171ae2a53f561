/**
 * @file test_terrain_menu.cpp
 * @brief Tests for the interactive terrain selection prompt.
 */

#include <catch2/catch.hpp>

#include "core/terrain_menu.hpp"

#include <sstream>

using app::core::choose_terrain;

namespace {

const std::vector<std::string> kTerrains{"desert.vpk", "jungle.vpk", "winter.vpk"};

} // namespace

TEST_CASE("choose_terrain returns the numbered entry", "[app][menu]") {
    std::istringstream in("2\n");
    std::ostringstream out;

    REQUIRE(choose_terrain(kTerrains, in, out) == std::optional<std::string>("jungle.vpk"));
    REQUIRE(out.str().find("1) desert.vpk") != std::string::npos);
    REQUIRE(out.str().find("3) winter.vpk") != std::string::npos);
}

TEST_CASE("choose_terrain prompts again after invalid input", "[app][menu]") {
    std::istringstream in("0\nabc\n4\n3x\n3\n");
    std::ostringstream out;

    REQUIRE(choose_terrain(kTerrains, in, out) == std::optional<std::string>("winter.vpk"));
    REQUIRE(out.str().find("Invalid choice 'abc'") != std::string::npos);
    REQUIRE(out.str().find("Invalid choice '3x'") != std::string::npos);
}

TEST_CASE("choose_terrain stops on quit or end of input", "[app][menu]") {
    std::ostringstream out;

    SECTION("quit") {
        std::istringstream in("q\n");
        REQUIRE_FALSE(choose_terrain(kTerrains, in, out).has_value());
    }

    SECTION("end of input") {
        std::istringstream in("");
        REQUIRE_FALSE(choose_terrain(kTerrains, in, out).has_value());
    }
}

TEST_CASE("choose_terrain reports an empty list", "[app][menu]") {
    std::istringstream in("1\n");
    std::ostringstream out;

    REQUIRE_FALSE(choose_terrain({}, in, out).has_value());
    REQUIRE(out.str() == "No custom terrains found.\n");
}
