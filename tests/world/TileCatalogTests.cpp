/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TileCatalogTests
#include <boost/test/unit_test.hpp>

#include "core/Errors.hpp"
#include "world/TileCatalog.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace StrataEngine;

namespace {
const std::string GENERAL_TILES = R"({
  "spritesheet": "general",
  "tile_size": 16,
  "tiles": {
    "1": {"name": "stone", "texture": [0, 0]},
    "3": {"name": "ice", "texture": [2, 0], "texture_rotation": 1,
          "properties": {"friction": 0.1, "wall_jump": false}},
    "c": {"name": "slope", "type": "bottomleft_ramp"},
    "s": {"name": "spikes", "type": "bottom_slab",
          "properties": {"breakable": true, "damage_sides": {"top": [20, "pierce"]}}}
  }
})";
} // namespace

BOOST_AUTO_TEST_SUITE(TileCatalogTestSuite)

BOOST_AUTO_TEST_CASE(TestShapeNames) {
    BOOST_CHECK(tileShapeFromString("full") == TileShape::Full);
    BOOST_CHECK(tileShapeFromString("topright_ramp") == TileShape::RampTopRight);
    BOOST_CHECK(!tileShapeFromString("triangle").has_value());
    BOOST_CHECK_EQUAL(toString(TileShape::BottomSlab), "bottom_slab");
    BOOST_CHECK(isRampShape(TileShape::RampBottomLeft));
    BOOST_CHECK(!isRampShape(TileShape::TopSlab));
}

BOOST_AUTO_TEST_CASE(TestLoadFromJson) {
    TileCatalog catalog;
    BOOST_REQUIRE_MESSAGE(catalog.loadFromJson(GENERAL_TILES), catalog.getLastError());
    BOOST_CHECK_EQUAL(catalog.size(), 4u);

    const TileProperties& stone = catalog.get('1');
    BOOST_CHECK_EQUAL(stone.name, "stone");
    BOOST_CHECK(stone.shape == TileShape::Full);
    BOOST_CHECK(stone.collision);
    BOOST_CHECK(!stone.breakable);
    BOOST_CHECK_EQUAL(stone.friction, 1.0f);
    BOOST_CHECK(stone.wallJump);
    BOOST_CHECK_EQUAL(stone.spritesheet, "general");
    BOOST_CHECK_EQUAL(stone.spriteSize, 16);
    BOOST_CHECK(stone.hasTexture());

    const TileProperties& ice = catalog.get('3');
    BOOST_CHECK_CLOSE(ice.friction, 0.1f, 0.001f);
    BOOST_CHECK(!ice.wallJump);
    BOOST_CHECK_EQUAL(ice.textureX, 2);
    BOOST_CHECK_EQUAL(ice.textureRotation, 1);

    BOOST_CHECK(catalog.get('c').shape == TileShape::RampBottomLeft);
    BOOST_CHECK(!catalog.get('c').hasTexture());

    const TileProperties& spikes = catalog.get('s');
    BOOST_CHECK(spikes.breakable);
    BOOST_REQUIRE_EQUAL(spikes.damageSides.size(), 1u);
    BOOST_CHECK(spikes.damageSides.at(ContactSide::Top) == (TileDamage{20, "pierce"}));
}

BOOST_AUTO_TEST_CASE(TestUnknownCodeThrows) {
    TileCatalog catalog;
    BOOST_CHECK_THROW(catalog.get('x'), ConfigurationError);
    BOOST_CHECK(catalog.find('x') == nullptr);
    BOOST_CHECK(!catalog.contains('x'));
}

BOOST_AUTO_TEST_CASE(TestAirCodeIsReserved) {
    TileCatalog catalog('0');
    TileProperties air;
    air.code = '0';
    BOOST_CHECK_THROW(catalog.addTile(air), ConfigurationError);

    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"0": {"name": "air"}}})"));
    BOOST_CHECK(catalog.empty());
}

BOOST_AUTO_TEST_CASE(TestMalformedDocumentsAddNothing) {
    TileCatalog catalog;
    BOOST_CHECK(!catalog.loadFromJson("{not json"));
    BOOST_CHECK(!catalog.getLastError().empty());

    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"12": {}}})"));
    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"1": {"type": "wedge"}}})"));
    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"1": {"properties": {"friction": -1}}}})"));
    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"1": {"properties": {"collision": "yes"}}}})"));
    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"1": {"properties": {"damage_sides": {"any": [1, "x"]}}}}})"));

    // The valid first entry is not kept when a later entry fails
    BOOST_CHECK(!catalog.loadFromJson(R"({"tiles": {"1": {}, "2": {"texture": [1]}}})"));
    BOOST_CHECK(catalog.empty());

    // A document without tiles is valid
    BOOST_CHECK(catalog.loadFromJson("{}"));
    BOOST_CHECK(catalog.empty());
}

BOOST_AUTO_TEST_CASE(TestMergeOverwritesSharedCodes) {
    TileCatalog base;
    BOOST_REQUIRE(base.loadFromJson(GENERAL_TILES));

    TileCatalog extra;
    BOOST_REQUIRE(extra.loadFromJson(R"({"tiles": {"1": {"name": "granite"}, "9": {"name": "moss"}}})"));

    base.merge(extra);
    BOOST_CHECK_EQUAL(base.size(), 5u);
    BOOST_CHECK_EQUAL(base.get('1').name, "granite");
    BOOST_CHECK_EQUAL(base.get('9').name, "moss");

    const std::vector<char> expected{'1', '3', '9', 'c', 's'};
    const std::vector<char> codes = base.getCodes();
    BOOST_CHECK_EQUAL_COLLECTIONS(codes.begin(), codes.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    const std::string path = "tests/test_data/catalog_test.tile_data.json";
    std::filesystem::create_directories("tests/test_data");
    {
        std::ofstream file(path);
        file << GENERAL_TILES;
    }

    TileCatalog catalog;
    BOOST_CHECK(catalog.loadFromFile(path));
    BOOST_CHECK(catalog.contains('s'));
    std::filesystem::remove(path);

    TileCatalog missing;
    BOOST_CHECK(!missing.loadFromFile("tests/test_data/no_such.tile_data.json"));
    BOOST_CHECK(!missing.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
