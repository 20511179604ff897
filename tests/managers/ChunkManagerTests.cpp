/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ChunkManagerTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorld.hpp"
#include "core/Errors.hpp"
#include "managers/ChunkManager.hpp"
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <stdexcept>

using namespace StrataEngine;
using namespace StrataEngine::TestWorld;

namespace {
// Centre of a chunk in world space
Vector2D chunkCenter(int cx, int cy) {
    return Vector2D((static_cast<float>(cx) + 0.5f) * CHUNK, (static_cast<float>(cy) + 0.5f) * CHUNK);
}

bool logHas(const BrokenTileLog& log, ChunkCoord chunk, TilePos local) {
    auto it = log.find(chunk);
    return it != log.end() && it->second.count(local) > 0;
}
} // namespace

class ChunkManagerFixture {
public:
    ChunkManagerFixture() : catalog(makeCatalog()), config(makeConfig()) {}

    std::unique_ptr<ChunkManager> makeManager(RawChunkMap raw) {
        return std::make_unique<ChunkManager>(catalog, std::move(raw), config);
    }

protected:
    TileCatalog catalog;
    SimulationConfig config;
};

BOOST_FIXTURE_TEST_SUITE(ChunkStreamingTests, ChunkManagerFixture)

BOOST_AUTO_TEST_CASE(TestWantedChunksFormADiamond) {
    for (int radius : {0, 1, 2, 5}) {
        config.chunkLoadRadius = radius;
        auto manager = makeManager({});
        const ChunkCoord center{3, -2};
        const auto wanted = manager->getWantedChunks(chunkCenter(center.x, center.y));

        BOOST_CHECK_EQUAL(wanted.size(), static_cast<size_t>(2 * radius * radius + 2 * radius + 1));
        for (const ChunkCoord& coord : wanted) {
            BOOST_CHECK_LE(std::abs(coord.x - center.x) + std::abs(coord.y - center.y), radius);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestChunkCoordUsesFloor) {
    auto manager = makeManager({});
    BOOST_CHECK_EQUAL(manager->toChunkCoord(Vector2D(0.0f, 0.0f)), (ChunkCoord{0, 0}));
    BOOST_CHECK_EQUAL(manager->toChunkCoord(Vector2D(CHUNK - 0.5f, CHUNK)), (ChunkCoord{0, 1}));
    BOOST_CHECK_EQUAL(manager->toChunkCoord(Vector2D(-0.5f, -CHUNK - 1.0f)), (ChunkCoord{-1, -2}));
}

BOOST_AUTO_TEST_CASE(TestUpdateLoadsOnlyAuthoredChunksInRange) {
    RawChunkMap raw;
    for (ChunkCoord coord : {ChunkCoord{0, 0}, ChunkCoord{1, 0}, ChunkCoord{6, 0}, ChunkCoord{3, 3},
                             ChunkCoord{-2, -1}}) {
        raw[coord] = floorChunk();
    }
    auto manager = makeManager(raw);

    manager->update(chunkCenter(0, 0));
    const std::vector<ChunkCoord> first{{-2, -1}, {0, 0}, {1, 0}};
    const auto loaded = manager->getLoadedChunks();
    BOOST_CHECK_EQUAL_COLLECTIONS(loaded.begin(), loaded.end(), first.begin(), first.end());

    manager->update(chunkCenter(5, 0));
    const std::vector<ChunkCoord> second{{0, 0}, {1, 0}, {3, 3}, {6, 0}};
    const auto moved = manager->getLoadedChunks();
    BOOST_CHECK_EQUAL_COLLECTIONS(moved.begin(), moved.end(), second.begin(), second.end());
    BOOST_CHECK(!manager->isLoaded(ChunkCoord{-2, -1}));
    BOOST_CHECK(manager->getChunk(ChunkCoord{-2, -1}) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestLoadedChunksAreKeptAcrossUpdates) {
    RawChunkMap raw{{ChunkCoord{0, 0}, floorChunk()}};
    auto manager = makeManager(raw);

    manager->update(chunkCenter(0, 0));
    const Chunk* before = manager->getChunk(ChunkCoord{0, 0});
    manager->update(chunkCenter(1, 1));
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0}) == before);

    manager->refresh();
    BOOST_CHECK_EQUAL(manager->getLoadedChunkCount(), 0u);
    manager->update(chunkCenter(0, 0));
    BOOST_CHECK_EQUAL(manager->getLoadedChunkCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestUnknownCodeFailsLoad) {
    RawChunk bad;
    bad.middleground = layer();
    put(*bad.middleground, 1, 1, 'z');
    auto manager = makeManager({{ChunkCoord{0, 0}, bad}});
    BOOST_CHECK_THROW(manager->update(chunkCenter(0, 0)), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestFailedLoadKeepsWorkingSet) {
    config.chunkLoadRadius = 0;
    RawChunk bad;
    bad.middleground = layer();
    put(*bad.middleground, 1, 1, 'z');
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk()}, {ChunkCoord{1, 0}, bad}});

    manager->update(chunkCenter(0, 0));
    BOOST_REQUIRE(manager->isLoaded(ChunkCoord{0, 0}));

    // Moving onto the bad chunk would unload (0, 0); the throw must happen first
    BOOST_CHECK_THROW(manager->update(chunkCenter(1, 0)), ConfigurationError);
    BOOST_CHECK(manager->isLoaded(ChunkCoord{0, 0}));
    BOOST_CHECK(!manager->isLoaded(ChunkCoord{1, 0}));
    BOOST_CHECK_EQUAL(manager->getLoadedChunkCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestGetTileAt) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk()}});
    BOOST_CHECK(manager->getTileAt(Vector2D(10.0f, 15.0f * TILE + 1.0f)) == nullptr);

    manager->update(chunkCenter(0, 0));
    const Tile* tile = manager->getTileAt(Vector2D(3.0f * TILE + 1.0f, 15.0f * TILE + 1.0f));
    BOOST_REQUIRE(tile != nullptr);
    BOOST_CHECK_EQUAL(tile->getLocal(), (TilePos{3, 15}));
    BOOST_CHECK(manager->getTileAt(Vector2D(10.0f, 10.0f)) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ChunkBreakingTests, ChunkManagerFixture)

BOOST_AUTO_TEST_CASE(TestBrokenTilesSurviveReload) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk('2')}});
    manager->update(chunkCenter(0, 0));

    manager->breakTile(ChunkCoord{0, 0}, TilePos{4, 15});
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0})->getTile(TilePos{4, 15}) == nullptr);
    BOOST_CHECK(logHas(manager->getBrokenTiles(), ChunkCoord{0, 0}, TilePos{4, 15}));

    // Out of range, then back: rebuilt from raw minus the log
    manager->update(chunkCenter(20, 0));
    BOOST_CHECK(!manager->isLoaded(ChunkCoord{0, 0}));
    manager->update(chunkCenter(0, 0));

    const Chunk* reloaded = manager->getChunk(ChunkCoord{0, 0});
    BOOST_REQUIRE(reloaded != nullptr);
    BOOST_CHECK(reloaded->getTile(TilePos{4, 15}) == nullptr);
    BOOST_CHECK(reloaded->getTile(TilePos{5, 15}) != nullptr);
    BOOST_CHECK_EQUAL(reloaded->getTileCount(), static_cast<size_t>(TILES_PER_SIDE - 1));
}

BOOST_AUTO_TEST_CASE(TestNoOpBreaksAreIdempotent) {
    RawChunk raw = floorChunk('1');
    put(*raw.middleground, 0, 0, '2');
    auto manager = makeManager({{ChunkCoord{0, 0}, raw}});
    manager->update(chunkCenter(0, 0));

    for (int i = 0; i < 3; ++i) {
        manager->breakTile(ChunkCoord{0, 0}, TilePos{4, 15});
        manager->breakTile(ChunkCoord{0, 0}, TilePos{4, 14});
    }
    BOOST_CHECK(manager->getBrokenTiles().empty());
    BOOST_CHECK_EQUAL(manager->getChunk(ChunkCoord{0, 0})->getTileCount(),
                      static_cast<size_t>(TILES_PER_SIDE + 1));

    manager->breakTile(ChunkCoord{0, 0}, TilePos{0, 0});
    manager->breakTile(ChunkCoord{0, 0}, TilePos{0, 0});
    BOOST_CHECK_EQUAL(manager->getBrokenTiles().at(ChunkCoord{0, 0}).size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestBreakSurroundingsBreaksPlusShape) {
    RawChunk raw;
    raw.middleground = layer();
    for (TilePos pos : {TilePos{5, 5}, TilePos{4, 5}, TilePos{6, 5}, TilePos{5, 4}, TilePos{5, 6}}) {
        put(*raw.middleground, pos.x, pos.y, '2');
    }
    // Unbreakable neighbours of the arms
    put(*raw.middleground, 3, 5, '1');
    put(*raw.middleground, 7, 5, '1');
    put(*raw.middleground, 5, 3, '1');
    auto manager = makeManager({{ChunkCoord{0, 0}, raw}});
    manager->update(chunkCenter(0, 0));

    manager->breakTile(ChunkCoord{0, 0}, TilePos{5, 5}, true);

    const std::set<TilePos> expected{{5, 5}, {4, 5}, {6, 5}, {5, 4}, {5, 6}};
    const auto& broken = manager->getBrokenTiles().at(ChunkCoord{0, 0});
    BOOST_CHECK_EQUAL_COLLECTIONS(broken.begin(), broken.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(manager->getChunk(ChunkCoord{0, 0})->getTileCount(), 3u);
}

BOOST_AUTO_TEST_CASE(TestBreakSurroundingsStopsAtChunkEdge) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk('2')}, {ChunkCoord{1, 0}, floorChunk('2')}});
    manager->update(chunkCenter(0, 0));

    manager->breakTile(ChunkCoord{0, 0}, TilePos{15, 15}, true);
    BOOST_CHECK_EQUAL(manager->getBrokenTiles().at(ChunkCoord{0, 0}).size(), static_cast<size_t>(TILES_PER_SIDE));
    BOOST_CHECK(manager->getBrokenTiles().count(ChunkCoord{1, 0}) == 0);
    BOOST_CHECK_EQUAL(manager->getChunk(ChunkCoord{1, 0})->getTileCount(), static_cast<size_t>(TILES_PER_SIDE));
}

BOOST_AUTO_TEST_CASE(TestBreakingUnloadedChunkThrows) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk('2')}});
    BOOST_CHECK_THROW(manager->breakTile(ChunkCoord{0, 0}, TilePos{0, 15}), ChunkNotLoadedError);
    BOOST_CHECK(manager->getBrokenTiles().empty());
}

BOOST_AUTO_TEST_CASE(TestSetBrokenTilesDropsUnauthoredEntries) {
    RawChunk raw = floorChunk('2');
    auto manager = makeManager({{ChunkCoord{0, 0}, raw}});

    BrokenTileLog log;
    log[ChunkCoord{0, 0}] = {TilePos{1, 15}, TilePos{1, 1}};
    log[ChunkCoord{9, 9}] = {TilePos{0, 0}};
    manager->setBrokenTiles(log);

    BrokenTileLog expected;
    expected[ChunkCoord{0, 0}] = {TilePos{1, 15}};
    BOOST_CHECK(manager->getBrokenTiles() == expected);

    manager->update(chunkCenter(0, 0));
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0})->getTile(TilePos{1, 15}) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ChunkAddTileTests, ChunkManagerFixture)

BOOST_AUTO_TEST_CASE(TestAddToLoadedChunkUpdatesRaw) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk()}});
    manager->update(chunkCenter(0, 0));

    manager->addTile(ChunkCoord{0, 0}, TilePos{2, 10}, '1');
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0})->getTile(TilePos{2, 10}) != nullptr);

    // Survives a reload because raw storage changed too
    manager->refresh();
    manager->update(chunkCenter(0, 0));
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0})->getTile(TilePos{2, 10}) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestAddToUnloadedChunkAppearsOnLoad) {
    RawChunk decorOnly;
    decorOnly.background = layer('1');
    auto manager = makeManager({{ChunkCoord{-1, 1}, decorOnly}});

    manager->addTile(WorldTile{-1, 17}, '5');
    const auto& middle = manager->getRawChunks().at(ChunkCoord{-1, 1}).middleground;
    BOOST_REQUIRE(middle.has_value());
    BOOST_CHECK_EQUAL((*middle)[tilePosToIndex(TilePos{15, 1})], '5');
    BOOST_CHECK_EQUAL(std::count(middle->begin(), middle->end(), '0'), TILES_PER_CHUNK - 1);

    manager->update(chunkCenter(-1, 1));
    const Tile* tile = manager->getChunk(ChunkCoord{-1, 1})->getTile(TilePos{15, 1});
    BOOST_REQUIRE(tile != nullptr);
    BOOST_CHECK(tile->getShape() == TileShape::BottomSlab);
}

BOOST_AUTO_TEST_CASE(TestAddClearsBrokenEntry) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk('2')}});
    manager->update(chunkCenter(0, 0));
    manager->breakTile(ChunkCoord{0, 0}, TilePos{3, 15});

    manager->addTile(ChunkCoord{0, 0}, TilePos{3, 15}, '2');
    BOOST_CHECK(manager->getBrokenTiles().empty());
    BOOST_CHECK(manager->getChunk(ChunkCoord{0, 0})->getTile(TilePos{3, 15}) != nullptr);
}

BOOST_AUTO_TEST_CASE(TestAddTileErrors) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk()}});

    BOOST_CHECK_THROW(manager->addTile(ChunkCoord{4, 4}, TilePos{0, 0}, '1'), ChunkNotFoundError);
    BOOST_CHECK_THROW(manager->addTile(ChunkCoord{0, 0}, TilePos{-1, 0}, '1'), std::out_of_range);
    BOOST_CHECK_THROW(manager->addTile(ChunkCoord{0, 0}, TilePos{0, 0}, 'z'), ConfigurationError);

    // Failed calls leave raw storage untouched
    BOOST_CHECK(manager->getRawChunks().at(ChunkCoord{0, 0}) == floorChunk());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ChunkCollisionTests, ChunkManagerFixture)

BOOST_AUTO_TEST_CASE(TestCollisionAcrossChunkBoundary) {
    auto manager = makeManager({{ChunkCoord{0, 0}, floorChunk()}, {ChunkCoord{1, 0}, floorChunk('3')}});
    manager->update(chunkCenter(0, 0));

    const float floorTop = 15.0f * TILE;
    FloatRect entity(CHUNK - 10.0f, floorTop - 30.0f, 20.0f, 40.0f);
    TileContacts contacts;
    manager->collideEntityY(entity, 10.0f, contacts);

    BOOST_CHECK_EQUAL(entity.bottom(), floorTop);
    BOOST_REQUIRE_EQUAL(contacts[ContactSide::Bottom].size(), 2u);
    BOOST_CHECK_EQUAL(contacts[ContactSide::Bottom].begin()->chunk, (ChunkCoord{0, 0}));
    // Max of stone and ice
    BOOST_CHECK_EQUAL(contacts.getMaxFriction(ContactSide::Bottom), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestBroadPhaseFilterDoesNotChangeResults) {
    RawChunkMap raw{{ChunkCoord{0, 0}, floorChunk()}, {ChunkCoord{1, 0}, floorChunk()},
                    {ChunkCoord{0, 1}, floorChunk()}};

    auto run = [&](bool filter) {
        config.broadPhaseChunkFilter = filter;
        auto manager = makeManager(raw);
        manager->update(chunkCenter(0, 0));
        FloatRect entity(CHUNK - 30.0f, 15.0f * TILE - 30.0f, 40.0f, 40.0f);
        TileContacts contacts;
        manager->collideEntityY(entity, 25.0f, contacts);
        manager->collideEntityX(entity, 15.0f, contacts);
        return std::make_pair(entity, contacts[ContactSide::Any].size());
    };

    const auto filtered = run(true);
    const auto unfiltered = run(false);
    BOOST_CHECK_EQUAL(filtered.first, unfiltered.first);
    BOOST_CHECK_EQUAL(filtered.second, unfiltered.second);
}

BOOST_AUTO_TEST_CASE(TestDrawCommandsOrderedByChunk) {
    auto manager = makeManager({{ChunkCoord{1, 0}, floorChunk()}, {ChunkCoord{0, 0}, floorChunk()}});
    manager->update(chunkCenter(0, 0));

    std::vector<TileDrawCommand> commands;
    manager->collectDrawCommands(ChunkLayer::Middleground, FloatRect(0.0f, 0.0f, 2.0f * CHUNK, CHUNK), commands);
    BOOST_REQUIRE_EQUAL(commands.size(), static_cast<size_t>(2 * TILES_PER_SIDE));
    BOOST_CHECK_EQUAL(commands.front().dest.x, 0.0f);
    BOOST_CHECK_EQUAL(commands.back().dest.x, 2.0f * CHUNK - TILE);
}

BOOST_AUTO_TEST_SUITE_END()
