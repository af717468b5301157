/**
 * @file test_voxel_grid.cpp
 * @brief Unit tests for BlockPalette, VoxelGrid and grid generation
 */

#include "pixschem/core/voxel_grid.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace pixschem;

namespace {

PaletteIndex redBlueIndex() {
    PaletteIndex index;
    index.insert(Color(255, 0, 0), {"red_concrete", 0});
    index.insert(Color(0, 0, 255), {"blue_concrete", 0});
    return index;
}

}  // namespace

// ============================================================================
// BlockPalette
// ============================================================================

TEST(BlockPaletteTest, FirstSeenOrder) {
    BlockPalette palette;
    EXPECT_EQ(palette.addBlock("minecraft:stone"), 0u);
    EXPECT_EQ(palette.addBlock("minecraft:dirt"), 1u);
    EXPECT_EQ(palette.addBlock("minecraft:stone"), 0u);
    EXPECT_EQ(palette.size(), 2u);
    EXPECT_EQ(palette.name(1), "minecraft:dirt");
}

TEST(BlockPaletteTest, IndexOfMissing) {
    BlockPalette palette;
    palette.addBlock("a");
    EXPECT_EQ(palette.indexOf("a"), 0u);
    EXPECT_EQ(palette.indexOf("b"), BlockPalette::INVALID_INDEX);
    EXPECT_FALSE(palette.contains("b"));
    EXPECT_THROW((void)palette.name(5), std::out_of_range);
}

// ============================================================================
// VoxelGrid
// ============================================================================

TEST(VoxelGridTest, Construction) {
    VoxelGrid grid(3, 2);
    EXPECT_EQ(grid.width(), 3);
    EXPECT_EQ(grid.height(), 2);
    EXPECT_EQ(grid.depth(), 1);
    EXPECT_EQ(grid.volume(), 6);
    EXPECT_EQ(grid.indices().size(), 6u);
}

TEST(VoxelGridTest, NonPositiveSizeThrows) {
    EXPECT_THROW(VoxelGrid(0, 1), std::invalid_argument);
    EXPECT_THROW(VoxelGrid(1, -1), std::invalid_argument);
    EXPECT_THROW(VoxelGrid(1, 1, 0), std::invalid_argument);
}

TEST(VoxelGridTest, SetAndGet) {
    VoxelGrid grid(2, 2, 2);
    grid.setBlock(1, 0, 1, "minecraft:glass");
    grid.setBlock(0, 1, 0, "minecraft:sand");

    EXPECT_EQ(grid.blockAt(1, 0, 1), "minecraft:glass");
    EXPECT_EQ(grid.blockAt(0, 1, 0), "minecraft:sand");
    EXPECT_EQ(grid.indexAt(1, 0, 1), 0u);
    EXPECT_EQ(grid.indexAt(0, 1, 0), 1u);
    EXPECT_THROW(grid.setBlock(2, 0, 0, "x"), std::out_of_range);
}

TEST(VoxelGridTest, FlatOrderIsXThenYThenZ) {
    VoxelGrid grid(2, 2, 2);
    grid.setBlock(0, 0, 0, "a");
    grid.setBlock(1, 1, 1, "b");
    grid.setBlock(1, 0, 1, "c");

    const auto& indices = grid.indices();
    EXPECT_EQ(indices[0], 0u);                  // (0,0,0)
    EXPECT_EQ(indices[1 + 2 * (1 + 2 * 1)], 1u);  // (1,1,1)
    EXPECT_EQ(indices[1 + 2 * (0 + 2 * 1)], 2u);  // (1,0,1)
}

TEST(VoxelGridTest, AdoptValidatesIndices) {
    BlockPalette palette;
    palette.addBlock("a");
    palette.addBlock("b");

    VoxelGrid grid(2, 1, 1, palette, {1, 0});
    EXPECT_EQ(grid.blockAt(0, 0, 0), "b");

    EXPECT_THROW(VoxelGrid(2, 1, 1, palette, {0}), std::invalid_argument);
    EXPECT_THROW(VoxelGrid(2, 1, 1, palette, {0, 2}), std::invalid_argument);
}

TEST(VoxelGridTest, ValidIndicesNeedPaletteEntries) {
    VoxelGrid grid(2, 1, 2);
    EXPECT_FALSE(grid.hasValidIndices());

    grid.setBlock(0, 0, 0, "a");
    EXPECT_TRUE(grid.hasValidIndices());  // untouched cells hold id 0, now "a"

    BlockPalette palette;
    palette.addBlock("a");
    EXPECT_TRUE(VoxelGrid(2, 1, 1, palette, {0, 0}).hasValidIndices());
}

TEST(VoxelGridTest, UsageCounts) {
    VoxelGrid grid(3, 1);
    grid.setBlock(0, 0, 0, "a");
    grid.setBlock(1, 0, 0, "b");
    grid.setBlock(2, 0, 0, "a");

    auto counts = grid.usageCounts();
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[0], 2u);
    EXPECT_EQ(counts[1], 1u);
}

// ============================================================================
// Grid generation
// ============================================================================

TEST(VoxelBuildTest, RedBlueTwoByTwo) {
    PixelGrid pixels(2, 2);
    pixels.at(0, 0) = Color(255, 0, 0);
    pixels.at(1, 0) = Color(0, 0, 255);
    pixels.at(0, 1) = Color(255, 0, 0);
    pixels.at(1, 1) = Color(0, 0, 255);

    auto result = buildVoxelGrid(pixels, redBlueIndex(), {2, 1});
    EXPECT_EQ(result.fallbackCells, 0u);
    ASSERT_EQ(result.grid.width(), 2);
    ASSERT_EQ(result.grid.height(), 1);
    EXPECT_EQ(result.grid.depth(), 1);

    ASSERT_EQ(result.grid.palette().size(), 2u);
    EXPECT_EQ(result.grid.palette().name(0), "red_concrete");
    EXPECT_EQ(result.grid.palette().name(1), "blue_concrete");
    EXPECT_EQ(result.grid.indices(), (std::vector<uint32_t>{0, 1}));
}

TEST(VoxelBuildTest, PaletteIdsFollowRowMajorFirstSeen) {
    PixelGrid pixels(2, 2);
    pixels.at(0, 0) = Color(0, 0, 255);
    pixels.at(1, 0) = Color(255, 0, 0);
    pixels.at(0, 1) = Color(0, 0, 255);
    pixels.at(1, 1) = Color(0, 0, 255);

    auto result = buildVoxelGrid(pixels, redBlueIndex(), {2, 2});
    EXPECT_EQ(result.grid.palette().name(0), "blue_concrete");
    EXPECT_EQ(result.grid.palette().name(1), "red_concrete");
    EXPECT_EQ(result.grid.indices(), (std::vector<uint32_t>{0, 1, 0, 0}));
}

TEST(VoxelBuildTest, EveryCellFilledFromPalette) {
    PixelGrid pixels(7, 5);
    for (int32_t y = 0; y < 5; ++y)
        for (int32_t x = 0; x < 7; ++x)
            pixels.at(x, y) = Color(static_cast<uint8_t>(x * 36), 0, static_cast<uint8_t>(y * 60));

    auto index = redBlueIndex();
    auto result = buildVoxelGrid(pixels, index, {7, 5});

    std::set<std::string> allowed = {"red_concrete", "blue_concrete"};
    for (int32_t y = 0; y < 5; ++y) {
        for (int32_t x = 0; x < 7; ++x) {
            EXPECT_TRUE(allowed.count(result.grid.blockAt(x, y, 0)));
        }
    }
    EXPECT_LE(result.grid.palette().size(), 2u);
}

TEST(VoxelBuildTest, ZeroTargetBecomesSingleCell) {
    PixelGrid pixels(4, 4);
    auto result = buildVoxelGrid(pixels, redBlueIndex(), {0, 0});
    EXPECT_EQ(result.grid.width(), 1);
    EXPECT_EQ(result.grid.height(), 1);
    EXPECT_EQ(result.grid.indices().size(), 1u);
}

TEST(VoxelBuildTest, EmptyIndexUsesFallback) {
    PixelGrid pixels(2, 2);
    PaletteIndex empty;

    auto result = buildVoxelGrid(pixels, empty, {2, 2});
    EXPECT_EQ(result.fallbackCells, 4u);
    ASSERT_EQ(result.grid.palette().size(), 1u);
    EXPECT_EQ(result.grid.palette().name(0), FALLBACK_BLOCK.blockName);
}

TEST(VoxelBuildTest, ThreadedMatchesSequential) {
    PixelGrid pixels(37, 23);
    for (int32_t y = 0; y < 23; ++y)
        for (int32_t x = 0; x < 37; ++x)
            pixels.at(x, y) = Color(static_cast<uint8_t>(x * 7), static_cast<uint8_t>(y * 11),
                                    static_cast<uint8_t>((x + y) * 3));

    PaletteIndex index;
    index.insert(Color(0, 0, 0), {"black", 0});
    index.insert(Color(255, 255, 255), {"white", 0});
    index.insert(Color(255, 0, 0), {"red", 0});
    index.insert(Color(0, 255, 0), {"green", 0});
    index.insert(Color(0, 0, 255), {"blue", 0});
    index.insert(Color(128, 128, 128), {"gray", 0});

    auto sequential = buildVoxelGrid(pixels, index, {19, 11}, 1);
    auto threaded = buildVoxelGrid(pixels, index, {19, 11}, 4);
    auto automatic = buildVoxelGrid(pixels, index, {19, 11}, 0);

    EXPECT_EQ(sequential.grid.indices(), threaded.grid.indices());
    EXPECT_EQ(sequential.grid.palette().names(), threaded.grid.palette().names());
    EXPECT_EQ(sequential.grid.indices(), automatic.grid.indices());
    EXPECT_EQ(sequential.grid.palette().names(), automatic.grid.palette().names());
}

TEST(VoxelBuildTest, MoreThreadsThanRows) {
    PixelGrid pixels(4, 2);
    auto result = buildVoxelGrid(pixels, redBlueIndex(), {4, 2}, 16);
    EXPECT_EQ(result.grid.indices().size(), 8u);
}

TEST(VoxelBuildTest, ExcessiveThreadCountIsCapped) {
    PixelGrid pixels(3, 300);
    for (int32_t y = 0; y < 300; ++y)
        for (int32_t x = 0; x < 3; ++x)
            pixels.at(x, y) = Color(static_cast<uint8_t>(y), 0, static_cast<uint8_t>(255 - y % 256));

    auto index = redBlueIndex();
    auto sequential = buildVoxelGrid(pixels, index, {3, 300}, 1);
    auto flooded = buildVoxelGrid(pixels, index, {3, 300}, 100000);

    EXPECT_EQ(sequential.grid.indices(), flooded.grid.indices());
    EXPECT_EQ(sequential.grid.palette().names(), flooded.grid.palette().names());
}
