/**
 * @file test_palette_loader.cpp
 * @brief Unit tests for palette source parsing and loading
 */

#include "pixschem/core/errors.hpp"
#include "pixschem/io/palette_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace pixschem;

// ============================================================================
// Color keys
// ============================================================================

TEST(ColorKeyTest, ParenthesizedForm) {
    auto color = parseColorKey("(255, 128, 0)");
    ASSERT_TRUE(color.has_value());
    EXPECT_EQ(*color, Color(255, 128, 0));
}

TEST(ColorKeyTest, BareForm) {
    auto color = parseColorKey("1,2,3");
    ASSERT_TRUE(color.has_value());
    EXPECT_EQ(*color, Color(1, 2, 3));
}

TEST(ColorKeyTest, Malformed) {
    EXPECT_FALSE(parseColorKey("").has_value());
    EXPECT_FALSE(parseColorKey("(1,2)").has_value());
    EXPECT_FALSE(parseColorKey("(1,2,3,4)").has_value());
    EXPECT_FALSE(parseColorKey("(256,0,0)").has_value());
    EXPECT_FALSE(parseColorKey("(-1,0,0)").has_value());
    EXPECT_FALSE(parseColorKey("(a,b,c)").has_value());
    EXPECT_FALSE(parseColorKey("(1.5,2,3)").has_value());
}

// ============================================================================
// Source parsing
// ============================================================================

TEST(PaletteSourceTest, ObjectAndArrayValues) {
    auto entries = parsePaletteSource(R"json({
        "(255,0,0)": {"block_name": "minecraft:red_wool", "block_data": 14},
        "(0,0,255)": ["minecraft:blue_wool", 11]
    })json");

    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].color, Color(255, 0, 0));
    EXPECT_EQ((*entries)[0].mapping.blockName, "minecraft:red_wool");
    EXPECT_EQ((*entries)[0].mapping.blockData, 14);
    EXPECT_EQ((*entries)[1].color, Color(0, 0, 255));
    EXPECT_EQ((*entries)[1].mapping.blockName, "minecraft:blue_wool");
    EXPECT_EQ((*entries)[1].mapping.blockData, 11);
}

TEST(PaletteSourceTest, MalformedEntriesSkipped) {
    auto entries = parsePaletteSource(R"json({
        "not a color": {"block_name": "a", "block_data": 0},
        "(1,1,1)": {"block_name": "b"},
        "(2,2,2)": {"block_name": 5, "block_data": 0},
        "(3,3,3)": ["c"],
        "(4,4,4)": "d",
        "(5,5,5)": {"block_name": "e", "block_data": -1},
        "(6,6,6)": {"block_name": "good", "block_data": 0}
    })json");

    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ((*entries)[0].mapping.blockName, "good");
}

TEST(PaletteSourceTest, CommentLinesIgnored) {
    auto entries = parsePaletteSource(
        "# Concrete\n"
        "{\n"
        "  # solid colors\n"
        "  \"(0,0,0)\": [\"minecraft:black_concrete\", 0]\n"
        "}\n");

    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ((*entries)[0].mapping.blockName, "minecraft:black_concrete");
}

TEST(PaletteSourceTest, NotAnObject) {
    EXPECT_FALSE(parsePaletteSource("[1, 2, 3]").has_value());
    EXPECT_FALSE(parsePaletteSource("{ broken").has_value());
    EXPECT_FALSE(parsePaletteSource("").has_value());
}

TEST(PaletteSourceTest, EmptyObjectIsEmptyList) {
    auto entries = parsePaletteSource("{}");
    ASSERT_TRUE(entries.has_value());
    EXPECT_TRUE(entries->empty());
}

// ============================================================================
// Directory loading
// ============================================================================

class PaletteLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() / "pixschem_palette_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    void writeSource(const std::string& name, const std::string& content) {
        std::ofstream(testDir_ / (name + ".json")) << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(PaletteLoaderTest, LoadsRequestedSources) {
    writeSource("wool", R"json({"(255,255,255)": ["minecraft:white_wool", 0]})json");
    writeSource("concrete", R"json({"(0,0,0)": ["minecraft:black_concrete", 0]})json");
    writeSource("unused", R"json({"(9,9,9)": ["minecraft:unused", 0]})json");

    std::vector<std::string> sources = {"wool", "concrete"};
    auto index = loadPaletteSources(testDir_, sources);

    EXPECT_EQ(index.size(), 2u);
    EXPECT_TRUE(index.contains(Color(255, 255, 255)));
    EXPECT_TRUE(index.contains(Color(0, 0, 0)));
    EXPECT_FALSE(index.contains(Color(9, 9, 9)));
}

TEST_F(PaletteLoaderTest, LaterSourceOverridesColor) {
    writeSource("first", R"json({"(10,10,10)": ["minecraft:first", 0]})json");
    writeSource("second", R"json({"(10,10,10)": ["minecraft:second", 2]})json");

    std::vector<std::string> sources = {"first", "second"};
    auto index = loadPaletteSources(testDir_, sources);

    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index.find(Color(10, 10, 10))->blockName, "minecraft:second");
    EXPECT_EQ(index.find(Color(10, 10, 10))->blockData, 2);
}

TEST_F(PaletteLoaderTest, MissingDirectoryThrows) {
    std::vector<std::string> sources = {"wool"};
    EXPECT_THROW((void)loadPaletteSources(testDir_ / "missing", sources), PaletteSourceMissing);
}

TEST_F(PaletteLoaderTest, MissingSourceThrows) {
    writeSource("wool", R"json({"(255,255,255)": ["minecraft:white_wool", 0]})json");
    std::vector<std::string> sources = {"wool", "glass"};
    EXPECT_THROW((void)loadPaletteSources(testDir_, sources), PaletteSourceMissing);
}

TEST_F(PaletteLoaderTest, NoUsableEntriesThrows) {
    writeSource("broken", "{ not json");
    writeSource("junk", R"json({"bad key": ["x", 0]})json");

    std::vector<std::string> sources = {"broken", "junk"};
    EXPECT_THROW((void)loadPaletteSources(testDir_, sources), BlockMappingParseError);

    // Also reported as an empty palette
    EXPECT_THROW((void)loadPaletteSources(testDir_, sources), EmptyPaletteError);
}

TEST_F(PaletteLoaderTest, NoSourcesThrows) {
    EXPECT_THROW((void)loadPaletteSources(testDir_, std::vector<std::string>{}), BlockMappingParseError);
}

TEST_F(PaletteLoaderTest, BrokenSourceSkippedWhenOthersLoad) {
    writeSource("broken", "[]");
    writeSource("good", R"json({"(1,2,3)": ["minecraft:good", 0]})json");

    std::vector<std::string> sources = {"broken", "good"};
    auto index = loadPaletteSources(testDir_, sources);
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(PaletteLoaderTest, ListSources) {
    writeSource("wool", "# Wool Blocks\n{}\n");
    writeSource("concrete", "{}\n");
    std::ofstream(testDir_ / "notes.txt") << "not a palette";

    auto sources = listPaletteSources(testDir_);
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].name, "concrete");
    EXPECT_EQ(sources[0].displayName, "concrete");
    EXPECT_EQ(sources[1].name, "wool");
    EXPECT_EQ(sources[1].displayName, "Wool Blocks");
}

TEST_F(PaletteLoaderTest, ListMissingDirectoryThrows) {
    EXPECT_THROW((void)listPaletteSources(testDir_ / "missing"), PaletteSourceMissing);
}
