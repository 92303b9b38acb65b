#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "settings.hpp"

namespace fs = std::filesystem;

static fs::path writeSettings(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

TEST(SettingsTest, ReadsKnownKeys) {
    fs::path path = writeSettings("circlepack_settings.txt",
                                  "width 300\nheight 200\nminCircleSize 0.5\n"
                                  "sampling poisson\nindex hash\nseed 9\nmaxCircles 40\n"
                                  "outputFile packed.txt\n");
    Settings s = loadSettings(path.string());

    EXPECT_EQ(s.width, 300u);
    EXPECT_EQ(s.height, 200u);
    EXPECT_DOUBLE_EQ(s.packing.minCircleSize, 0.5);
    EXPECT_EQ(s.packing.sampling, SamplingMode::Poisson);
    EXPECT_EQ(s.packing.index, IndexKind::SpatialHash);
    EXPECT_EQ(s.packing.seed, 9u);
    EXPECT_EQ(s.packing.maxCircles, 40u);
    EXPECT_EQ(s.outputFile, fs::path("packed.txt"));
    EXPECT_FALSE(s.inputImage.has_value());
    fs::remove(path);
}

TEST(SettingsTest, NegativeUnsignedValuesKeepDefaults) {
    fs::path path = writeSettings("circlepack_negative.txt",
                                  "width -5\nheight -1\ncapacity -3\nmaxCircles -10\nseed -2\n"
                                  "maxDepth -1\n");
    Settings s = loadSettings(path.string());
    const Settings defaults;

    EXPECT_EQ(s.width, defaults.width);
    EXPECT_EQ(s.height, defaults.height);
    EXPECT_EQ(s.packing.capacity, defaults.packing.capacity);
    EXPECT_EQ(s.packing.maxCircles, defaults.packing.maxCircles);
    EXPECT_EQ(s.packing.seed, defaults.packing.seed);
    // Signed settings still accept negative numbers
    EXPECT_EQ(s.packing.maxDepth, -1);
    fs::remove(path);
}

TEST(SettingsTest, MalformedAndUnknownEntriesAreSkipped) {
    fs::path path = writeSettings("circlepack_malformed.txt",
                                  "width abc\nfoo 12\nheight 64\n");
    Settings s = loadSettings(path.string());

    EXPECT_EQ(s.width, 512u);
    EXPECT_EQ(s.height, 64u);
    fs::remove(path);
}

TEST(SettingsTest, MissingFileUsesDefaults) {
    Settings s = loadSettings((fs::temp_directory_path() / "circlepack_no_settings.txt").string());
    EXPECT_EQ(s.width, 512u);
    EXPECT_EQ(s.packing.index, IndexKind::QuadTree);
}
