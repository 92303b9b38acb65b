#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "CirclePacking.hpp"

namespace fs = std::filesystem;

TEST(CirclePackingTest, UniformCanvasPacksWithoutOverlap) {
    Image img = Image::filled(200, 150, {0.5, 0.5, 0.5});
    PackingParams params;
    PackingStats stats;

    std::vector<Circle> circles = packCircles(img, params, &stats);

    ASSERT_FALSE(circles.empty());
    EXPECT_TRUE(verifyPacking(circles, 200.0, 150.0));
    for (const auto& c : circles) {
        EXPECT_GE(c.r, params.minCircleSize);
        EXPECT_LE(c.r, params.maxCircleSize);
        EXPECT_DOUBLE_EQ(c.color[1], 0.5);
    }

    EXPECT_EQ(stats.placed, circles.size());
    EXPECT_GE(stats.candidates, stats.placed);
    EXPECT_GE(stats.passes, 1);
    EXPECT_EQ(stats.tree.circles, circles.size());
}

TEST(CirclePackingTest, SpacingIsHonoured) {
    Image img = Image::filled(120, 120, {1.0, 1.0, 1.0});
    PackingParams params;
    params.circleSpacing = 2.0;

    std::vector<Circle> circles = packCircles(img, params);
    for (size_t i = 0; i < circles.size(); ++i) {
        for (size_t j = i + 1; j < circles.size(); ++j) {
            ASSERT_GE(gapDist(circles[i].center, circles[j].center, circles[i].r, circles[j].r), 0.0);
        }
    }
}

TEST(CirclePackingTest, ZeroMinimumSizeStillTerminates) {
    Image img = Image::filled(20, 20, {0.5, 0.5, 0.5});
    PackingParams params;
    params.minCircleSize = 0.0;
    params.maxCircleSize = 8.0;
    PackingStats stats;

    std::vector<Circle> circles = packCircles(img, params, &stats);

    EXPECT_FALSE(circles.empty());
    EXPECT_TRUE(verifyPacking(circles, 20.0, 20.0));
    // Passes at spacing 16, 8, 4, 2, 1: at most one candidate per pixel in the last
    EXPECT_EQ(stats.passes, 5);
    EXPECT_LE(stats.candidates, 2u * 2u + 3u * 3u + 5u * 5u + 10u * 10u + 20u * 20u);
}

TEST(CirclePackingTest, TinyCirclesUseOnePixelCandidateSpacing) {
    Image img = Image::filled(10, 10, {0.5, 0.5, 0.5});
    PackingParams params;
    params.minCircleSize = 0.0;
    params.maxCircleSize = 0.01;
    PackingStats stats;

    std::vector<Circle> circles = packCircles(img, params, &stats);

    EXPECT_EQ(stats.passes, 1);
    EXPECT_EQ(stats.candidates, 100u);
    EXPECT_TRUE(verifyPacking(circles, 10.0, 10.0));
}

TEST(CirclePackingTest, OnlySelectedIndexReportsStats) {
    Image img = Image::filled(60, 60, {0.5, 0.5, 0.5});
    PackingParams params;
    PackingStats stats;

    packCircles(img, params, &stats);
    EXPECT_GT(stats.tree.nodes, 0u);
    EXPECT_EQ(stats.grid.totalCells, 0u);
}

TEST(CirclePackingTest, MaxCirclesStopsEarly) {
    Image img = Image::filled(200, 150, {0.5, 0.5, 0.5});
    PackingParams params;
    params.maxCircles = 25;

    EXPECT_EQ(packCircles(img, params).size(), 25u);
}

TEST(CirclePackingTest, DeterministicForSeed) {
    Image img = Image::filled(100, 100, {0.2, 0.4, 0.6});
    PackingParams params;
    params.seed = 42;

    std::vector<Circle> a = packCircles(img, params);
    std::vector<Circle> b = packCircles(img, params);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].x(), b[i].x());
        EXPECT_DOUBLE_EQ(a[i].y(), b[i].y());
        EXPECT_DOUBLE_EQ(a[i].r, b[i].r);
    }
}

TEST(CirclePackingTest, HashIndexWithPoissonCandidates) {
    Image img = Image::filled(160, 120, {0.5, 0.5, 0.5});
    PackingParams params;
    params.index = IndexKind::SpatialHash;
    params.sampling = SamplingMode::Poisson;
    PackingStats stats;

    std::vector<Circle> circles = packCircles(img, params, &stats);

    ASSERT_FALSE(circles.empty());
    EXPECT_TRUE(verifyPacking(circles, 160.0, 120.0));
    EXPECT_GT(stats.grid.occupiedCells, 0u);
    EXPECT_EQ(stats.tree.nodes, 0u);
}

TEST(CirclePackingTest, ColorsComeFromImage) {
    Image img = Image::filled(100, 60, {1.0, 0.0, 0.0});
    for (size_t row = 0; row < img.height; ++row) {
        for (size_t col = 50; col < img.width; ++col) {
            img.at(col, row) = {0.0, 0.0, 1.0};
        }
    }

    std::vector<Circle> circles = packCircles(img, PackingParams());
    ASSERT_FALSE(circles.empty());
    for (const auto& c : circles) {
        const Color expected = img.sample(c.x(), c.y());
        EXPECT_DOUBLE_EQ(c.color[0], expected[0]);
        EXPECT_DOUBLE_EQ(c.color[2], expected[2]);
    }
}

TEST(CirclePackingTest, EmptyImageGivesNoCircles) {
    PackingStats stats;
    EXPECT_TRUE(packCircles(Image(), PackingParams(), &stats).empty());
    EXPECT_EQ(stats.placed, 0u);
}

TEST(CirclePackingTest, VerifyDetectsViolations) {
    EXPECT_TRUE(verifyPacking({}, 10.0, 10.0));
    EXPECT_TRUE(verifyPacking({Circle(2.0, 5.0, 2.0), Circle(6.0, 5.0, 2.0)}, 10.0, 10.0)); // tangent
    EXPECT_FALSE(verifyPacking({Circle(2.0, 5.0, 2.0), Circle(5.0, 5.0, 2.0)}, 10.0, 10.0));
    EXPECT_FALSE(verifyPacking({Circle(9.0, 5.0, 2.0)}, 10.0, 10.0));
}

TEST(CirclePackingTest, WriteCirclesProducesCountLine) {
    fs::path path = fs::temp_directory_path() / "circlepack_out.txt";
    writeCircles(path.string(), {Circle(1.0, 2.0, 0.5, {1.0, 0.0, 0.0}), Circle(4.0, 4.0, 1.0)});

    std::ifstream in(path);
    size_t count = 0;
    in >> count;
    EXPECT_EQ(count, 2u);
    double x, y, r, red, green, blue;
    ASSERT_TRUE(in >> x >> y >> r >> red >> green >> blue);
    EXPECT_DOUBLE_EQ(x, 1.0);
    EXPECT_DOUBLE_EQ(r, 0.5);
    EXPECT_DOUBLE_EQ(red, 1.0);
    in.close();
    fs::remove(path);

    EXPECT_THROW(writeCircles((fs::temp_directory_path() / "circlepack_no_dir" / "out.txt").string(), {}),
                 std::runtime_error);
}
