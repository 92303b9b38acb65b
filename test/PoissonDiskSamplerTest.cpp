#include <gtest/gtest.h>

#include "PoissonDiskSampler.hpp"
#include "geometry.hpp"

TEST(PoissonDiskSamplerTest, PointsRespectMinimumDistance) {
    const double d = 10.0;
    PoissonDiskSampler sampler(200.0, 200.0, d, 30, 7);
    std::vector<Point> pts = sampler.generatePoints();

    ASSERT_GT(pts.size(), 100u);
    for (size_t i = 0; i < pts.size(); ++i) {
        EXPECT_GE(bg::get<0>(pts[i]), 0.0);
        EXPECT_LT(bg::get<0>(pts[i]), 200.0);
        EXPECT_GE(bg::get<1>(pts[i]), 0.0);
        EXPECT_LT(bg::get<1>(pts[i]), 200.0);
        for (size_t j = i + 1; j < pts.size(); ++j) {
            ASSERT_GE(bg::distance(pts[i], pts[j]), d - 1e-9) << i << " vs " << j;
        }
    }
}

TEST(PoissonDiskSamplerTest, SameSeedSamePoints) {
    std::vector<Point> a = PoissonDiskSampler(100.0, 80.0, 6.0, 30, 99).generatePoints();
    std::vector<Point> b = PoissonDiskSampler(100.0, 80.0, 6.0, 30, 99).generatePoints();

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_TRUE(bg::equals(a[i], b[i]));
    }
}

TEST(PoissonDiskSamplerTest, DegenerateInputsYieldNothing) {
    EXPECT_TRUE(PoissonDiskSampler(100.0, 100.0, 0.0).generatePoints().empty());
    EXPECT_TRUE(PoissonDiskSampler(100.0, 100.0, -3.0).generatePoints().empty());
    EXPECT_TRUE(PoissonDiskSampler(0.0, 100.0, 5.0).generatePoints().empty());
}
