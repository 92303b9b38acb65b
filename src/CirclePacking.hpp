#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "structures.hpp"
#include "geometry.hpp"
#include "image.hpp"
#include "QuadTree.hpp"
#include "SpatialHashGrid.hpp"

enum class SamplingMode { Grid, Poisson };
enum class IndexKind { QuadTree, SpatialHash };

struct PackingParams {
    double minCircleSize = 0.3; // smallest radius worth placing
    double maxCircleSize = 8.0;
    double circleSpacing = 1.0; // required gap between circle surfaces
    size_t capacity = 15;       // quadtree node capacity
    int maxDepth = 0;           // quadtree depth guard, 0 = unbounded
    SamplingMode sampling = SamplingMode::Grid;
    IndexKind index = IndexKind::QuadTree;
    uint32_t seed = 1;
    size_t maxCircles = 0;      // 0 = unlimited
    double passShrink = 0.5;    // candidate spacing factor between passes
};

struct PackingStats {
    size_t candidates = 0;
    size_t placed = 0;
    int passes = 0;
    double elapsedMs = 0.0;
    QuadTree::Stats tree;       // filled for IndexKind::QuadTree
    SpatialHashGrid::Stats grid; // filled for IndexKind::SpatialHash
};

// Greedy coarse-to-fine packing over the image canvas. Each candidate point
// gets the largest collision-free radius the index allows, capped at
// maxCircleSize; circles below minCircleSize are skipped.
std::vector<Circle> packCircles(const Image& image, const PackingParams& params,
                                PackingStats* stats = nullptr);

// Every circle inside the width x height canvas and no pair overlapping by
// more than tolerance.
bool verifyPacking(const std::vector<Circle>& circles, double width, double height,
                   double tolerance = 1e-9);

// One "x y r red green blue" line per circle after a count line
void writeCircles(const std::string& path, const std::vector<Circle>& circles);
