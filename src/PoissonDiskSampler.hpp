#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "structures.hpp"

// ==================== Candidate generation ====================

// Blue-noise point set: every pair of generated points is at least
// minDistance apart. Deterministic for a given seed.
class PoissonDiskSampler {
public:
    PoissonDiskSampler(double width, double height, double minDistance,
                       int maxAttempts = 30, uint32_t seed = 1);

    std::vector<Point> generatePoints();

private:
    bool isValidPoint(const Point& p) const;
    void addPoint(const Point& p);
    Point generateAroundPoint(const Point& p);

    double width_, height_;
    double minDistance_;
    int maxAttempts_;
    double cellSize_;
    size_t gridWidth_, gridHeight_;
    std::vector<std::optional<Point>> grid_; // row-major, one point per cell
    std::vector<Point> active_;
    std::vector<Point> points_;
    std::mt19937 gen_;
};
