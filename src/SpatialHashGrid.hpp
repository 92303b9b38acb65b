#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "structures.hpp"
#include "geometry.hpp"

// ==================== Uniform grid index ====================

// Buckets circles into fixed-size cells. A circle is registered in every
// cell its bounding box covers; lookups are cell-granular, so results may
// include circles somewhat beyond the requested radius.
class SpatialHashGrid {
public:
    static constexpr double kMinCellSize = 10.0;
    static constexpr double kCellScale = 2.5;
    static constexpr double kMaxSearchRadius = 100.0;
    static constexpr double kEdgeMargin = 0.95;
    static constexpr double kSafetyMargin = 0.8;

    struct Stats {
        size_t totalCells = 0;
        size_t occupiedCells = 0;
        double averageCirclesPerCell = 0.0;
        size_t maxCirclesInCell = 0;
    };

    SpatialHashGrid(double width, double height, double averageCircleRadius);

    // Returns the id of the stored circle
    size_t insert(const Circle& circle);

    // Empties every cell, keeps the grid allocated
    void clear();

    std::vector<Circle> getNearbyCircles(double x, double y, double radius) const;

    // First stored circle closer than radius + other.r + spacing to a prospective circle
    std::optional<Circle> checkCollision(const Circle& circle, double spacing) const;
    // Same test for an already stored circle, ignoring itself
    std::optional<Circle> checkCollision(size_t storedId, double spacing) const;

    double getMaxRadiusAt(double x, double y, double spacing, double width, double height) const;

    Stats stats() const;

    size_t size() const { return circles_.size(); }
    double cellSize() const { return cellSize_; }
    size_t cols() const { return cols_; }
    size_t rows() const { return rows_; }

private:
    struct CellRange {
        size_t startCol, endCol;
        size_t startRow, endRow;
    };

    // Cells covered by [minX, maxX] x [minY, maxY], clamped to the grid
    CellRange cellRange(double minX, double minY, double maxX, double maxY) const;
    size_t clampCol(double x) const;
    size_t clampRow(double y) const;
    std::vector<size_t> nearbyIds(double x, double y, double radius) const;
    std::optional<Circle> findCollision(const Circle& circle, double spacing, size_t skipId) const;

    double cellSize_;
    size_t cols_;
    size_t rows_;
    std::vector<Circle> circles_;
    std::vector<std::vector<size_t>> cells_; // indices into circles_
};
