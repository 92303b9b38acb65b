#include "SpatialHashGrid.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

SpatialHashGrid::SpatialHashGrid(double width, double height, double averageCircleRadius)
    : cellSize_(std::max(kMinCellSize, averageCircleRadius * kCellScale)) {
    cols_ = static_cast<size_t>(std::max(1.0, std::ceil(width / cellSize_)));
    rows_ = static_cast<size_t>(std::max(1.0, std::ceil(height / cellSize_)));
    cells_.resize(cols_ * rows_);

    DBG("SpatialHashGrid: " << cols_ << "x" << rows_ << " grid, cellSize=" << cellSize_);
}

size_t SpatialHashGrid::clampCol(double x) const {
    double col = std::floor(x / cellSize_);
    if (!(col > 0.0)) return 0; // also catches NaN
    return static_cast<size_t>(std::min(col, static_cast<double>(cols_ - 1)));
}

size_t SpatialHashGrid::clampRow(double y) const {
    double row = std::floor(y / cellSize_);
    if (!(row > 0.0)) return 0;
    return static_cast<size_t>(std::min(row, static_cast<double>(rows_ - 1)));
}

SpatialHashGrid::CellRange SpatialHashGrid::cellRange(double minX, double minY, double maxX, double maxY) const {
    return CellRange{clampCol(minX), clampCol(maxX), clampRow(minY), clampRow(maxY)};
}

size_t SpatialHashGrid::insert(const Circle& circle) {
    const size_t id = circles_.size();
    circles_.push_back(circle);

    CellRange cr = cellRange(circle.x() - circle.r, circle.y() - circle.r,
                             circle.x() + circle.r, circle.y() + circle.r);
    for (size_t row = cr.startRow; row <= cr.endRow; ++row) {
        for (size_t col = cr.startCol; col <= cr.endCol; ++col) {
            cells_[row * cols_ + col].push_back(id);
        }
    }
    return id;
}

void SpatialHashGrid::clear() {
    circles_.clear();
    for (auto& cell : cells_) {
        cell.clear();
    }
}

std::vector<size_t> SpatialHashGrid::nearbyIds(double x, double y, double radius) const {
    std::vector<size_t> ids;
    HashSet<size_t> seen;

    CellRange cr = cellRange(x - radius, y - radius, x + radius, y + radius);
    for (size_t row = cr.startRow; row <= cr.endRow; ++row) {
        for (size_t col = cr.startCol; col <= cr.endCol; ++col) {
            for (size_t id : cells_[row * cols_ + col]) {
                if (seen.insert(id).second) {
                    ids.push_back(id);
                }
            }
        }
    }
    return ids;
}

std::vector<Circle> SpatialHashGrid::getNearbyCircles(double x, double y, double radius) const {
    std::vector<Circle> nearby;
    for (size_t id : nearbyIds(x, y, radius)) {
        nearby.push_back(circles_[id]);
    }
    return nearby;
}

std::optional<Circle> SpatialHashGrid::findCollision(const Circle& circle, double spacing, size_t skipId) const {
    for (size_t id : nearbyIds(circle.x(), circle.y(), circle.r + spacing)) {
        if (id == skipId) continue;

        const Circle& other = circles_[id];
        if (gapDist(circle.center, other.center, circle.r, other.r) < spacing) {
            return other;
        }
    }
    return std::nullopt;
}

std::optional<Circle> SpatialHashGrid::checkCollision(const Circle& circle, double spacing) const {
    return findCollision(circle, spacing, circles_.size());
}

std::optional<Circle> SpatialHashGrid::checkCollision(size_t storedId, double spacing) const {
    if (storedId >= circles_.size()) {
        throw std::out_of_range("No stored circle with id " + std::to_string(storedId));
    }
    return findCollision(circles_[storedId], spacing, storedId);
}

double SpatialHashGrid::getMaxRadiusAt(double x, double y, double spacing, double width, double height) const {
    const double edge = edgeDistance(x, y, width, height);
    const double searchRadius = std::max(0.0, std::min(edge, kMaxSearchRadius));

    const Point p(x, y);
    double bound = std::numeric_limits<double>::infinity();
    for (const auto& c : getNearbyCircles(x, y, searchRadius)) {
        bound = std::min(bound, bg::distance(p, c.center) - c.r - spacing);
    }

    if (bound == std::numeric_limits<double>::infinity()) {
        return std::max(0.0, edge * kEdgeMargin);
    }
    return std::max(0.0, std::min(edge, bound) * kSafetyMargin);
}

SpatialHashGrid::Stats SpatialHashGrid::stats() const {
    Stats st;
    st.totalCells = cells_.size();

    size_t total = 0;
    for (const auto& cell : cells_) {
        if (cell.empty()) continue;
        st.occupiedCells++;
        total += cell.size();
        st.maxCirclesInCell = std::max(st.maxCirclesInCell, cell.size());
    }
    if (st.occupiedCells > 0) {
        st.averageCirclesPerCell = static_cast<double>(total) / static_cast<double>(st.occupiedCells);
    }
    return st;
}
