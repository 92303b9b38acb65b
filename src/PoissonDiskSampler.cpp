#include "PoissonDiskSampler.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

PoissonDiskSampler::PoissonDiskSampler(double width, double height, double minDistance,
                                       int maxAttempts, uint32_t seed)
    : width_(width), height_(height), minDistance_(minDistance),
      maxAttempts_(maxAttempts), cellSize_(0.0), gridWidth_(0), gridHeight_(0), gen_(seed) {
    if (minDistance_ <= 0.0 || width_ <= 0.0 || height_ <= 0.0) {
        return;
    }

    // A cell of side d/sqrt(2) can hold at most one valid point
    cellSize_ = minDistance_ / std::numbers::sqrt2;
    gridWidth_ = static_cast<size_t>(std::ceil(width_ / cellSize_));
    gridHeight_ = static_cast<size_t>(std::ceil(height_ / cellSize_));
    grid_.assign(gridWidth_ * gridHeight_, std::nullopt);
}

std::vector<Point> PoissonDiskSampler::generatePoints() {
    if (grid_.empty()) {
        return {};
    }

    std::uniform_real_distribution<> disX(0.0, width_);
    std::uniform_real_distribution<> disY(0.0, height_);

    // Several seeds on large canvases for a more even start
    const int numSeeds = std::min(5, std::max(1, static_cast<int>(std::floor(width_ * height_ / 50000.0))));
    for (int i = 0; i < numSeeds; ++i) {
        Point seed(disX(gen_), disY(gen_));
        if (isValidPoint(seed)) {
            addPoint(seed);
        }
    }

    while (!active_.empty()) {
        std::uniform_int_distribution<size_t> pick(0, active_.size() - 1);
        const size_t idx = pick(gen_);
        const Point origin = active_[idx];

        bool found = false;
        for (int attempt = 0; attempt < maxAttempts_; ++attempt) {
            Point candidate = generateAroundPoint(origin);
            if (isValidPoint(candidate)) {
                addPoint(candidate);
                found = true;
                break;
            }
        }

        if (!found) {
            active_[idx] = active_.back();
            active_.pop_back();
        }
    }

    DBG("PoissonDiskSampler: " << points_.size() << " points, minDistance=" << minDistance_);
    return points_;
}

void PoissonDiskSampler::addPoint(const Point& p) {
    points_.push_back(p);
    active_.push_back(p);

    const size_t gx = static_cast<size_t>(bg::get<0>(p) / cellSize_);
    const size_t gy = static_cast<size_t>(bg::get<1>(p) / cellSize_);
    if (gx < gridWidth_ && gy < gridHeight_) {
        grid_[gy * gridWidth_ + gx] = p;
    }
}

Point PoissonDiskSampler::generateAroundPoint(const Point& p) {
    // Annulus [d, 2d) around p
    std::uniform_real_distribution<> angleDis(0.0, 2 * std::numbers::pi);
    std::uniform_real_distribution<> radiusDis(minDistance_, 2 * minDistance_);
    const double angle = angleDis(gen_);
    const double radius = radiusDis(gen_);
    return Point(bg::get<0>(p) + std::cos(angle) * radius,
                 bg::get<1>(p) + std::sin(angle) * radius);
}

bool PoissonDiskSampler::isValidPoint(const Point& p) const {
    const double x = bg::get<0>(p);
    const double y = bg::get<1>(p);
    if (x < 0.0 || x >= width_ || y < 0.0 || y >= height_) {
        return false;
    }

    const long gx = static_cast<long>(x / cellSize_);
    const long gy = static_cast<long>(y / cellSize_);

    // Points closer than d can sit at most two cells away
    for (long dy = -2; dy <= 2; ++dy) {
        for (long dx = -2; dx <= 2; ++dx) {
            const long cx = gx + dx;
            const long cy = gy + dy;
            if (cx < 0 || cy < 0 || cx >= static_cast<long>(gridWidth_) || cy >= static_cast<long>(gridHeight_)) {
                continue;
            }
            const auto& neighbour = grid_[static_cast<size_t>(cy) * gridWidth_ + static_cast<size_t>(cx)];
            if (neighbour && bg::distance(p, *neighbour) < minDistance_) {
                return false;
            }
        }
    }
    return true;
}
