#include "CirclePacking.hpp"
#include "PoissonDiskSampler.hpp"
#include "debug.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>

static constexpr int kMaxPasses = 16;
// Candidate spacing never drops below one pixel
static constexpr double kMinPassSpacing = 1.0;

// One jittered point per spacing x spacing cell
static std::vector<Point> jitteredGrid(double width, double height, double spacing, std::mt19937& gen) {
    std::vector<Point> pts;
    std::uniform_real_distribution<> jitter(0.0, 1.0);
    for (double y = 0.0; y < height; y += spacing) {
        for (double x = 0.0; x < width; x += spacing) {
            const double cw = std::min(spacing, width - x);
            const double ch = std::min(spacing, height - y);
            pts.emplace_back(x + jitter(gen) * cw, y + jitter(gen) * ch);
        }
    }
    return pts;
}

std::vector<Circle> packCircles(const Image& image, const PackingParams& params, PackingStats* stats) {
    auto startTime = std::chrono::high_resolution_clock::now();

    const double width = static_cast<double>(image.width);
    const double height = static_cast<double>(image.height);

    // Radii above the search cap could reach circles the index never reports
    const double maxR = std::min(params.maxCircleSize, QuadTree::kMaxSearchRadius);
    const double minR = std::max(0.0, std::min(params.minCircleSize, maxR));

    std::vector<Circle> circles;
    PackingStats st;
    if (image.empty() || maxR <= 0.0) {
        if (stats) *stats = st;
        return circles;
    }

    const bool useTree = params.index == IndexKind::QuadTree;
    std::optional<QuadTree> tree;
    std::optional<SpatialHashGrid> grid;
    if (useTree) {
        tree.emplace(Rectangle{0.0, 0.0, width, height}, params.capacity, params.maxDepth);
    } else {
        grid.emplace(width, height, maxR * 0.5);
    }

    auto maxRadiusAt = [&](double x, double y) {
        return useTree
            ? tree->getMaxRadiusWithoutCollision(x, y, width, height, params.circleSpacing)
            : grid->getMaxRadiusAt(x, y, params.circleSpacing, width, height);
    };

    std::mt19937 gen(params.seed);
    const double minSpacing = std::max(2.0 * minR, kMinPassSpacing);
    double spacing = std::max(2.0 * maxR, kMinPassSpacing);
    const bool shrinks = params.passShrink > 0.0 && params.passShrink < 1.0;

    for (int pass = 0; pass < kMaxPasses; ++pass) {
        std::vector<Point> candidates;
        if (params.sampling == SamplingMode::Poisson) {
            PoissonDiskSampler sampler(width, height, spacing, 30, static_cast<uint32_t>(gen()));
            candidates = sampler.generatePoints();
        } else {
            candidates = jitteredGrid(width, height, spacing, gen);
        }
        std::shuffle(candidates.begin(), candidates.end(), gen);
        st.passes++;

        for (const auto& p : candidates) {
            if (params.maxCircles > 0 && circles.size() >= params.maxCircles) break;
            st.candidates++;

            const double x = bg::get<0>(p);
            const double y = bg::get<1>(p);
            const double r = std::min(maxR, maxRadiusAt(x, y));
            if (r <= 0.0 || r < minR) continue;

            Circle c(x, y, r, image.sample(x, y));
            if (useTree) {
                tree->insert(c);
            } else {
                grid->insert(c);
            }
            circles.push_back(c);
        }

        DBG("Pass " << pass << ": spacing=" << spacing << " candidates=" << candidates.size()
            << " placed so far=" << circles.size());

        if (params.maxCircles > 0 && circles.size() >= params.maxCircles) break;
        spacing *= params.passShrink;
        if (!shrinks || spacing < minSpacing) break;
    }

    st.placed = circles.size();
    if (useTree) {
        st.tree = tree->stats();
    } else {
        st.grid = grid->stats();
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    st.elapsedMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    if (stats) *stats = st;
    return circles;
}

// Verify that no two circles overlap and all stay on the canvas.
bool verifyPacking(const std::vector<Circle>& circles, double width, double height, double tolerance) {
    // Construct an R*-tree from the circle boxes
    bgi::rtree<BoxValue, bgi::rstar<16>> rtree;
    for (size_t i = 0; i < circles.size(); ++i) {
        rtree.insert(std::make_pair(circleBox(circles[i]), i));
    }

    for (size_t i = 0; i < circles.size(); ++i) {
        const Circle& c = circles[i];
        if (c.x() - c.r < -tolerance || c.y() - c.r < -tolerance ||
            c.x() + c.r > width + tolerance || c.y() + c.r > height + tolerance) {
            DBG_CIRCLE("Circle leaves the canvas:", c);
            return false;
        }

        std::vector<BoxValue> candidates;
        rtree.query(bgi::intersects(circleBox(c)), std::back_inserter(candidates));
        for (const auto& v : candidates) {
            if (v.second <= i) continue;
            const Circle& other = circles[v.second];
            if (gapDist(c.center, other.center, c.r, other.r) < -tolerance) {
                DBG_CIRCLE("Circle overlaps", c);
                DBG_CIRCLE("  with", other);
                return false;
            }
        }
    }

    return true;
}

void writeCircles(const std::string& path, const std::vector<Circle>& circles) {
    std::ofstream outFile(path);
    if (!outFile) {
        throw std::runtime_error("Failed to open output file: " + path);
    }

    outFile << std::fixed << std::setprecision(4);
    outFile << circles.size() << "\n";
    for (const auto& c : circles) {
        outFile << c.x() << " " << c.y() << " " << c.r << " "
                << c.color[0] << " " << c.color[1] << " " << c.color[2] << "\n";
    }
}
