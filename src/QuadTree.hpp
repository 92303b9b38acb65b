#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "structures.hpp"
#include "geometry.hpp"

// ==================== Circle quadtree ====================

/*
* QuadTree stores circles (not points) and answers the proximity queries a
* circle-packing pass needs. A node is either a leaf or owns exactly four
* children tiling its boundary. Circles that straddle a quadrant line stay in
* the overflow list of their lowest common ancestor, so every stored circle
* lives in exactly one node.
*
* Coordinates follow the screen convention (y grows downward).
* Not thread-safe for mutation; a finished tree may be shared read-only.
*/
class QuadTree {
public:
    // get_nearby_circles widens the caller's radius by this factor. Heuristic:
    // a neighbour whose own radius reaches further than this is missed.
    static constexpr double kNearbySearchScale = 2.5;
    // Search radius cap for getMaxRadiusWithoutCollision
    static constexpr double kMaxSearchRadius = 100.0;
    // Margins that keep placed circles off exact tangency
    static constexpr double kEdgeMargin = 0.95;
    static constexpr double kCircleMargin = 0.9;

    struct Stats {
        size_t nodes = 0;
        size_t leaves = 0;
        size_t circles = 0;
        size_t overflowCircles = 0; // held by divided nodes
        int maxDepth = 0;
    };

    // maxDepth == 0 means subdivision is unbounded
    explicit QuadTree(const Rectangle& boundary, size_t capacity = 10, int maxDepth = 0);
    ~QuadTree();

    QuadTree(QuadTree&& other) noexcept;
    QuadTree& operator=(QuadTree&& other) noexcept;

    // Returns false when the circle misses this node's boundary
    bool insert(const Circle& circle);

    std::vector<Circle> query(const Rectangle& range) const;
    void query(const Rectangle& range, std::vector<Circle>& out) const;

    // Circles truly intersecting the query circle (center, radius)
    std::vector<Circle> queryCircle(const Point& center, double radius) const;

    std::vector<Circle> getNearbyCircles(double x, double y, double radius) const;

    // Largest radius at (x, y) keeping minSpacing to every stored circle and
    // staying inside the width x height canvas. Never negative.
    double getMaxRadiusWithoutCollision(double x, double y, double width, double height,
                                        double minSpacing) const;

    void clear();

    size_t size() const;
    int depth() const;
    Stats stats() const;

    const Rectangle& boundary() const { return boundary_; }
    size_t capacity() const { return capacity_; }
    bool divided() const { return children_ != nullptr; }

private:
    struct Children;

    QuadTree(const Rectangle& boundary, size_t capacity, int maxDepth, int level);

    void subdivide();
    // Hands the circle to the single child it intersects. False when it
    // straddles several children and must stay here.
    bool pushDown(const Circle& circle);
    void collectStats(Stats& st) const;

    Rectangle boundary_;
    size_t capacity_;
    int maxDepth_;
    int level_; // 1 at the root
    std::vector<Circle> circles_;
    std::unique_ptr<Children> children_;
};
