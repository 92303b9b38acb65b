#include "QuadTree.hpp"
#include "debug.hpp"

#include <algorithm>
#include <array>
#include <limits>

// The four quadrants, owned as one block so a node never has a partial set
struct QuadTree::Children {
    QuadTree northeast;
    QuadTree northwest;
    QuadTree southeast;
    QuadTree southwest;

    Children(const Rectangle& b, size_t capacity, int maxDepth, int level)
        : northeast(Rectangle{b.x + b.width / 2, b.y, b.width / 2, b.height / 2}, capacity, maxDepth, level),
          northwest(Rectangle{b.x, b.y, b.width / 2, b.height / 2}, capacity, maxDepth, level),
          southeast(Rectangle{b.x + b.width / 2, b.y + b.height / 2, b.width / 2, b.height / 2}, capacity, maxDepth, level),
          southwest(Rectangle{b.x, b.y + b.height / 2, b.width / 2, b.height / 2}, capacity, maxDepth, level) {}

    std::array<QuadTree*, 4> all() { return {&northeast, &northwest, &southeast, &southwest}; }
    std::array<const QuadTree*, 4> all() const { return {&northeast, &northwest, &southeast, &southwest}; }
};

QuadTree::QuadTree(const Rectangle& boundary, size_t capacity, int maxDepth)
    : QuadTree(boundary, capacity, maxDepth, 1) {}

QuadTree::QuadTree(const Rectangle& boundary, size_t capacity, int maxDepth, int level)
    : boundary_(boundary),
      capacity_(std::max<size_t>(capacity, 1)),
      maxDepth_(std::max(maxDepth, 0)),
      level_(level) {}

QuadTree::~QuadTree() = default;
QuadTree::QuadTree(QuadTree&& other) noexcept = default;
QuadTree& QuadTree::operator=(QuadTree&& other) noexcept = default;

// ==================== Insertion ====================

bool QuadTree::insert(const Circle& circle) {
    if (!circleIntersectsRectangle(circle, boundary_)) {
        return false;
    }

    if (!divided()) {
        if (circles_.size() < capacity_ || (maxDepth_ > 0 && level_ >= maxDepth_)) {
            circles_.push_back(circle);
            return true;
        }
        subdivide();
    }

    if (!pushDown(circle)) {
        DBG_CIRCLE("overflow at level " << level_, circle);
        circles_.push_back(circle);
    }
    return true;
}

void QuadTree::subdivide() {
    children_ = std::make_unique<Children>(boundary_, capacity_, maxDepth_, level_ + 1);

    // Redistribute; straddling circles stay in this node
    std::vector<Circle> held;
    held.swap(circles_);
    for (const auto& c : held) {
        if (!pushDown(c)) {
            circles_.push_back(c);
        }
    }
}

bool QuadTree::pushDown(const Circle& circle) {
    QuadTree* target = nullptr;
    for (QuadTree* child : children_->all()) {
        if (!circleIntersectsRectangle(circle, child->boundary_)) continue;
        if (target != nullptr) return false; // straddles a quadrant line
        target = child;
    }
    return target != nullptr && target->insert(circle);
}

// ==================== Queries ====================

std::vector<Circle> QuadTree::query(const Rectangle& range) const {
    std::vector<Circle> found;
    query(range, found);
    return found;
}

void QuadTree::query(const Rectangle& range, std::vector<Circle>& out) const {
    if (!rectanglesIntersect(range, boundary_)) {
        return;
    }

    for (const auto& c : circles_) {
        if (circleIntersectsRectangle(c, range)) {
            out.push_back(c);
        }
    }

    if (divided()) {
        for (const QuadTree* child : children_->all()) {
            child->query(range, out);
        }
    }
}

std::vector<Circle> QuadTree::queryCircle(const Point& center, double radius) const {
    std::vector<Circle> candidates = query(boundingSquare(center, radius));

    // Bounding-box overlap is not enough; keep true circle/circle hits only
    std::erase_if(candidates, [&](const Circle& c) {
        return bg::distance(c.center, center) > radius + c.r;
    });
    return candidates;
}

std::vector<Circle> QuadTree::getNearbyCircles(double x, double y, double radius) const {
    return queryCircle(Point(x, y), radius * kNearbySearchScale);
}

double QuadTree::getMaxRadiusWithoutCollision(double x, double y, double width, double height,
                                              double minSpacing) const {
    const double edge = edgeDistance(x, y, width, height);
    const double searchRadius = std::max(0.0, std::min(edge, kMaxSearchRadius));

    const Point p(x, y);
    double bound = std::numeric_limits<double>::infinity();
    for (const auto& c : queryCircle(p, searchRadius)) {
        bound = std::min(bound, bg::distance(p, c.center) - c.r - minSpacing);
    }

    if (bound == std::numeric_limits<double>::infinity()) {
        return std::max(0.0, edge * kEdgeMargin);
    }
    return std::max(0.0, std::min(edge * kEdgeMargin, bound * kCircleMargin));
}

// ==================== Maintenance & diagnostics ====================

void QuadTree::clear() {
    circles_.clear();
    children_.reset();
}

size_t QuadTree::size() const {
    size_t count = circles_.size();
    if (divided()) {
        for (const QuadTree* child : children_->all()) {
            count += child->size();
        }
    }
    return count;
}

int QuadTree::depth() const {
    if (!divided()) {
        return 1;
    }

    int deepest = 0;
    for (const QuadTree* child : children_->all()) {
        deepest = std::max(deepest, child->depth());
    }
    return 1 + deepest;
}

QuadTree::Stats QuadTree::stats() const {
    Stats st;
    collectStats(st);
    return st;
}

void QuadTree::collectStats(Stats& st) const {
    st.nodes++;
    st.circles += circles_.size();
    st.maxDepth = std::max(st.maxDepth, level_);

    if (!divided()) {
        st.leaves++;
        return;
    }

    st.overflowCircles += circles_.size();
    for (const QuadTree* child : children_->all()) {
        child->collectStats(st);
    }
}
