#pragma once

#include <array>
#include <cstddef>
#include <unordered_set>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>

// Choose Abseil or std hash set
#if USE_ABSEIL_HASH_SET
template<typename T>
using HashSet = absl::flat_hash_set<T>;
#else
template<typename T>
using HashSet = std::unordered_set<T>;
#endif

namespace bg = boost::geometry;

typedef bg::model::point<double, 2, bg::cs::cartesian> Point;

// RGB channels, carried through the indexes but never interpreted by them
typedef std::array<double, 3> Color;

// ==================== Structures ====================

// Circle placed on the canvas. Indexes store copies.
struct Circle {
    Point center;
    double r; // radius
    Color color;

    Circle(const Point& c = Point(0.0, 0.0), double ra = 0.0, const Color& col = {0.0, 0.0, 0.0})
        : center(c), r(ra), color(col) {}

    Circle(double x, double y, double ra, const Color& col = {0.0, 0.0, 0.0})
        : center(x, y), r(ra), color(col) {}

    double x() const { return bg::get<0>(center); }
    double y() const { return bg::get<1>(center); }
};

// Axis-aligned region: origin (x, y) plus extent. Same coordinate space as circles.
struct Rectangle {
    double x;
    double y;
    double width;
    double height;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
};
