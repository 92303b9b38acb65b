#pragma once

#include <utility>
#include <cmath>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// Aliases
typedef bg::model::box<Point> Box;

typedef std::pair<Box, size_t> BoxValue;

// ==================== Geometry helpers ====================

// Create bounding box around a circle
Box circleBox(const Circle& c);

// Axis-aligned square enclosing the circle (center, radius)
Rectangle boundingSquare(const Point& center, double radius);

// Compute "gap" distance (center-dist minus sum of radii)
double gapDist(const Point& a, const Point& b, double ra, double rb);

// Distance from (x, y) to the nearest edge of a width x height canvas.
// Negative when the point lies outside.
double edgeDistance(double x, double y, double width, double height);

// True circle/AABB overlap: clamp the center into the rectangle and compare
// the squared distance with r^2. Touching counts.
bool circleIntersectsRectangle(const Circle& c, const Rectangle& rect);

// Separating-axis test on two axis-aligned rectangles. Touching counts.
bool rectanglesIntersect(const Rectangle& a, const Rectangle& b);

// Center distance <= sum of radii
bool circlesIntersect(const Circle& a, const Circle& b);
