#include "geometry.hpp"

#include <algorithm>

Box circleBox(const Circle& c) {
    double adjr = c.r + 1e-12; // Add a small epsilon to avoid precision issues
    return Box(
        Point(c.x() - adjr, c.y() - adjr),
        Point(c.x() + adjr, c.y() + adjr)
    );
}

Rectangle boundingSquare(const Point& center, double radius) {
    return Rectangle{
        bg::get<0>(center) - radius,
        bg::get<1>(center) - radius,
        radius * 2.0,
        radius * 2.0
    };
}

double gapDist(const Point& a, const Point& b, double ra, double rb) {
    return bg::distance(a, b) - (ra + rb);
}

double edgeDistance(double x, double y, double width, double height) {
    return std::min({x, y, width - x, height - y});
}

bool circleIntersectsRectangle(const Circle& c, const Rectangle& rect) {
    // Closest point of the rectangle to the circle center
    double closestX = std::max(rect.x, std::min(c.x(), rect.right()));
    double closestY = std::max(rect.y, std::min(c.y(), rect.bottom()));

    double dx = c.x() - closestX;
    double dy = c.y() - closestY;
    return dx * dx + dy * dy <= c.r * c.r;
}

bool rectanglesIntersect(const Rectangle& a, const Rectangle& b) {
    return !(a.x > b.right() ||
             a.right() < b.x ||
             a.y > b.bottom() ||
             a.bottom() < b.y);
}

bool circlesIntersect(const Circle& a, const Circle& b) {
    return bg::distance(a.center, b.center) <= a.r + b.r;
}
