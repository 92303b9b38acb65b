#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "structures.hpp"

// ==================== Source raster ====================

// RGB raster with channels in [0, 1], row-major, row 0 at the top
struct Image {
    size_t width = 0;
    size_t height = 0;
    std::vector<Color> pixels;

    static Image filled(size_t width, size_t height, const Color& color);

    // Throws std::out_of_range outside the raster
    const Color& at(size_t col, size_t row) const;
    Color& at(size_t col, size_t row);

    // Nearest pixel by floor, clamped to the raster
    Color sample(double x, double y) const;

    // Rec. 601 luma of sample(x, y)
    double luminance(double x, double y) const;

    bool empty() const { return pixels.empty(); }
};

// Reads binary (P6) and ASCII (P3) portable pixmaps.
// Throws std::runtime_error on unreadable or malformed files.
Image loadPPM(const std::string& path);
