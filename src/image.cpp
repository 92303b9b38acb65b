#include "image.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

Image Image::filled(size_t width, size_t height, const Color& color) {
    Image img;
    img.width = width;
    img.height = height;
    img.pixels.assign(width * height, color);
    return img;
}

const Color& Image::at(size_t col, size_t row) const {
    if (col >= width || row >= height) {
        throw std::out_of_range("Pixel (" + std::to_string(col) + ", " + std::to_string(row) + ") outside image");
    }
    return pixels[row * width + col];
}

Color& Image::at(size_t col, size_t row) {
    if (col >= width || row >= height) {
        throw std::out_of_range("Pixel (" + std::to_string(col) + ", " + std::to_string(row) + ") outside image");
    }
    return pixels[row * width + col];
}

Color Image::sample(double x, double y) const {
    if (empty()) return {0.0, 0.0, 0.0};

    auto clampIndex = [](double v, size_t n) -> size_t {
        double f = std::floor(v);
        if (!(f > 0.0)) return 0;
        return static_cast<size_t>(std::min(f, static_cast<double>(n - 1)));
    };
    return pixels[clampIndex(y, height) * width + clampIndex(x, width)];
}

double Image::luminance(double x, double y) const {
    Color c = sample(x, y);
    return 0.299 * c[0] + 0.587 * c[1] + 0.114 * c[2];
}

// ==================== PPM reading ====================

// Next header integer, skipping whitespace and '#' comments
static bool readHeaderInt(std::istream& in, long& out) {
    char ch;
    while (in.get(ch)) {
        if (ch == '#') {
            std::string comment;
            std::getline(in, comment);
        } else if (!std::isspace(static_cast<unsigned char>(ch))) {
            in.unget();
            return static_cast<bool>(in >> out);
        }
    }
    return false;
}

Image loadPPM(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open file: " + path);

    std::string magic;
    in >> magic;
    if (magic != "P6" && magic != "P3") {
        throw std::runtime_error("Not a PPM (P3/P6) file: " + path);
    }

    long w = 0, h = 0, maxval = 0;
    if (!readHeaderInt(in, w) || !readHeaderInt(in, h) || !readHeaderInt(in, maxval)) {
        throw std::runtime_error("Malformed PPM header: " + path);
    }
    if (w <= 0 || h <= 0 || maxval <= 0 || maxval > 65535) {
        throw std::runtime_error("Invalid PPM dimensions or maxval: " + path);
    }

    Image img;
    img.width = static_cast<size_t>(w);
    img.height = static_cast<size_t>(h);
    img.pixels.resize(img.width * img.height);
    const double scale = 1.0 / static_cast<double>(maxval);

    if (magic == "P3") {
        for (auto& px : img.pixels) {
            for (double& channel : px) {
                long v;
                if (!readHeaderInt(in, v)) {
                    throw std::runtime_error("Truncated PPM data: " + path);
                }
                channel = static_cast<double>(std::clamp(v, 0L, maxval)) * scale;
            }
        }
        return img;
    }

    // Exactly one whitespace byte separates the header from binary data
    in.get();
    const size_t bytesPerChannel = maxval > 255 ? 2 : 1;
    std::vector<unsigned char> raw(img.pixels.size() * 3 * bytesPerChannel);
    if (!in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()))) {
        throw std::runtime_error("Truncated PPM data: " + path);
    }

    for (size_t i = 0; i < img.pixels.size(); ++i) {
        for (size_t c = 0; c < 3; ++c) {
            const size_t off = (i * 3 + c) * bytesPerChannel;
            // 16-bit samples are big-endian
            long v = bytesPerChannel == 2 ? (raw[off] << 8) | raw[off + 1] : raw[off];
            img.pixels[i][c] = static_cast<double>(std::min(v, maxval)) * scale;
        }
    }
    return img;
}
