#include "settings.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

const char* samplingName(SamplingMode m) {
    return m == SamplingMode::Poisson ? "poisson" : "grid";
}

const char* indexName(IndexKind k) {
    return k == IndexKind::SpatialHash ? "hash" : "quadtree";
}

// Parse the next token into out; out is untouched when the token is malformed
template<typename T>
static bool readValue(std::istream& in, T& out) {
    std::string token;
    if (!(in >> token)) return false;
    // Extraction would wrap a negative number into a huge unsigned one
    if (std::is_unsigned<T>::value && token.front() == '-') return false;
    std::istringstream iss(token);
    T value;
    if (!(iss >> value)) return false;
    out = value;
    return true;
}

Settings loadSettings(const std::string& settingsFile) {
    Settings s;
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return s;
    }

    std::string key;
    while (in >> key) {
        bool ok = true;
        std::string text;
        if (key == "inputImage") {
            if ((ok = readValue(in, text))) s.inputImage = text;
        } else if (key == "outputFile") {
            if ((ok = readValue(in, text))) s.outputFile = text;
        } else if (key == "logFile") {
            if ((ok = readValue(in, text))) s.logFile = text;
        } else if (key == "width") {
            ok = readValue(in, s.width);
        } else if (key == "height") {
            ok = readValue(in, s.height);
        } else if (key == "minCircleSize") {
            ok = readValue(in, s.packing.minCircleSize);
        } else if (key == "maxCircleSize") {
            ok = readValue(in, s.packing.maxCircleSize);
        } else if (key == "circleSpacing") {
            ok = readValue(in, s.packing.circleSpacing);
        } else if (key == "capacity") {
            ok = readValue(in, s.packing.capacity);
        } else if (key == "maxDepth") {
            ok = readValue(in, s.packing.maxDepth);
        } else if (key == "sampling") {
            if ((ok = readValue(in, text))) {
                s.packing.sampling = text == "poisson" ? SamplingMode::Poisson : SamplingMode::Grid;
            }
        } else if (key == "index") {
            if ((ok = readValue(in, text))) {
                s.packing.index = text == "hash" ? IndexKind::SpatialHash : IndexKind::QuadTree;
            }
        } else if (key == "seed") {
            ok = readValue(in, s.packing.seed);
        } else if (key == "maxCircles") {
            ok = readValue(in, s.packing.maxCircles);
        } else {
            in >> text;
            std::cerr << "Unknown setting '" << key << "' ignored." << std::endl;
            continue;
        }

        if (!ok) {
            std::cerr << "Bad value for setting '" << key << "'. Keeping default." << std::endl;
        }
    }
    return s;
}
