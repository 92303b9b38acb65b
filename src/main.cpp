#include "CirclePacking.hpp"
#include "settings.hpp"

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <chrono>
#include <filesystem>
#include <optional>

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    Settings settings = loadSettings(argc > 1 ? argv[1] : "settings.txt");
    const PackingParams& p = settings.packing;
    std::cout << "Settings:\n";
    std::cout << "  Input image: " << (settings.inputImage ? settings.inputImage->string() : "none (uniform canvas)") << "\n";
    if (!settings.inputImage) {
        std::cout << "  Canvas: " << settings.width << "x" << settings.height << "\n";
    }
    std::cout << "  Output file: " << settings.outputFile << "\n";
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
    std::cout << "  Circle size: [" << p.minCircleSize << ", " << p.maxCircleSize << "], spacing " << p.circleSpacing << "\n";
    std::cout << "  Sampling: " << samplingName(p.sampling) << ", index: " << indexName(p.index)
              << ", capacity: " << p.capacity << ", maxDepth: " << p.maxDepth << "\n";
    std::cout << "  Seed: " << p.seed << ", maxCircles: " << p.maxCircles << "\n";

    // Set up logging
    std::ofstream logFile;
    std::ostream& logStream = [&]() -> std::ostream& {
        if (settings.logFile) {
            logFile.open(*settings.logFile); // overwrite mode
            if (logFile) {
                return logFile;
            } else {
                std::cerr << "Failed to open log file. Falling back to stdout.\n";
            }
        }
        return std::cout;
    }();

    try {
        Image image;
        if (settings.inputImage) {
            logStream << "Loading image: " << *settings.inputImage << "\n";
            image = loadPPM(settings.inputImage->string());
        } else {
            image = Image::filled(settings.width, settings.height, {0.5, 0.5, 0.5});
        }
        logStream << "Canvas: " << image.width << "x" << image.height << "\n";

        PackingStats stats;
        std::vector<Circle> circles = packCircles(image, p, &stats);

        logStream << "Packed " << stats.placed << " circles from " << stats.candidates
                  << " candidates in " << stats.passes << " passes, " << stats.elapsedMs << " ms\n";
        if (p.index == IndexKind::QuadTree) {
            logStream << "QuadTree nodes=" << stats.tree.nodes
                      << " leaves=" << stats.tree.leaves
                      << " depth=" << stats.tree.maxDepth
                      << " overflow=" << stats.tree.overflowCircles << "\n";
        } else {
            logStream << "SpatialHashGrid cells=" << stats.grid.totalCells
                      << " occupied=" << stats.grid.occupiedCells
                      << " avg=" << stats.grid.averageCirclesPerCell
                      << " max=" << stats.grid.maxCirclesInCell << "\n";
        }

        auto verifyStart = std::chrono::high_resolution_clock::now();
        bool ok = verifyPacking(circles, static_cast<double>(image.width), static_cast<double>(image.height));
        auto verifyEnd = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(verifyEnd - verifyStart).count();
        logStream << "Verification " << (ok ? "passed" : "FAILED") << " in " << duration << " ms\n";
        if (!ok) {
            return 1;
        }

        writeCircles(settings.outputFile.string(), circles);
        logStream << "Wrote " << circles.size() << " circles to " << settings.outputFile << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
