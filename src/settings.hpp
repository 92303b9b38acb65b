#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "CirclePacking.hpp"

// Simple settings structure
struct Settings {
    std::optional<std::filesystem::path> inputImage; // none = uniform grey canvas
    std::filesystem::path outputFile = "circles.txt";
    std::optional<std::filesystem::path> logFile; // optional log file
    size_t width = 512;  // canvas size when no input image is given
    size_t height = 512;
    PackingParams packing;
};

const char* samplingName(SamplingMode m);
const char* indexName(IndexKind k);

// Read settings from a file (very simple: key value per line).
// Missing file, unknown keys and bad values are reported on stderr.
Settings loadSettings(const std::string& settingsFile);
