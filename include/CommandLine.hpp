#pragma once

#include "ImageProcessor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SymbolCutter {

// Options of symbolcutter_cli
struct Arguments {
    std::vector<std::string> inputPaths;
    std::string outputPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;
    bool force = false;
    bool disableCleanup = false;
    bool disableSharpen = false;
    int stage = 0;                     // 0 = full pipeline with adaptive skip

    // Unset keeps the library default; out-of-range values are rejected by validateParams
    std::optional<double> edgeThreshold;
    std::optional<int> paddingMin;
    std::optional<double> borderRatio;
    int timeoutMs = 0;
};

// <dir>/<stem>_isolated.png
std::string defaultOutputPath(const std::string& inputPath);

// Leaves valid == false on usage errors, after printing the reason.
Arguments parseArguments(int argc, const char* const argv[]);

// Does not validate; callers run ImageProcessor::validateParams on the result.
ImageProcessor::ProcessingParams buildParams(const Arguments& args);

} // namespace SymbolCutter
