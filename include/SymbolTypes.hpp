#pragma once

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

namespace SymbolCutter {

// Inclusive pixel bounds: a box covering a single pixel has minX == maxX.
struct BoundingBox {
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;

    int width() const { return maxX - minX + 1; }
    int height() const { return maxY - minY + 1; }
    cv::Rect toRect() const { return cv::Rect(minX, minY, width(), height()); }

    static BoundingBox fromSize(const cv::Size& size) {
        return {0, 0, size.width - 1, size.height - 1};
    }

    bool operator==(const BoundingBox& other) const {
        return minX == other.minX && minY == other.minY &&
               maxX == other.maxX && maxY == other.maxY;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

enum class PipelineState {
    Skipped,
    Processed,
    FallbackOriginal
};

const char* pipelineStateName(PipelineState state);

struct ExtractionResult {
    cv::Mat image;              // RGBA, cropped when processed
    BoundingBox bbox;           // crop rectangle in source coordinates
    bool skipped = false;
    bool fallbackUsed = false;
    PipelineState state = PipelineState::Skipped;
    std::string diagnostic;     // reason for a fallback, empty otherwise
};

// Signals from the surrounding system that the image needs matting even if
// its border does not look like a flat white canvas.
struct ProcessingHints {
    bool forceProcessing = false;
    std::string sourceName;     // file name or URL the image came from
};

class NoForegroundDetected : public std::runtime_error {
public:
    NoForegroundDetected() : std::runtime_error("No foreground detected: entire image classified as background") {}
};

class DecodeFailure : public std::runtime_error {
public:
    explicit DecodeFailure(const std::string& what) : std::runtime_error(what) {}
};

class TimeBudgetExceeded : public std::runtime_error {
public:
    explicit TimeBudgetExceeded(const std::string& stage)
        : std::runtime_error("Time budget exceeded before stage: " + stage) {}
};

class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what) : std::invalid_argument("Invalid configuration: " + what) {}
};

} // namespace SymbolCutter
