#pragma once

#include "SymbolTypes.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace SymbolCutter {

// All images are CV_8UC4 in RGBA channel order; all masks are CV_8UC1 holding 0 or 255.
class ImageProcessor {
public:
    struct ProcessingParams {
        // Background classification
        int alphaFloor         = 128;   // Alpha below this is transparent background
        int whiteAvgThreshold  = 250;   // Channel average above this is near-white
        int pureWhiteThreshold = 252;   // All channels at or above this is pure white
        int darkThreshold      = 30;    // Channel average below this is dark background
        int grayTolerance      = 10;    // Max pairwise channel difference for neutral gray
        int lightThreshold     = 240;   // Neutral gray brighter than this is background

        // Border sampling for the adaptive skip
        int borderWhiteLevel     = 240;   // All channels above this count as a white sample
        double borderWhiteRatio  = 0.7;   // White fraction that marks a uniform background
        int borderMinStride      = 5;     // Minimum sampling stride in pixels
        double borderStrideRatio = 0.05;  // Stride as a fraction of min(width, height)

        // Edge detection
        double edgeThreshold = 30.0;      // Sobel gradient magnitude threshold

        // Cropping
        int cropPaddingMin      = 20;     // Minimum padding around the foreground
        double cropPaddingRatio = 0.1;    // Padding as a fraction of min(width, height)

        // Alpha compositing bands (luminance L, channel variance V)
        int hardWhiteThreshold   = 230;   // All channels above: alpha 0
        int nearWhiteLuminance   = 220;   // L above with V below nearWhiteVariance: alpha 0
        int nearWhiteVariance    = 20;
        int falloffLuminance     = 200;   // L in (falloff, nearWhite]: smooth falloff
        int falloffVariance      = 25;
        int falloffMaxAlpha      = 50;
        double falloffExponent   = 1.5;
        int softenLuminance      = 180;   // L in (soften, falloff]: slight softening
        int softenVariance       = 30;
        int softenMinAlpha       = 180;
        double softenSlope       = 3.0;

        // Cleanup passes
        bool enableCleanup       = true;
        double denoiseSigma      = 0.5;   // Gaussian sigma of the denoise pass
        int haloAlphaCutoff      = 60;    // 0 < alpha < cutoff becomes 0
        int haloWhiteLevel       = 220;   // All channels above with alpha > 0 becomes 0
        int edgeAlphaMax         = 160;   // Attenuation applies to cutoff <= alpha < max
        int edgeChannelMin       = 180;
        int edgeLuminanceStart   = 200;
        bool enableSharpen       = true;  // Unsharp mask on color channels
        double sharpenAmount     = 0.3;

        // Per-image wall-clock budget in milliseconds, 0 = unlimited
        int timeBudgetMs = 0;

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput     = false;
        std::string debugOutputPath = "./debug/";

        // Debug image stack (for automatic numbering)
        mutable std::vector<std::pair<cv::Mat, std::string>> debugImageStack;
    };

    enum Stage {
        STAGE_BACKGROUND_MASK = 1,
        STAGE_EDGES           = 2,
        STAGE_FOREGROUND_MASK = 3,
        STAGE_CROPPED         = 4,
        STAGE_COMPOSITED      = 5,
        STAGE_CLEANED         = 6
    };

    // Throws InvalidConfig when a threshold is out of range.
    static void validateParams(const ProcessingParams& params);

    // I/O helpers for callers outside the pipeline core
    static cv::Mat loadImage(const std::string& path);
    static cv::Mat toRGBA(const cv::Mat& img);
    static std::vector<uchar> encodePNG(const cv::Mat& rgba);
    static bool saveImage(const cv::Mat& rgba, const std::string& path);

    static double luminance(int r, int g, int b) {
        return 0.299 * r + 0.587 * g + 0.114 * b;
    }

    // Background classification
    static bool isBackground(int r, int g, int b, int a, const ProcessingParams& params);
    static bool isHardBackground(int r, int g, int b, int a, const ProcessingParams& params);
    static cv::Mat classifyBackground(const cv::Mat& rgba, const ProcessingParams& params);
    static bool hasUniformBackground(const cv::Mat& rgba, const ProcessingParams& params);
    // True when more than borderWhiteRatio of the border samples have alpha 0
    static bool hasTransparentBorder(const cv::Mat& rgba, const ProcessingParams& params);

    static cv::Mat detectEdges(const cv::Mat& rgba, double threshold);
    static cv::Mat protectedEdges(const cv::Mat& rgba, const cv::Mat& edges, const ProcessingParams& params);
    static cv::Mat buildForegroundMask(const cv::Mat& rgba, const cv::Mat& edges, const ProcessingParams& params);
    static cv::Mat buildForegroundMask(const cv::Mat& rgba, const ProcessingParams& params);

    // Bounding box: tight bounds throw NoForegroundDetected on an empty mask
    static BoundingBox findForegroundBounds(const cv::Mat& mask);
    static int cropPadding(const cv::Size& size, const ProcessingParams& params);
    static BoundingBox padBounds(const BoundingBox& tight, const cv::Size& size, const ProcessingParams& params);
    static BoundingBox extractBoundingBox(const cv::Mat& mask, const ProcessingParams& params);

    // Alpha rewrite of the cropped region; edgeMask is in source coordinates
    static cv::Mat compositeAlpha(const cv::Mat& rgba, const BoundingBox& bbox,
                                  const cv::Mat& edgeMask, const ProcessingParams& params);
    static uchar compositePixelAlpha(int r, int g, int b, int a, const ProcessingParams& params);

    // Cleanup passes, applied in this order by cleanup()
    static cv::Mat denoise(const cv::Mat& rgba, double sigma);
    static cv::Mat removeHalo(const cv::Mat& rgba, const ProcessingParams& params);
    static cv::Mat attenuateEdgeLuminance(const cv::Mat& rgba, const ProcessingParams& params);
    static cv::Mat sharpen(const cv::Mat& rgba, double amount);
    // Pixels set in preserve keep their input value through every pass.
    static cv::Mat cleanup(const cv::Mat& rgba, const ProcessingParams& params,
                           const cv::Mat& preserve = cv::Mat());
    // Source pixels that already carry partial alpha, grown by the denoise kernel radius
    static cv::Mat preMattedRegion(const cv::Mat& rgba, double sigma);

    static void saveDebugImage(const cv::Mat& image, const std::string& filename, const ProcessingParams& params);
    static void pushDebugImage(const cv::Mat& image, const std::string& name, const ProcessingParams& params);
    static void flushDebugStack(const ProcessingParams& params);

    struct StageResult {
        cv::Mat image;
        BoundingBox bbox;       // crop rectangle; the full image before STAGE_CROPPED
    };

    // Called before each stage runs; may throw to abort the run.
    using StageHook = std::function<void(Stage)>;

    static StageResult runPipeline(const cv::Mat& rgba, const ProcessingParams& params,
                                   int targetStage = STAGE_CLEANED,
                                   const StageHook& beforeStage = nullptr);
    static cv::Mat processImageToStage(const cv::Mat& rgba, const ProcessingParams& params, int targetStage);
    static const char* stageName(int stage);

private:
    static double borderSampleRatio(const cv::Mat& rgba, const ProcessingParams& params,
                                    const std::function<bool(const cv::Vec4b&)>& matches);
    static cv::Mat premultipliedBlur(const cv::Mat& rgba, double sigma);
};

} // namespace SymbolCutter
