#include "ImageProcessor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace SymbolCutter {

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Skipped: return "Skipped";
        case PipelineState::Processed: return "Processed";
        case PipelineState::FallbackOriginal: return "FallbackOriginal";
    }
    return "Unknown";
}

namespace {

void requireRange(int value, int lo, int hi, const char* name) {
    if (value < lo || value > hi) {
        throw InvalidConfig(string(name) + " = " + to_string(value) +
                            " (expected " + to_string(lo) + ".." + to_string(hi) + ")");
    }
}

void requireRange(double value, double lo, double hi, const char* name) {
    if (!(value >= lo && value <= hi)) {
        throw InvalidConfig(string(name) + " = " + to_string(value) +
                            " (expected " + to_string(lo) + ".." + to_string(hi) + ")");
    }
}

void requireRGBA(const Mat& img, const char* stage) {
    if (img.empty() || img.type() != CV_8UC4) {
        throw invalid_argument(string(stage) + " expects a non-empty 8-bit RGBA image");
    }
}

void requireMask(const Mat& mask, const Size& size, const char* stage) {
    if (mask.type() != CV_8UC1 || mask.size() != size) {
        throw invalid_argument(string(stage) + " expects an 8-bit mask matching the image size");
    }
}

} // namespace

void ImageProcessor::validateParams(const ProcessingParams& params) {
    requireRange(params.alphaFloor, 0, 255, "alphaFloor");
    requireRange(params.whiteAvgThreshold, 0, 255, "whiteAvgThreshold");
    requireRange(params.pureWhiteThreshold, 0, 255, "pureWhiteThreshold");
    requireRange(params.darkThreshold, 0, 255, "darkThreshold");
    requireRange(params.grayTolerance, 0, 255, "grayTolerance");
    requireRange(params.lightThreshold, 0, 255, "lightThreshold");

    requireRange(params.borderWhiteLevel, 0, 255, "borderWhiteLevel");
    requireRange(params.borderWhiteRatio, 0.0, 1.0, "borderWhiteRatio");
    requireRange(params.borderMinStride, 1, 1 << 20, "borderMinStride");
    requireRange(params.borderStrideRatio, 0.0, 1.0, "borderStrideRatio");

    requireRange(params.edgeThreshold, 0.0, 1e6, "edgeThreshold");

    requireRange(params.cropPaddingMin, 0, 1 << 20, "cropPaddingMin");
    requireRange(params.cropPaddingRatio, 0.0, 1.0, "cropPaddingRatio");

    requireRange(params.hardWhiteThreshold, 0, 255, "hardWhiteThreshold");
    requireRange(params.nearWhiteLuminance, 0, 255, "nearWhiteLuminance");
    requireRange(params.nearWhiteVariance, 0, 255, "nearWhiteVariance");
    requireRange(params.falloffLuminance, 0, 255, "falloffLuminance");
    requireRange(params.falloffVariance, 0, 255, "falloffVariance");
    requireRange(params.falloffMaxAlpha, 0, 255, "falloffMaxAlpha");
    requireRange(params.softenLuminance, 0, 255, "softenLuminance");
    requireRange(params.softenVariance, 0, 255, "softenVariance");
    requireRange(params.softenMinAlpha, 0, 255, "softenMinAlpha");
    requireRange(params.softenSlope, 0.0, 255.0, "softenSlope");
    if (!(params.falloffExponent > 0.0) || params.falloffExponent > 16.0) {
        throw InvalidConfig("falloffExponent must be in (0, 16]");
    }
    if (params.falloffLuminance >= params.nearWhiteLuminance) {
        throw InvalidConfig("falloffLuminance must be below nearWhiteLuminance");
    }
    if (params.softenLuminance >= params.falloffLuminance) {
        throw InvalidConfig("softenLuminance must be below falloffLuminance");
    }

    requireRange(params.denoiseSigma, 0.0, 5.0, "denoiseSigma");
    requireRange(params.haloAlphaCutoff, 0, 255, "haloAlphaCutoff");
    requireRange(params.haloWhiteLevel, 0, 255, "haloWhiteLevel");
    requireRange(params.edgeAlphaMax, 0, 256, "edgeAlphaMax");
    requireRange(params.edgeChannelMin, 0, 255, "edgeChannelMin");
    requireRange(params.edgeLuminanceStart, 0, 255, "edgeLuminanceStart");
    requireRange(params.sharpenAmount, 0.0, 2.0, "sharpenAmount");
    if (params.haloAlphaCutoff > params.edgeAlphaMax) {
        throw InvalidConfig("haloAlphaCutoff must not exceed edgeAlphaMax");
    }

    if (params.timeBudgetMs < 0) {
        throw InvalidConfig("timeBudgetMs must not be negative");
    }
}

Mat ImageProcessor::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    Mat img = imread(path, IMREAD_UNCHANGED);
    if (img.empty()) {
        throw DecodeFailure("Failed to load image: " + path);
    }
    return toRGBA(img);
}

// Accepts OpenCV's native channel order (gray, BGR, BGRA) at 8 or 16 bits.
Mat ImageProcessor::toRGBA(const Mat& img) {
    if (img.empty()) {
        throw DecodeFailure("Cannot convert an empty image");
    }

    Mat src = img;
    if (img.depth() == CV_16U) {
        img.convertTo(src, CV_8U, 1.0 / 257.0);
    } else if (img.depth() != CV_8U) {
        throw DecodeFailure("Unsupported image depth: " + to_string(img.depth()));
    }

    Mat rgba;
    switch (src.channels()) {
        case 1: cvtColor(src, rgba, COLOR_GRAY2RGBA); break;
        case 3: cvtColor(src, rgba, COLOR_BGR2RGBA); break;
        case 4: cvtColor(src, rgba, COLOR_BGRA2RGBA); break;
        default:
            throw DecodeFailure("Unsupported channel count: " + to_string(src.channels()));
    }
    return rgba;
}

vector<uchar> ImageProcessor::encodePNG(const Mat& rgba) {
    requireRGBA(rgba, "encodePNG");

    Mat bgra;
    cvtColor(rgba, bgra, COLOR_RGBA2BGRA);
    vector<uchar> buffer;
    if (!imencode(".png", bgra, buffer)) {
        throw runtime_error("PNG encoding failed");
    }
    return buffer;
}

bool ImageProcessor::saveImage(const Mat& rgba, const string& path) {
    requireRGBA(rgba, "saveImage");

    Mat bgra;
    cvtColor(rgba, bgra, COLOR_RGBA2BGRA);
    try {
        return imwrite(path, bgra);
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] Failed to write " << path << ": " << e.what() << endl;
        return false;
    }
}

// Rules are checked in order; the first match classifies the pixel as background.
bool ImageProcessor::isBackground(int r, int g, int b, int a, const ProcessingParams& params) {
    if (isHardBackground(r, g, b, a, params)) {
        return true;
    }

    double avg = (r + g + b) / 3.0;
    if (avg < params.darkThreshold) {
        return true;
    }

    bool isGray = abs(r - g) < params.grayTolerance &&
                  abs(g - b) < params.grayTolerance &&
                  abs(r - b) < params.grayTolerance;
    return isGray && avg > params.lightThreshold;
}

// Transparent or white pixels carry no foreground color; edges never rescue them.
bool ImageProcessor::isHardBackground(int r, int g, int b, int a, const ProcessingParams& params) {
    if (a < params.alphaFloor) {
        return true;
    }

    double avg = (r + g + b) / 3.0;
    if (avg > params.whiteAvgThreshold) {
        return true;
    }
    return r >= params.pureWhiteThreshold && g >= params.pureWhiteThreshold && b >= params.pureWhiteThreshold;
}

Mat ImageProcessor::classifyBackground(const Mat& rgba, const ProcessingParams& params) {
    requireRGBA(rgba, "classifyBackground");

    Mat mask(rgba.size(), CV_8UC1);
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4b* src = rgba.ptr<Vec4b>(y);
        uchar* dst = mask.ptr<uchar>(y);
        for (int x = 0; x < rgba.cols; x++) {
            const Vec4b& p = src[x];
            dst[x] = isBackground(p[0], p[1], p[2], p[3], params) ? 255 : 0;
        }
    }
    return mask;
}

// Samples the four borders with a stride proportional to the shorter side.
double ImageProcessor::borderSampleRatio(const Mat& rgba, const ProcessingParams& params,
                                         const function<bool(const Vec4b&)>& matches) {
    int stride = max(params.borderMinStride,
                     static_cast<int>(min(rgba.cols, rgba.rows) * params.borderStrideRatio));

    int totalSamples = 0;
    int matchingSamples = 0;
    auto sample = [&](int x, int y) {
        totalSamples++;
        if (matches(rgba.at<Vec4b>(y, x))) {
            matchingSamples++;
        }
    };

    // Top and bottom rows
    for (int x = 0; x < rgba.cols; x += stride) {
        sample(x, 0);
        sample(x, rgba.rows - 1);
    }

    // Left and right columns
    for (int y = 0; y < rgba.rows; y += stride) {
        sample(0, y);
        sample(rgba.cols - 1, y);
    }

    if (params.verboseOutput) {
        cout << "[INFO] Border samples: " << matchingSamples << "/" << totalSamples
             << " matching, stride " << stride << endl;
    }
    return static_cast<double>(matchingSamples) / totalSamples;
}

bool ImageProcessor::hasUniformBackground(const Mat& rgba, const ProcessingParams& params) {
    requireRGBA(rgba, "hasUniformBackground");

    double ratio = borderSampleRatio(rgba, params, [&](const Vec4b& p) {
        return p[3] >= params.alphaFloor &&
               p[0] > params.borderWhiteLevel && p[1] > params.borderWhiteLevel && p[2] > params.borderWhiteLevel;
    });
    if (params.verboseOutput) {
        cout << "[INFO] Border white ratio: " << ratio << endl;
    }
    return ratio > params.borderWhiteRatio;
}

bool ImageProcessor::hasTransparentBorder(const Mat& rgba, const ProcessingParams& params) {
    requireRGBA(rgba, "hasTransparentBorder");

    double ratio = borderSampleRatio(rgba, params, [](const Vec4b& p) { return p[3] == 0; });
    if (params.verboseOutput) {
        cout << "[INFO] Border transparent ratio: " << ratio << endl;
    }
    return ratio > params.borderWhiteRatio;
}

Mat ImageProcessor::detectEdges(const Mat& rgba, double threshold) {
    requireRGBA(rgba, "detectEdges");

    Mat rgbaF;
    rgba.convertTo(rgbaF, CV_32F);
    Mat lum;
    transform(rgbaF, lum, Matx14f(0.299f, 0.587f, 0.114f, 0.0f));

    // ksize 3 gives Gx = [-1 0 1; -2 0 2; -1 0 1] and its transpose for Gy
    Mat gx, gy, magnitudeMap;
    Sobel(lum, gx, CV_32F, 1, 0, 3);
    Sobel(lum, gy, CV_32F, 0, 1, 3);
    magnitude(gx, gy, magnitudeMap);

    Mat edges = magnitudeMap > threshold;

    // Pixels without a full 3x3 neighborhood are never edges
    edges.row(0).setTo(0);
    edges.row(edges.rows - 1).setTo(0);
    edges.col(0).setTo(0);
    edges.col(edges.cols - 1).setTo(0);
    return edges;
}

Mat ImageProcessor::protectedEdges(const Mat& rgba, const Mat& edges, const ProcessingParams& params) {
    requireRGBA(rgba, "protectedEdges");
    requireMask(edges, rgba.size(), "protectedEdges");

    Mat result = Mat::zeros(rgba.size(), CV_8UC1);
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4b* src = rgba.ptr<Vec4b>(y);
        const uchar* edge = edges.ptr<uchar>(y);
        uchar* dst = result.ptr<uchar>(y);
        for (int x = 0; x < rgba.cols; x++) {
            const Vec4b& p = src[x];
            if (edge[x] && !isHardBackground(p[0], p[1], p[2], p[3], params)) {
                dst[x] = 255;
            }
        }
    }
    return result;
}

Mat ImageProcessor::buildForegroundMask(const Mat& rgba, const Mat& edges, const ProcessingParams& params) {
    Mat background = classifyBackground(rgba, params);
    Mat foreground;
    bitwise_not(background, foreground);
    bitwise_or(foreground, protectedEdges(rgba, edges, params), foreground);
    return foreground;
}

Mat ImageProcessor::buildForegroundMask(const Mat& rgba, const ProcessingParams& params) {
    return buildForegroundMask(rgba, detectEdges(rgba, params.edgeThreshold), params);
}

BoundingBox ImageProcessor::findForegroundBounds(const Mat& mask) {
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw invalid_argument("findForegroundBounds expects a non-empty 8-bit mask");
    }

    int minX = mask.cols, minY = mask.rows, maxX = -1, maxY = -1;
    for (int y = 0; y < mask.rows; y++) {
        const uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < mask.cols; x++) {
            if (row[x]) {
                minX = min(minX, x);
                maxX = max(maxX, x);
                minY = min(minY, y);
                maxY = max(maxY, y);
            }
        }
    }

    if (maxX < 0) {
        throw NoForegroundDetected();
    }
    return {minX, minY, maxX, maxY};
}

int ImageProcessor::cropPadding(const Size& size, const ProcessingParams& params) {
    return max(params.cropPaddingMin,
               static_cast<int>(floor(params.cropPaddingRatio * min(size.width, size.height))));
}

BoundingBox ImageProcessor::padBounds(const BoundingBox& tight, const Size& size, const ProcessingParams& params) {
    int padding = cropPadding(size, params);
    return {
        max(0, tight.minX - padding),
        max(0, tight.minY - padding),
        min(size.width - 1, tight.maxX + padding),
        min(size.height - 1, tight.maxY + padding)
    };
}

BoundingBox ImageProcessor::extractBoundingBox(const Mat& mask, const ProcessingParams& params) {
    BoundingBox tight = findForegroundBounds(mask);
    BoundingBox padded = padBounds(tight, mask.size(), params);

    if (params.verboseOutput) {
        cout << "[INFO] Foreground bounds (" << tight.minX << "," << tight.minY << ")-("
             << tight.maxX << "," << tight.maxY << "), padded to " << padded.width() << "x"
             << padded.height() << " with " << cropPadding(mask.size(), params) << "px padding" << endl;
    }
    return padded;
}

void ImageProcessor::saveDebugImage(const Mat& image, const string& filename, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    std::error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARN] Could not create debug directory " << params.debugOutputPath << ": " << ec.message() << endl;
        return;
    }

    Mat out = image;
    if (image.type() == CV_8UC4) {
        cvtColor(image, out, COLOR_RGBA2BGRA);
    }

    string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();
    bool success = false;
    try {
        success = imwrite(fullPath, out);
    } catch (const cv::Exception& e) {
        cout << "[WARN] " << e.what() << endl;
    }
    if (success) {
        cout << "[DEBUG] Saved debug image: " << fullPath << endl;
    } else {
        cout << "[WARN] Failed to save debug image: " << fullPath << endl;
    }
}

void ImageProcessor::pushDebugImage(const Mat& image, const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    params.debugImageStack.emplace_back(image.clone(), name);
}

void ImageProcessor::flushDebugStack(const ProcessingParams& params) {
    if (!params.enableDebugOutput || params.debugImageStack.empty()) return;

    if (params.verboseOutput) {
        cout << "[DEBUG] Flushing " << params.debugImageStack.size() << " debug images..." << endl;
    }

    // Format: 01_name.png, 02_name.png, etc.
    for (size_t i = 0; i < params.debugImageStack.size(); i++) {
        const auto& [image, name] = params.debugImageStack[i];
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        saveDebugImage(image, string(indexStr) + "_" + name + ".png", params);
    }

    params.debugImageStack.clear();
}

const char* ImageProcessor::stageName(int stage) {
    switch (stage) {
        case STAGE_BACKGROUND_MASK: return "background_mask";
        case STAGE_EDGES: return "edges";
        case STAGE_FOREGROUND_MASK: return "foreground_mask";
        case STAGE_CROPPED: return "cropped";
        case STAGE_COMPOSITED: return "composited";
        case STAGE_CLEANED: return "cleaned";
        default: return "unknown";
    }
}

ImageProcessor::StageResult ImageProcessor::runPipeline(const Mat& rgba, const ProcessingParams& params,
                                                        int targetStage, const StageHook& beforeStage) {
    if (targetStage < STAGE_BACKGROUND_MASK || targetStage > STAGE_CLEANED) {
        throw invalid_argument("Invalid target stage: " + to_string(targetStage));
    }
    requireRGBA(rgba, "runPipeline");

    auto enter = [&](Stage stage) {
        if (beforeStage) beforeStage(stage);
        if (params.verboseOutput) {
            cout << "[INFO] Stage " << stage << ": " << stageName(stage) << endl;
        }
    };

    StageResult result;
    result.bbox = BoundingBox::fromSize(rgba.size());

    enter(STAGE_BACKGROUND_MASK);
    Mat background = classifyBackground(rgba, params);
    pushDebugImage(background, stageName(STAGE_BACKGROUND_MASK), params);
    if (targetStage == STAGE_BACKGROUND_MASK) {
        result.image = background;
        return result;
    }

    enter(STAGE_EDGES);
    Mat edges = protectedEdges(rgba, detectEdges(rgba, params.edgeThreshold), params);
    pushDebugImage(edges, stageName(STAGE_EDGES), params);
    if (targetStage == STAGE_EDGES) {
        result.image = edges;
        return result;
    }

    enter(STAGE_FOREGROUND_MASK);
    Mat foreground;
    bitwise_not(background, foreground);
    bitwise_or(foreground, edges, foreground);
    pushDebugImage(foreground, stageName(STAGE_FOREGROUND_MASK), params);
    if (targetStage == STAGE_FOREGROUND_MASK) {
        result.image = foreground;
        return result;
    }

    enter(STAGE_CROPPED);
    result.bbox = extractBoundingBox(foreground, params);
    if (targetStage == STAGE_CROPPED || params.enableDebugOutput) {
        Mat cropped = rgba(result.bbox.toRect()).clone();
        pushDebugImage(cropped, stageName(STAGE_CROPPED), params);
        if (targetStage == STAGE_CROPPED) {
            result.image = cropped;
            return result;
        }
    }

    enter(STAGE_COMPOSITED);
    Mat composited = compositeAlpha(rgba, result.bbox, edges, params);
    pushDebugImage(composited, stageName(STAGE_COMPOSITED), params);
    if (targetStage == STAGE_COMPOSITED || !params.enableCleanup) {
        result.image = composited;
        return result;
    }

    enter(STAGE_CLEANED);
    Mat preMatted = preMattedRegion(rgba(result.bbox.toRect()), params.denoiseSigma);
    result.image = cleanup(composited, params, preMatted);
    pushDebugImage(result.image, stageName(STAGE_CLEANED), params);
    return result;
}

Mat ImageProcessor::processImageToStage(const Mat& rgba, const ProcessingParams& params, int targetStage) {
    Mat image = runPipeline(rgba, params, targetStage).image;
    flushDebugStack(params);
    return image;
}

} // namespace SymbolCutter
