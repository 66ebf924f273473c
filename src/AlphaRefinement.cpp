#include "ImageProcessor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace SymbolCutter {

namespace {

int channelVariance(int r, int g, int b) {
    return max({abs(r - g), abs(r - b), abs(g - b)});
}

} // namespace

uchar ImageProcessor::compositePixelAlpha(int r, int g, int b, int a, const ProcessingParams& params) {
    if (a == 0) return 0;

    if (r > params.hardWhiteThreshold && g > params.hardWhiteThreshold && b > params.hardWhiteThreshold) {
        return 0;
    }

    double lum = luminance(r, g, b);
    int variance = channelVariance(r, g, b);

    if (lum > params.nearWhiteLuminance && variance < params.nearWhiteVariance) {
        return 0;
    }

    if (lum > params.falloffLuminance && variance < params.falloffVariance) {
        double band = params.nearWhiteLuminance - params.falloffLuminance;
        double t = max(0.0, (params.nearWhiteLuminance - lum) / band);
        double alpha = pow(t, params.falloffExponent) * params.falloffMaxAlpha;
        return saturate_cast<uchar>(min(alpha, static_cast<double>(params.falloffMaxAlpha)));
    }

    if (lum > params.softenLuminance && variance < params.softenVariance) {
        double softened = max(static_cast<double>(params.softenMinAlpha),
                              a - (lum - params.softenLuminance) * params.softenSlope);
        return saturate_cast<uchar>(min(static_cast<double>(a), softened));
    }

    return static_cast<uchar>(a);
}

Mat ImageProcessor::compositeAlpha(const Mat& rgba, const BoundingBox& bbox,
                                   const Mat& edgeMask, const ProcessingParams& params) {
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw invalid_argument("compositeAlpha expects a non-empty 8-bit RGBA image");
    }
    if (!edgeMask.empty() && (edgeMask.type() != CV_8UC1 || edgeMask.size() != rgba.size())) {
        throw invalid_argument("compositeAlpha expects an edge mask matching the image size");
    }

    Rect roi = bbox.toRect();
    if ((roi & Rect(0, 0, rgba.cols, rgba.rows)) != roi || roi.empty()) {
        throw invalid_argument("Bounding box lies outside the image");
    }

    Mat cropped = rgba(roi).clone();
    Mat edges = edgeMask.empty() ? Mat() : edgeMask(roi);

    int transparent = 0;
    int forced = 0;
    for (int y = 0; y < cropped.rows; y++) {
        Vec4b* row = cropped.ptr<Vec4b>(y);
        const uchar* edgeRow = edges.empty() ? nullptr : edges.ptr<uchar>(y);
        for (int x = 0; x < cropped.cols; x++) {
            Vec4b& p = row[x];
            if (edgeRow && edgeRow[x]) {
                p[3] = 255;
                forced++;
                continue;
            }
            p[3] = compositePixelAlpha(p[0], p[1], p[2], p[3], params);
            if (p[3] == 0) transparent++;
        }
    }

    if (params.verboseOutput) {
        cout << "[INFO] Composited " << cropped.cols << "x" << cropped.rows << " crop: "
             << transparent << " transparent, " << forced << " edge pixels kept opaque" << endl;
    }
    return cropped;
}

// Blurs in premultiplied space so that the stored color of transparent pixels
// does not bleed into visible ones. Pixels outside the image count as transparent.
Mat ImageProcessor::premultipliedBlur(const Mat& rgba, double sigma) {
    if (sigma <= 0.0) return rgba.clone();

    Mat premultiplied(rgba.size(), CV_32FC4);
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4b* src = rgba.ptr<Vec4b>(y);
        Vec4f* dst = premultiplied.ptr<Vec4f>(y);
        for (int x = 0; x < rgba.cols; x++) {
            float a = src[x][3] / 255.0f;
            dst[x] = Vec4f(src[x][0] * a, src[x][1] * a, src[x][2] * a, static_cast<float>(src[x][3]));
        }
    }

    Mat blurred;
    GaussianBlur(premultiplied, blurred, Size(0, 0), sigma, sigma, BORDER_CONSTANT);

    Mat result(rgba.size(), CV_8UC4);
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4f* src = blurred.ptr<Vec4f>(y);
        const Vec4b* orig = rgba.ptr<Vec4b>(y);
        Vec4b* dst = result.ptr<Vec4b>(y);
        for (int x = 0; x < rgba.cols; x++) {
            uchar alpha = saturate_cast<uchar>(src[x][3]);
            if (alpha == 0) {
                dst[x] = Vec4b(orig[x][0], orig[x][1], orig[x][2], 0);
                continue;
            }
            float scale = 255.0f / src[x][3];
            dst[x] = Vec4b(saturate_cast<uchar>(src[x][0] * scale),
                           saturate_cast<uchar>(src[x][1] * scale),
                           saturate_cast<uchar>(src[x][2] * scale),
                           alpha);
        }
    }
    return result;
}

Mat ImageProcessor::denoise(const Mat& rgba, double sigma) {
    return premultipliedBlur(rgba, sigma);
}

Mat ImageProcessor::removeHalo(const Mat& rgba, const ProcessingParams& params) {
    Mat result = rgba.clone();
    for (int y = 0; y < result.rows; y++) {
        Vec4b* row = result.ptr<Vec4b>(y);
        for (int x = 0; x < result.cols; x++) {
            Vec4b& p = row[x];
            if (p[3] > 0 && p[3] < params.haloAlphaCutoff) {
                p[3] = 0;
            }
            if (p[3] > 0 && p[0] > params.haloWhiteLevel && p[1] > params.haloWhiteLevel &&
                p[2] > params.haloWhiteLevel) {
                p[3] = 0;
            }
        }
    }
    return result;
}

Mat ImageProcessor::attenuateEdgeLuminance(const Mat& rgba, const ProcessingParams& params) {
    Mat result = rgba.clone();
    for (int y = 0; y < result.rows; y++) {
        Vec4b* row = result.ptr<Vec4b>(y);
        for (int x = 0; x < result.cols; x++) {
            Vec4b& p = row[x];
            if (p[3] < params.haloAlphaCutoff || p[3] >= params.edgeAlphaMax) continue;
            if (p[0] <= params.edgeChannelMin || p[1] <= params.edgeChannelMin || p[2] <= params.edgeChannelMin) continue;

            double lum = luminance(p[0], p[1], p[2]);
            if (lum > params.edgeLuminanceStart) {
                p[3] = saturate_cast<uchar>(max(0.0, p[3] - (lum - params.edgeLuminanceStart)));
            }
        }
    }
    return result;
}

// Unsharp mask on the color of visible pixels; alpha is left as is.
Mat ImageProcessor::sharpen(const Mat& rgba, double amount) {
    if (amount <= 0.0) return rgba.clone();

    Mat blurred = premultipliedBlur(rgba, 1.0);
    Mat result = rgba.clone();
    for (int y = 0; y < result.rows; y++) {
        Vec4b* row = result.ptr<Vec4b>(y);
        const Vec4b* soft = blurred.ptr<Vec4b>(y);
        for (int x = 0; x < result.cols; x++) {
            if (row[x][3] == 0) continue;
            for (int c = 0; c < 3; c++) {
                row[x][c] = saturate_cast<uchar>(row[x][c] + amount * (row[x][c] - soft[x][c]));
            }
        }
    }
    return result;
}

Mat ImageProcessor::preMattedRegion(const Mat& rgba, double sigma) {
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw invalid_argument("preMattedRegion expects a non-empty 8-bit RGBA image");
    }

    Mat alpha;
    extractChannel(rgba, alpha, 3);
    Mat region = alpha < 255;
    if (sigma <= 0.0 || countNonZero(region) == 0) {
        return region;
    }

    // Same kernel size GaussianBlur derives for a float image
    int radius = (cvRound(sigma * 8 + 1) | 1) / 2;
    Mat kernel = getStructuringElement(MORPH_RECT, Size(2 * radius + 1, 2 * radius + 1));
    dilate(region, region, kernel);
    return region;
}

Mat ImageProcessor::cleanup(const Mat& rgba, const ProcessingParams& params, const Mat& preserve) {
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw invalid_argument("cleanup expects a non-empty 8-bit RGBA image");
    }
    if (!preserve.empty() && (preserve.type() != CV_8UC1 || preserve.size() != rgba.size())) {
        throw invalid_argument("cleanup expects a preserve mask matching the image size");
    }

    Mat result = denoise(rgba, params.denoiseSigma);
    result = removeHalo(result, params);
    result = attenuateEdgeLuminance(result, params);
    if (params.enableSharpen) {
        result = sharpen(result, params.sharpenAmount);
    }
    if (!preserve.empty()) {
        rgba.copyTo(result, preserve);
    }

    if (params.verboseOutput) {
        cout << "[INFO] Cleanup complete (sharpen " << (params.enableSharpen ? "on" : "off") << ")" << endl;
    }
    return result;
}

} // namespace SymbolCutter
