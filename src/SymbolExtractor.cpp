#include "SymbolExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

using namespace cv;
using namespace std;

namespace SymbolCutter {

namespace {

ExtractionResult passThrough(const Mat& rgba, PipelineState state, const string& diagnostic) {
    ExtractionResult result;
    result.image = rgba.clone();
    result.bbox = rgba.empty() ? BoundingBox{} : BoundingBox::fromSize(rgba.size());
    result.state = state;
    result.skipped = state == PipelineState::Skipped;
    result.fallbackUsed = state == PipelineState::FallbackOriginal;
    result.diagnostic = diagnostic;
    return result;
}

string toLower(string text) {
    transform(text.begin(), text.end(), text.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return text;
}

} // namespace

SymbolExtractor::SymbolExtractor() : SymbolExtractor(ProcessingParams()) {
}

SymbolExtractor::SymbolExtractor(const ProcessingParams& params) : params_(params) {
    ImageProcessor::validateParams(params_);
    params_.debugImageStack.clear();
}

bool SymbolExtractor::hintRequestsProcessing(const ProcessingHints& hints) {
    if (hints.forceProcessing) return true;

    string name = toLower(hints.sourceName);
    return name.find("white") != string::npos || name.find("background") != string::npos;
}

ExtractionResult SymbolExtractor::extract(const Mat& rgba, const ProcessingHints& hints) const {
    return run(rgba, hints, params_);
}

ExtractionResult SymbolExtractor::extract(const Mat& rgba, const ProcessingHints& hints,
                                          const ProcessingParams& overrides) const {
    ImageProcessor::validateParams(overrides);
    return run(rgba, hints, overrides);
}

ExtractionResult SymbolExtractor::run(const Mat& rgba, const ProcessingHints& hints, const ProcessingParams& shared) {
    // Each invocation owns its parameters, including the debug image stack
    ProcessingParams params = shared;
    params.debugImageStack.clear();

    auto start = chrono::steady_clock::now();
    auto checkBudget = [&](ImageProcessor::Stage stage) {
        if (params.timeBudgetMs <= 0) return;
        auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
        if (elapsed.count() > params.timeBudgetMs) {
            throw TimeBudgetExceeded(ImageProcessor::stageName(stage));
        }
    };

    try {
        if (rgba.empty() || rgba.type() != CV_8UC4) {
            throw DecodeFailure("Input is not a decoded 8-bit RGBA image");
        }

        // A transparent border means the image was matted already; only an explicit force reprocesses it
        if (!hints.forceProcessing && ImageProcessor::hasTransparentBorder(rgba, params)) {
            if (params.verboseOutput) {
                cout << "[INFO] Border is already transparent, skipping background removal" << endl;
            }
            return passThrough(rgba, PipelineState::Skipped, "");
        }

        if (!ImageProcessor::hasUniformBackground(rgba, params) && !hintRequestsProcessing(hints)) {
            if (params.verboseOutput) {
                cout << "[INFO] No uniform light background detected, skipping background removal" << endl;
            }
            return passThrough(rgba, PipelineState::Skipped, "");
        }

        ImageProcessor::StageResult stages =
            ImageProcessor::runPipeline(rgba, params, ImageProcessor::STAGE_CLEANED, checkBudget);
        ImageProcessor::flushDebugStack(params);

        ExtractionResult result;
        result.image = stages.image;
        result.bbox = stages.bbox;
        result.state = PipelineState::Processed;

        if (params.verboseOutput) {
            auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
            cout << "[INFO] Isolated symbol " << rgba.cols << "x" << rgba.rows << " -> "
                 << result.image.cols << "x" << result.image.rows << " in " << elapsed.count() << "ms" << endl;
        }
        return result;

    } catch (const cv::Exception& e) {
        cerr << "[WARN] OpenCV error during isolation, using original image: " << e.what() << endl;
        return passThrough(rgba, PipelineState::FallbackOriginal, e.what());
    } catch (const std::bad_alloc& e) {
        cerr << "[WARN] Allocation failure during isolation, using original image: " << e.what() << endl;
        return passThrough(rgba, PipelineState::FallbackOriginal, string("Allocation failure: ") + e.what());
    } catch (const std::exception& e) {
        cerr << "[WARN] Background removal failed, using original image: " << e.what() << endl;
        return passThrough(rgba, PipelineState::FallbackOriginal, e.what());
    }
}

} // namespace SymbolCutter
