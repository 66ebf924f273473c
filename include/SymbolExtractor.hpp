#pragma once

#include "ImageProcessor.hpp"
#include "SymbolTypes.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace SymbolCutter {

/**
 * Runs the isolation pipeline on one symbol image.
 *
 * extract() never throws for data-dependent failures: any stage error turns
 * into a FallbackOriginal result carrying the untouched input. Only the
 * constructor throws, with InvalidConfig, when the parameters are out of range.
 * A SymbolExtractor holds no per-call state and may be shared between threads.
 */
class SymbolExtractor {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    SymbolExtractor();
    explicit SymbolExtractor(const ProcessingParams& params);

    ExtractionResult extract(const cv::Mat& rgba, const ProcessingHints& hints = ProcessingHints()) const;

    // Per-call overrides; validated before use, InvalidConfig on failure.
    ExtractionResult extract(const cv::Mat& rgba, const ProcessingHints& hints,
                             const ProcessingParams& overrides) const;

    const ProcessingParams& params() const { return params_; }

    static bool hintRequestsProcessing(const ProcessingHints& hints);

private:
    static ExtractionResult run(const cv::Mat& rgba, const ProcessingHints& hints, const ProcessingParams& params);

    ProcessingParams params_;
};

} // namespace SymbolCutter
