#include "SymbolCutterAPI.h"
#include "ImageProcessor.hpp"
#include "SymbolExtractor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

using namespace SymbolCutter;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    ImageProcessor::ProcessingParams convertParams(const SymbolCutterParams* params) {
        ImageProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.alphaFloor = params->alpha_floor;
            cpp_params.whiteAvgThreshold = params->white_avg_threshold;
            cpp_params.pureWhiteThreshold = params->pure_white_threshold;
            cpp_params.darkThreshold = params->dark_threshold;
            cpp_params.grayTolerance = params->gray_tol;
            cpp_params.lightThreshold = params->light_threshold;

            cpp_params.borderWhiteRatio = params->border_white_ratio;

            cpp_params.edgeThreshold = params->edge_threshold;
            cpp_params.cropPaddingMin = params->crop_padding_min;

            cpp_params.enableCleanup = params->enable_cleanup;
            cpp_params.haloAlphaCutoff = params->halo_alpha_cutoff;
            cpp_params.enableSharpen = params->enable_sharpen;

            cpp_params.timeBudgetMs = params->time_budget_ms;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    SymbolCutterState convertState(PipelineState state) {
        switch (state) {
            case PipelineState::Processed: return SYMBOL_CUTTER_STATE_PROCESSED;
            case PipelineState::FallbackOriginal: return SYMBOL_CUTTER_STATE_FALLBACK_ORIGINAL;
            case PipelineState::Skipped: break;
        }
        return SYMBOL_CUTTER_STATE_SKIPPED;
    }

    // Copy an RGBA Mat into a malloc'd, tightly packed buffer
    bool copyToImage(const cv::Mat& rgba, SymbolCutterImage* image) {
        size_t rowBytes = static_cast<size_t>(rgba.cols) * 4;
        image->pixels = static_cast<uint8_t*>(malloc(rowBytes * rgba.rows));
        if (!image->pixels) {
            return false;
        }
        for (int y = 0; y < rgba.rows; y++) {
            memcpy(image->pixels + y * rowBytes, rgba.ptr<uint8_t>(y), rowBytes);
        }
        image->width = rgba.cols;
        image->height = rgba.rows;
        return true;
    }

    void reportError(SymbolCutterErrorCallback callback, SymbolCutterResult code, const char* message) {
        if (callback) {
            callback(code, message);
        }
    }

    // Progress reporting helper
    void reportProgress(SymbolCutterProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    SymbolCutterResult checkParams(const SymbolCutterParams*& params, SymbolCutterParams& defaults,
                                   SymbolCutterErrorCallback error_callback) {
        if (!params) {
            symbol_cutter_get_default_params(&defaults);
            params = &defaults;
        }

        SymbolCutterResult validation_result = symbol_cutter_validate_params(params);
        if (validation_result != SYMBOL_CUTTER_SUCCESS) {
            reportError(error_callback, validation_result, "Invalid processing parameters");
        }
        return validation_result;
    }
}

// API Implementation

void symbol_cutter_get_default_params(SymbolCutterParams* params) {
    if (!params) return;

    ImageProcessor::ProcessingParams defaults;

    params->alpha_floor = defaults.alphaFloor;
    params->white_avg_threshold = defaults.whiteAvgThreshold;
    params->pure_white_threshold = defaults.pureWhiteThreshold;
    params->dark_threshold = defaults.darkThreshold;
    params->gray_tol = defaults.grayTolerance;
    params->light_threshold = defaults.lightThreshold;

    params->border_white_ratio = defaults.borderWhiteRatio;

    params->edge_threshold = defaults.edgeThreshold;
    params->crop_padding_min = defaults.cropPaddingMin;

    params->enable_cleanup = defaults.enableCleanup;
    params->halo_alpha_cutoff = defaults.haloAlphaCutoff;
    params->enable_sharpen = defaults.enableSharpen;

    params->time_budget_ms = defaults.timeBudgetMs;

    params->enable_debug_output = defaults.enableDebugOutput;
    params->verbose_output = defaults.verboseOutput;
}

SymbolCutterResult symbol_cutter_validate_params(const SymbolCutterParams* params) {
    if (!params) return SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS;

    try {
        ImageProcessor::validateParams(convertParams(params));
    } catch (const InvalidConfig& e) {
        if (params->verbose_output) {
            std::cerr << "[ERROR] " << e.what() << std::endl;
        }
        return SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS;
    }
    return SYMBOL_CUTTER_SUCCESS;
}

SymbolCutterResult symbol_cutter_process_rgba(
    const SymbolCutterImage* input,
    const SymbolCutterParams* params,
    bool force_processing,
    SymbolCutterOutput* output,
    SymbolCutterErrorCallback error_callback
) {
    if (!input || !output || !input->pixels || input->width <= 0 || input->height <= 0) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_INVALID_INPUT, "Invalid input image or output pointer");
        return SYMBOL_CUTTER_ERROR_INVALID_INPUT;
    }

    // Initialize output
    memset(output, 0, sizeof(*output));

    SymbolCutterParams default_params;
    SymbolCutterResult validation_result = checkParams(params, default_params, error_callback);
    if (validation_result != SYMBOL_CUTTER_SUCCESS) {
        return validation_result;
    }

    try {
        // Wraps the caller's buffer without copying; the pipeline never writes to it
        cv::Mat rgba(input->height, input->width, CV_8UC4, input->pixels);

        SymbolExtractor extractor(convertParams(params));
        ProcessingHints hints;
        hints.forceProcessing = force_processing;
        ExtractionResult result = extractor.extract(rgba, hints);

        if (!copyToImage(result.image, &output->image)) {
            reportError(error_callback, SYMBOL_CUTTER_ERROR_PROCESSING_FAILED, "Out of memory for output image");
            return SYMBOL_CUTTER_ERROR_PROCESSING_FAILED;
        }

        output->bbox_min_x = result.bbox.minX;
        output->bbox_min_y = result.bbox.minY;
        output->bbox_max_x = result.bbox.maxX;
        output->bbox_max_y = result.bbox.maxY;
        output->state = convertState(result.state);
        output->skipped = result.skipped;
        output->fallback_used = result.fallbackUsed;
        return SYMBOL_CUTTER_SUCCESS;

    } catch (const std::exception& e) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_PROCESSING_FAILED, e.what());
        return SYMBOL_CUTTER_ERROR_PROCESSING_FAILED;
    }
}

SymbolCutterResult symbol_cutter_process_file(
    const char* input_path,
    const char* output_path,
    const SymbolCutterParams* params,
    bool force_processing,
    SymbolCutterState* state,
    SymbolCutterProgressCallback progress_callback,
    SymbolCutterErrorCallback error_callback
) {
    if (!input_path || !output_path) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_INVALID_INPUT, "Invalid input or output path");
        return SYMBOL_CUTTER_ERROR_INVALID_INPUT;
    }

    // Check file exists
    std::ifstream file(input_path);
    if (!file.good()) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
        return SYMBOL_CUTTER_ERROR_FILE_NOT_FOUND;
    }

    SymbolCutterParams default_params;
    SymbolCutterResult validation_result = checkParams(params, default_params, error_callback);
    if (validation_result != SYMBOL_CUTTER_SUCCESS) {
        return validation_result;
    }

    reportProgress(progress_callback, 0.0, "Loading image");

    cv::Mat rgba;
    try {
        rgba = ImageProcessor::loadImage(input_path);
    } catch (const std::exception& e) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_IMAGE_LOAD_FAILED, e.what());
        return SYMBOL_CUTTER_ERROR_IMAGE_LOAD_FAILED;
    }

    reportProgress(progress_callback, 0.2, "Isolating symbol");

    ExtractionResult result;
    try {
        SymbolExtractor extractor(convertParams(params));
        ProcessingHints hints;
        hints.forceProcessing = force_processing;
        hints.sourceName = input_path;
        result = extractor.extract(rgba, hints);
    } catch (const std::exception& e) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_PROCESSING_FAILED, e.what());
        return SYMBOL_CUTTER_ERROR_PROCESSING_FAILED;
    }

    if (state) {
        *state = convertState(result.state);
    }

    reportProgress(progress_callback, 0.8, "Encoding PNG");

    std::vector<uchar> png;
    try {
        png = ImageProcessor::encodePNG(result.image);
    } catch (const std::exception& e) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_ENCODE_FAILED, e.what());
        return SYMBOL_CUTTER_ERROR_ENCODE_FAILED;
    }

    std::ofstream out(output_path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    if (!out.good()) {
        reportError(error_callback, SYMBOL_CUTTER_ERROR_WRITE_FAILED, "Failed to write output PNG");
        return SYMBOL_CUTTER_ERROR_WRITE_FAILED;
    }

    reportProgress(progress_callback, 1.0, "Symbol isolation complete");
    return SYMBOL_CUTTER_SUCCESS;
}

void symbol_cutter_free_image(SymbolCutterImage* image) {
    if (image && image->pixels) {
        free(image->pixels);
        image->pixels = nullptr;
        image->width = 0;
        image->height = 0;
    }
}

const char* symbol_cutter_get_error_message(SymbolCutterResult error_code) {
    switch (error_code) {
        case SYMBOL_CUTTER_SUCCESS: return "Success";
        case SYMBOL_CUTTER_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case SYMBOL_CUTTER_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case SYMBOL_CUTTER_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case SYMBOL_CUTTER_ERROR_ENCODE_FAILED: return "Failed to encode output image as PNG";
        case SYMBOL_CUTTER_ERROR_WRITE_FAILED: return "Failed to write output file - check output path permissions";
        case SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case SYMBOL_CUTTER_ERROR_PROCESSING_FAILED: return "Symbol processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* symbol_cutter_get_version(void) {
    return "1.0.0";
}

bool symbol_cutter_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path, cv::IMREAD_UNCHANGED);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] " << e.what() << std::endl;
        return false;
    }
}
