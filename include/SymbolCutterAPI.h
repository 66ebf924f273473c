#ifndef SYMBOL_CUTTER_API_H
#define SYMBOL_CUTTER_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define SYMBOL_CUTTER_VERSION_MAJOR 1
#define SYMBOL_CUTTER_VERSION_MINOR 0
#define SYMBOL_CUTTER_VERSION_PATCH 0

// Error codes for host integration
typedef enum {
    SYMBOL_CUTTER_SUCCESS = 0,
    SYMBOL_CUTTER_ERROR_INVALID_INPUT = -1,
    SYMBOL_CUTTER_ERROR_FILE_NOT_FOUND = -2,
    SYMBOL_CUTTER_ERROR_IMAGE_LOAD_FAILED = -3,
    SYMBOL_CUTTER_ERROR_ENCODE_FAILED = -4,
    SYMBOL_CUTTER_ERROR_WRITE_FAILED = -5,
    SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS = -6,
    SYMBOL_CUTTER_ERROR_PROCESSING_FAILED = -7
} SymbolCutterResult;

// Outcome of one isolation run
typedef enum {
    SYMBOL_CUTTER_STATE_SKIPPED = 0,
    SYMBOL_CUTTER_STATE_PROCESSED = 1,
    SYMBOL_CUTTER_STATE_FALLBACK_ORIGINAL = 2
} SymbolCutterState;

// Processing parameters structure
typedef struct {
    // Background classification
    int32_t alpha_floor;            // Alpha below this is transparent background (default: 128)
    int32_t white_avg_threshold;    // Channel average above this is near-white (default: 250)
    int32_t pure_white_threshold;   // All channels at or above this is pure white (default: 252)
    int32_t dark_threshold;         // Channel average below this is dark (default: 30)
    int32_t gray_tol;               // Neutral gray channel tolerance (default: 10)
    int32_t light_threshold;        // Neutral gray brighter than this is background (default: 240)

    // Adaptive skip
    double border_white_ratio;      // White border fraction that triggers processing (default: 0.7)

    // Edge detection and cropping
    double edge_threshold;          // Sobel magnitude threshold (default: 30.0)
    int32_t crop_padding_min;       // Minimum crop padding in pixels (default: 20)

    // Cleanup
    bool enable_cleanup;            // Run the denoise/halo/attenuation passes (default: true)
    int32_t halo_alpha_cutoff;      // Alpha below this is cleared by the halo pass (default: 60)
    bool enable_sharpen;            // Apply the unsharp-mask pass (default: true)

    // Per-image time budget in milliseconds, 0 = unlimited (default: 0)
    int32_t time_budget_ms;

    // Debug visualization
    bool enable_debug_output;       // Enable debug image output (default: false)
    bool verbose_output;            // Log stage progress to stdout (default: false)
} SymbolCutterParams;

// RGBA8 image buffer, rows tightly packed (stride = width * 4)
typedef struct {
    uint8_t* pixels;
    int32_t width;
    int32_t height;
} SymbolCutterImage;

// Result of an isolation run
typedef struct {
    SymbolCutterImage image;        // Output pixels (caller must free with symbol_cutter_free_image)
    int32_t bbox_min_x;             // Inclusive crop bounds in source coordinates
    int32_t bbox_min_y;
    int32_t bbox_max_x;
    int32_t bbox_max_y;
    SymbolCutterState state;
    bool skipped;
    bool fallback_used;
} SymbolCutterOutput;

// Progress callback function type for UI progress tracking
typedef void (*SymbolCutterProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*SymbolCutterErrorCallback)(SymbolCutterResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void symbol_cutter_get_default_params(SymbolCutterParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return SYMBOL_CUTTER_SUCCESS if valid, error code otherwise
 */
SymbolCutterResult symbol_cutter_validate_params(const SymbolCutterParams* params);

/**
 * Isolate a symbol from a decoded RGBA buffer.
 * Background-removal failures are not errors: the output then holds a copy of
 * the input with fallback_used set.
 * @param input Input pixels (not modified)
 * @param params Processing parameters (defaults if NULL)
 * @param force_processing Run the pipeline even if the border is not a flat light background
 * @param output Output structure to fill (caller must free output->image)
 * @param error_callback Optional error callback for detailed error reporting
 * @return SYMBOL_CUTTER_SUCCESS if an output was produced, error code otherwise
 */
SymbolCutterResult symbol_cutter_process_rgba(
    const SymbolCutterImage* input,
    const SymbolCutterParams* params,
    bool force_processing,
    SymbolCutterOutput* output,
    SymbolCutterErrorCallback error_callback
);

/**
 * Complete processing: image file to PNG file in one call
 * @param input_path Path to input image file
 * @param output_path Path for output PNG file
 * @param params Processing parameters (defaults if NULL)
 * @param force_processing Run the pipeline even if the border is not a flat light background
 * @param state Optional pointer receiving the run's outcome
 * @param progress_callback Optional progress callback for UI updates
 * @param error_callback Optional error callback for detailed error reporting
 * @return SYMBOL_CUTTER_SUCCESS if successful, error code otherwise
 */
SymbolCutterResult symbol_cutter_process_file(
    const char* input_path,
    const char* output_path,
    const SymbolCutterParams* params,
    bool force_processing,
    SymbolCutterState* state,
    SymbolCutterProgressCallback progress_callback,
    SymbolCutterErrorCallback error_callback
);

// Memory management functions

/**
 * Free pixels allocated by symbol_cutter_process_rgba
 * @param image Pointer to image to free
 */
void symbol_cutter_free_image(SymbolCutterImage* image);

// Utility functions

/**
 * Get human-readable error message for error code
 * @param error_code Error code from SymbolCutterResult
 * @return Static string describing the error (do not free)
 */
const char* symbol_cutter_get_error_message(SymbolCutterResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* symbol_cutter_get_version(void);

/**
 * Check if input file appears to be a valid image
 * @param file_path Path to image file
 * @return true if file appears to be a valid image, false otherwise
 */
bool symbol_cutter_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // SYMBOL_CUTTER_API_H
