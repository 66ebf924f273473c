#include <gtest/gtest.h>

#include <SymbolCutterAPI.h>
#include "ImageProcessor.hpp"
#include "SyntheticImages.hpp"

#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

using namespace SymbolCutter;
using namespace SymbolCutter::Testing;

namespace {

int errorCalls = 0;
SymbolCutterResult lastError = SYMBOL_CUTTER_SUCCESS;

void recordError(SymbolCutterResult code, const char*) {
    errorCalls++;
    lastError = code;
}

std::vector<double> progressSeen;

void recordProgress(double progress, const char*) {
    progressSeen.push_back(progress);
}

SymbolCutterImage wrap(cv::Mat& rgba) {
    SymbolCutterImage image;
    image.pixels = rgba.data;
    image.width = rgba.cols;
    image.height = rgba.rows;
    return image;
}

}

TEST(SymbolCutterAPITest, DefaultParamsAreValid)
{
    SymbolCutterParams params;
    symbol_cutter_get_default_params(&params);
    EXPECT_EQ(params.alpha_floor, 128);
    EXPECT_EQ(params.crop_padding_min, 20);
    EXPECT_DOUBLE_EQ(params.edge_threshold, 30.0);
    EXPECT_TRUE(params.enable_cleanup);
    EXPECT_EQ(symbol_cutter_validate_params(&params), SYMBOL_CUTTER_SUCCESS);
}

TEST(SymbolCutterAPITest, OutOfRangeParamsAreRejected)
{
    SymbolCutterParams params;
    symbol_cutter_get_default_params(&params);
    params.crop_padding_min = -1;
    EXPECT_EQ(symbol_cutter_validate_params(&params), SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS);

    symbol_cutter_get_default_params(&params);
    params.border_white_ratio = 2.0;
    EXPECT_EQ(symbol_cutter_validate_params(&params), SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS);

    EXPECT_EQ(symbol_cutter_validate_params(nullptr), SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS);
}

TEST(SymbolCutterAPITest, ProcessRgbaIsolatesSymbol)
{
    cv::Mat rgba = squareOnWhite();
    SymbolCutterImage input = wrap(rgba);
    SymbolCutterOutput output;

    ASSERT_EQ(symbol_cutter_process_rgba(&input, nullptr, false, &output, nullptr), SYMBOL_CUTTER_SUCCESS);
    EXPECT_EQ(output.state, SYMBOL_CUTTER_STATE_PROCESSED);
    EXPECT_FALSE(output.skipped);
    EXPECT_FALSE(output.fallback_used);
    EXPECT_EQ(output.image.width, 114);
    EXPECT_EQ(output.image.height, 114);
    EXPECT_EQ(output.bbox_min_x, 71);
    EXPECT_EQ(output.bbox_max_y, 184);
    ASSERT_NE(output.image.pixels, nullptr);
    // Top-left pixel of the crop is cleared canvas
    EXPECT_EQ(output.image.pixels[3], 0);

    symbol_cutter_free_image(&output.image);
    EXPECT_EQ(output.image.pixels, nullptr);
    EXPECT_EQ(output.image.width, 0);
}

TEST(SymbolCutterAPITest, ForcedBlankImageReturnsCopy)
{
    cv::Mat rgba = makeCanvas(32, 32, kWhite);
    SymbolCutterImage input = wrap(rgba);
    SymbolCutterOutput output;

    ASSERT_EQ(symbol_cutter_process_rgba(&input, nullptr, true, &output, nullptr), SYMBOL_CUTTER_SUCCESS);
    EXPECT_EQ(output.state, SYMBOL_CUTTER_STATE_FALLBACK_ORIGINAL);
    EXPECT_TRUE(output.fallback_used);
    ASSERT_EQ(output.image.width, 32);
    ASSERT_EQ(output.image.height, 32);
    EXPECT_EQ(std::memcmp(output.image.pixels, rgba.data, 32 * 32 * 4), 0);
    symbol_cutter_free_image(&output.image);
}

TEST(SymbolCutterAPITest, NullInputReportsError)
{
    errorCalls = 0;
    SymbolCutterOutput output;
    EXPECT_EQ(symbol_cutter_process_rgba(nullptr, nullptr, false, &output, recordError),
              SYMBOL_CUTTER_ERROR_INVALID_INPUT);
    EXPECT_EQ(errorCalls, 1);
    EXPECT_EQ(lastError, SYMBOL_CUTTER_ERROR_INVALID_INPUT);
}

TEST(SymbolCutterAPITest, InvalidParamsReportError)
{
    errorCalls = 0;
    cv::Mat rgba = squareOnWhite();
    SymbolCutterImage input = wrap(rgba);
    SymbolCutterOutput output;
    SymbolCutterParams params;
    symbol_cutter_get_default_params(&params);
    params.alpha_floor = 512;

    EXPECT_EQ(symbol_cutter_process_rgba(&input, &params, false, &output, recordError),
              SYMBOL_CUTTER_ERROR_INVALID_PARAMETERS);
    EXPECT_EQ(errorCalls, 1);
    EXPECT_EQ(output.image.pixels, nullptr);
}

TEST(SymbolCutterAPITest, ProcessFileWritesPng)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "symbolcutter_api_test";
    fs::create_directories(dir);
    std::string inputPath = (dir / "cherry.png").string();
    std::string outputPath = (dir / "cherry_isolated.png").string();
    ASSERT_TRUE(ImageProcessor::saveImage(squareOnWhite(), inputPath));
    ASSERT_TRUE(symbol_cutter_is_valid_image_file(inputPath.c_str()));

    progressSeen.clear();
    SymbolCutterState state = SYMBOL_CUTTER_STATE_SKIPPED;
    ASSERT_EQ(symbol_cutter_process_file(inputPath.c_str(), outputPath.c_str(), nullptr, false, &state,
                                         recordProgress, nullptr),
              SYMBOL_CUTTER_SUCCESS);
    EXPECT_EQ(state, SYMBOL_CUTTER_STATE_PROCESSED);
    ASSERT_FALSE(progressSeen.empty());
    EXPECT_DOUBLE_EQ(progressSeen.back(), 1.0);

    cv::Mat written = ImageProcessor::loadImage(outputPath);
    EXPECT_EQ(written.size(), cv::Size(114, 114));
    EXPECT_EQ(written.at<cv::Vec4b>(0, 0)[3], 0);

    fs::remove_all(dir);
}

TEST(SymbolCutterAPITest, MissingFileIsReported)
{
    errorCalls = 0;
    EXPECT_EQ(symbol_cutter_process_file("/nonexistent/symbol.png", "/tmp/out.png", nullptr, false, nullptr,
                                         nullptr, recordError),
              SYMBOL_CUTTER_ERROR_FILE_NOT_FOUND);
    EXPECT_EQ(errorCalls, 1);
    EXPECT_FALSE(symbol_cutter_is_valid_image_file("/nonexistent/symbol.png"));
    EXPECT_FALSE(symbol_cutter_is_valid_image_file(nullptr));
}

TEST(SymbolCutterAPITest, UtilityStrings)
{
    EXPECT_STREQ(symbol_cutter_get_version(), "1.0.0");
    EXPECT_STREQ(symbol_cutter_get_error_message(SYMBOL_CUTTER_SUCCESS), "Success");
    EXPECT_STRNE(symbol_cutter_get_error_message(SYMBOL_CUTTER_ERROR_WRITE_FAILED), "Unknown error");
}
