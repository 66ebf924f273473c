#include <gtest/gtest.h>

#include "SymbolExtractor.hpp"
#include "SyntheticImages.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace SymbolCutter;
using namespace SymbolCutter::Testing;

namespace {
constexpr int kCropOrigin = 71;
}

TEST(SymbolExtractorTest, IsolatesSquareOnWhite)
{
    SymbolExtractor extractor;
    ExtractionResult result = extractor.extract(squareOnWhite());

    EXPECT_EQ(result.state, PipelineState::Processed);
    EXPECT_FALSE(result.skipped);
    EXPECT_FALSE(result.fallbackUsed);
    EXPECT_TRUE(result.diagnostic.empty());
    EXPECT_EQ(result.bbox, (BoundingBox{71, 71, 184, 184}));
    ASSERT_EQ(result.image.type(), CV_8UC4);
    EXPECT_EQ(result.image.cols, 114);
    EXPECT_EQ(result.image.rows, 114);
}

TEST(SymbolExtractorTest, OutsideOfSymbolIsFullyTransparent)
{
    SymbolExtractor extractor;
    ExtractionResult result = extractor.extract(squareOnWhite());
    ASSERT_EQ(result.state, PipelineState::Processed);

    for (int y = 0; y < result.image.rows; y++) {
        for (int x = 0; x < result.image.cols; x++) {
            int sx = x + kCropOrigin;
            int sy = y + kCropOrigin;
            bool inside = sx >= kSquareOrigin && sx <= kSquareLast && sy >= kSquareOrigin && sy <= kSquareLast;
            const cv::Vec4b& p = result.image.at<cv::Vec4b>(y, x);
            if (inside) {
                ASSERT_GT(p[3], 0) << "at " << sx << "," << sy;
            } else {
                ASSERT_EQ(p[3], 0) << "at " << sx << "," << sy;
            }
        }
    }

    cv::Vec4b center = result.image.at<cv::Vec4b>(128 - kCropOrigin, 128 - kCropOrigin);
    EXPECT_EQ(center, kSymbolRed);
}

TEST(SymbolExtractorTest, InputIsNotModified)
{
    cv::Mat rgba = squareOnWhite();
    cv::Mat original = rgba.clone();
    SymbolExtractor extractor;
    extractor.extract(rgba);
    EXPECT_TRUE(identical(rgba, original));
}

TEST(SymbolExtractorTest, IsolatedOutputIsSkippedOnSecondRun)
{
    SymbolExtractor extractor;
    ExtractionResult first = extractor.extract(squareOnWhite());
    ASSERT_EQ(first.state, PipelineState::Processed);

    ExtractionResult second = extractor.extract(first.image);
    EXPECT_EQ(second.state, PipelineState::Skipped);
    EXPECT_TRUE(second.skipped);
    EXPECT_TRUE(identical(second.image, first.image));
}

TEST(SymbolExtractorTest, NameHintDoesNotReprocessIsolatedOutput)
{
    SymbolExtractor extractor;
    ExtractionResult first = extractor.extract(squareOnWhite());
    ASSERT_EQ(first.state, PipelineState::Processed);

    ProcessingHints named;
    named.sourceName = "cherry_no_background.png";
    ExtractionResult second = extractor.extract(first.image, named);
    EXPECT_EQ(second.state, PipelineState::Skipped);
    EXPECT_TRUE(identical(second.image, first.image));
}

TEST(SymbolExtractorTest, IsolatedOutputIsStableWhenForced)
{
    SymbolExtractor extractor;
    ExtractionResult first = extractor.extract(squareOnWhite());
    ASSERT_EQ(first.state, PipelineState::Processed);

    ProcessingHints forced;
    forced.forceProcessing = true;
    ExtractionResult second = extractor.extract(first.image, forced);
    ASSERT_EQ(second.state, PipelineState::Processed);
    // Tight bounds 25..88 in the first crop, padded by 20
    EXPECT_EQ(second.bbox, (BoundingBox{5, 5, 108, 108}));

    for (int y = 0; y < second.image.rows; y++) {
        for (int x = 0; x < second.image.cols; x++) {
            const cv::Vec4b& again = second.image.at<cv::Vec4b>(y, x);
            const cv::Vec4b& once = first.image.at<cv::Vec4b>(y + second.bbox.minY, x + second.bbox.minX);
            ASSERT_EQ(again[0], once[0]) << "at " << x << "," << y;
            ASSERT_EQ(again[1], once[1]) << "at " << x << "," << y;
            ASSERT_EQ(again[2], once[2]) << "at " << x << "," << y;
            ASSERT_LE(std::abs(again[3] - once[3]), 1) << "at " << x << "," << y;
        }
    }
}

TEST(SymbolExtractorTest, TransparentCanvasIsLeftAlone)
{
    cv::Mat rgba = squareOn(kClear);
    SymbolExtractor extractor;
    ExtractionResult result = extractor.extract(rgba);

    EXPECT_EQ(result.state, PipelineState::Skipped);
    EXPECT_EQ(result.bbox, BoundingBox::fromSize(rgba.size()));
    EXPECT_TRUE(identical(result.image, rgba));
}

TEST(SymbolExtractorTest, MidGrayCanvasIsSkipped)
{
    cv::Mat rgba = squareOn(kMidGray);
    SymbolExtractor extractor;
    ExtractionResult result = extractor.extract(rgba);

    EXPECT_EQ(result.state, PipelineState::Skipped);
    EXPECT_TRUE(result.skipped);
    EXPECT_FALSE(result.fallbackUsed);
    EXPECT_TRUE(identical(result.image, rgba));
}

TEST(SymbolExtractorTest, HintsForceProcessing)
{
    cv::Mat rgba = squareOn(kMidGray);
    SymbolExtractor extractor;

    ProcessingHints forced;
    forced.forceProcessing = true;
    ExtractionResult result = extractor.extract(rgba, forced);
    EXPECT_EQ(result.state, PipelineState::Processed);
    // Mid gray is foreground, so the whole canvas is kept
    EXPECT_EQ(result.bbox, BoundingBox::fromSize(rgba.size()));

    ProcessingHints named;
    named.sourceName = "assets/Cherry_On_WHITE.jpg";
    EXPECT_EQ(extractor.extract(rgba, named).state, PipelineState::Processed);
}

TEST(SymbolExtractorTest, HintMatchingIsCaseInsensitive)
{
    ProcessingHints hints;
    EXPECT_FALSE(SymbolExtractor::hintRequestsProcessing(hints));

    hints.sourceName = "https://cdn.example.com/symbols/bar_Background.png";
    EXPECT_TRUE(SymbolExtractor::hintRequestsProcessing(hints));

    hints.sourceName = "symbols/seven.png";
    EXPECT_FALSE(SymbolExtractor::hintRequestsProcessing(hints));

    hints.forceProcessing = true;
    EXPECT_TRUE(SymbolExtractor::hintRequestsProcessing(hints));
}

TEST(SymbolExtractorTest, BlankImageFallsBackToOriginal)
{
    cv::Mat rgba = makeCanvas(64, 64, kWhite);
    SymbolExtractor extractor;
    ExtractionResult result = extractor.extract(rgba);

    EXPECT_EQ(result.state, PipelineState::FallbackOriginal);
    EXPECT_TRUE(result.fallbackUsed);
    EXPECT_FALSE(result.skipped);
    EXPECT_FALSE(result.diagnostic.empty());
    EXPECT_TRUE(identical(result.image, rgba));
    EXPECT_NE(result.image.data, rgba.data);
}

TEST(SymbolExtractorTest, UndecodedInputFallsBack)
{
    SymbolExtractor extractor;
    ExtractionResult empty = extractor.extract(cv::Mat());
    EXPECT_EQ(empty.state, PipelineState::FallbackOriginal);

    cv::Mat bgr(16, 16, CV_8UC3, cv::Scalar(255, 255, 255));
    ExtractionResult wrongType = extractor.extract(bgr);
    EXPECT_EQ(wrongType.state, PipelineState::FallbackOriginal);
    EXPECT_TRUE(identical(wrongType.image, bgr));
}

TEST(SymbolExtractorTest, TimeBudgetOverrunFallsBack)
{
    ImageProcessor::ProcessingParams params;
    params.timeBudgetMs = 1;
    cv::Mat rgba = makeCanvas(2048, 2048, kWhite);
    fillRect(rgba, 900, 900, 200, 200, kSymbolRed);

    SymbolExtractor extractor(params);
    ExtractionResult result = extractor.extract(rgba);

    EXPECT_EQ(result.state, PipelineState::FallbackOriginal);
    EXPECT_NE(result.diagnostic.find("Time budget exceeded"), std::string::npos);
    EXPECT_TRUE(identical(result.image, rgba));
}

TEST(SymbolExtractorTest, StageHookCanAbortRun)
{
    ImageProcessor::ProcessingParams params;
    auto hook = [](ImageProcessor::Stage stage) {
        if (stage == ImageProcessor::STAGE_COMPOSITED) {
            throw TimeBudgetExceeded(ImageProcessor::stageName(stage));
        }
    };
    EXPECT_THROW(ImageProcessor::runPipeline(squareOnWhite(), params, ImageProcessor::STAGE_CLEANED, hook),
                 TimeBudgetExceeded);
}

TEST(SymbolExtractorTest, InvalidConfigIsRejected)
{
    ImageProcessor::ProcessingParams params;
    params.cropPaddingMin = -1;
    EXPECT_THROW(SymbolExtractor extractor(params), InvalidConfig);

    params = ImageProcessor::ProcessingParams();
    params.borderWhiteRatio = 1.5;
    EXPECT_THROW(SymbolExtractor extractor(params), InvalidConfig);

    params = ImageProcessor::ProcessingParams();
    params.softenLuminance = params.falloffLuminance;
    EXPECT_THROW(SymbolExtractor extractor(params), InvalidConfig);
}

TEST(SymbolExtractorTest, OverridesAreValidatedAndApplied)
{
    SymbolExtractor extractor;

    ImageProcessor::ProcessingParams bad;
    bad.alphaFloor = 300;
    EXPECT_THROW(extractor.extract(squareOnWhite(), ProcessingHints(), bad), InvalidConfig);

    ImageProcessor::ProcessingParams wide;
    wide.cropPaddingMin = 40;
    ExtractionResult result = extractor.extract(squareOnWhite(), ProcessingHints(), wide);
    EXPECT_EQ(result.bbox, (BoundingBox{56, 56, 199, 199}));
}

TEST(SymbolExtractorTest, CleanupCanBeDisabled)
{
    ImageProcessor::ProcessingParams params;
    params.enableCleanup = false;
    SymbolExtractor extractor(params);
    ExtractionResult result = extractor.extract(squareOnWhite());

    ASSERT_EQ(result.state, PipelineState::Processed);
    // Without the denoise pass the square edge stays fully opaque
    EXPECT_EQ(result.image.at<cv::Vec4b>(57, kSquareOrigin - kCropOrigin)[3], 255);
}

TEST(StageRunnerTest, ReturnsIntermediateStages)
{
    ImageProcessor::ProcessingParams params;
    cv::Mat rgba = squareOnWhite();

    cv::Mat background = ImageProcessor::processImageToStage(rgba, params, ImageProcessor::STAGE_BACKGROUND_MASK);
    EXPECT_EQ(background.type(), CV_8UC1);
    EXPECT_EQ(background.size(), rgba.size());

    cv::Mat foreground = ImageProcessor::processImageToStage(rgba, params, ImageProcessor::STAGE_FOREGROUND_MASK);
    EXPECT_EQ(cv::countNonZero(foreground), kSquareSize * kSquareSize);

    cv::Mat cropped = ImageProcessor::processImageToStage(rgba, params, ImageProcessor::STAGE_CROPPED);
    EXPECT_EQ(cropped.size(), cv::Size(114, 114));
    EXPECT_EQ(cropped.at<cv::Vec4b>(0, 0), kWhite);
}

TEST(StageRunnerTest, RejectsUnknownStage)
{
    ImageProcessor::ProcessingParams params;
    EXPECT_THROW(ImageProcessor::processImageToStage(squareOnWhite(), params, 0), std::invalid_argument);
    EXPECT_THROW(ImageProcessor::processImageToStage(squareOnWhite(), params, 7), std::invalid_argument);
    EXPECT_STREQ(ImageProcessor::stageName(7), "unknown");
}

TEST(StageRunnerTest, DebugOutputWritesNumberedImages)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "symbolcutter_debug_test";
    fs::remove_all(dir);

    ImageProcessor::ProcessingParams params;
    params.enableDebugOutput = true;
    params.debugOutputPath = dir.string();

    SymbolExtractor extractor(params);
    ASSERT_EQ(extractor.extract(squareOnWhite()).state, PipelineState::Processed);

    EXPECT_TRUE(fs::exists(dir / "01_background_mask.png"));
    EXPECT_TRUE(fs::exists(dir / "02_edges.png"));
    EXPECT_TRUE(fs::exists(dir / "03_foreground_mask.png"));
    EXPECT_TRUE(fs::exists(dir / "04_cropped.png"));
    EXPECT_TRUE(fs::exists(dir / "05_composited.png"));
    EXPECT_TRUE(fs::exists(dir / "06_cleaned.png"));
    EXPECT_TRUE(extractor.params().debugImageStack.empty());

    fs::remove_all(dir);
}
