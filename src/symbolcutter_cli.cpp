#include <SymbolCutterAPI.h>
#include "BatchProcessor.hpp"
#include "CommandLine.hpp"
#include "ImageProcessor.hpp"
#include "SymbolExtractor.hpp"
#include <opencv2/imgproc.hpp>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace SymbolCutter;

void printUsage(const char* progName) {
    cout << "SymbolCutter CLI - Isolate slot symbol art from its background\n"
         << "Using libsymbolcutter v" << symbol_cutter_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-i <input_image> ...] [-o <output_png>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path (repeat for batch processing)\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output  Output PNG path for a single input (default: <input>_isolated.png)\n"
         << "  -f, --force   Process even if the border is not a flat light background\n"
         << "  --edge-threshold <v>  Sobel gradient threshold (default: 30)\n"
         << "  --padding <px>        Minimum crop padding in pixels (default: 20)\n"
         << "  --border-ratio <r>    White border fraction that triggers processing (default: 0.7)\n"
         << "  --no-cleanup          Skip the denoise/halo cleanup passes\n"
         << "  --no-sharpen          Skip the final sharpen pass\n"
         << "  --timeout <ms>        Per-image time budget, falls back to the original on overrun\n"
         << "  --stage <1-6>         Write an intermediate stage instead of the final cutout:\n"
         << "                        1=background mask 2=edges 3=foreground mask 4=crop 5=composite 6=cleaned\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i cherry.png\n"
         << "  " << progName << " -i cherry.png -o cherry_cut.png\n"
         << "  " << progName << " -i wild.png -i scatter.png -i seven.png  # Batch, one worker per core\n"
         << "  " << progName << " -i photo.jpg -f --edge-threshold 45\n"
         << "  " << progName << " -i cherry.png --stage 3 -o mask.png\n"
         << "  " << progName << " -i cherry.png -d  # Saves debug images to ./debug/\n"
         << endl;
}

bool writeStage(const string& inputPath, const string& outputPath,
                const ImageProcessor::ProcessingParams& params, int stage) {
    cv::Mat rgba = ImageProcessor::loadImage(inputPath);
    cv::Mat image = ImageProcessor::processImageToStage(rgba, params, stage);
    if (image.type() == CV_8UC1) {
        cv::Mat expanded;
        cv::cvtColor(image, expanded, cv::COLOR_GRAY2RGBA);
        image = expanded;
    }
    return ImageProcessor::saveImage(image, outputPath);
}

void reportResult(const string& inputPath, const ExtractionResult& result) {
    switch (result.state) {
        case PipelineState::Processed:
            cout << "[INFO] " << inputPath << ": isolated to " << result.image.cols << "x" << result.image.rows
                 << " (crop " << result.bbox.minX << "," << result.bbox.minY << " - "
                 << result.bbox.maxX << "," << result.bbox.maxY << ")" << endl;
            break;
        case PipelineState::Skipped:
            cout << "[INFO] " << inputPath << ": no flat light background, left unchanged" << endl;
            break;
        case PipelineState::FallbackOriginal:
            cerr << "[WARN] " << inputPath << ": kept original image (" << result.diagnostic << ")" << endl;
            break;
    }
}

int runSingle(const Arguments& args, const ImageProcessor::ProcessingParams& params) {
    const string& inputPath = args.inputPaths.front();
    SymbolExtractor extractor(params);

    cv::Mat rgba = ImageProcessor::loadImage(inputPath);
    ProcessingHints hints;
    hints.forceProcessing = args.force;
    hints.sourceName = inputPath;

    ExtractionResult result = extractor.extract(rgba, hints);
    reportResult(inputPath, result);

    if (!ImageProcessor::saveImage(result.image, args.outputPath)) {
        cerr << "[ERROR] Failed to write " << args.outputPath << endl;
        return 1;
    }
    cout << "[INFO] Output saved to: " << args.outputPath << endl;
    return 0;
}

int runBatch(const Arguments& args, const ImageProcessor::ProcessingParams& params) {
    vector<BatchProcessor::BatchItem> items;
    vector<string> loadedPaths;
    for (const auto& inputPath : args.inputPaths) {
        try {
            BatchProcessor::BatchItem item;
            item.image = ImageProcessor::loadImage(inputPath);
            item.hints.forceProcessing = args.force;
            item.hints.sourceName = inputPath;
            items.push_back(move(item));
            loadedPaths.push_back(inputPath);
        } catch (const exception& e) {
            cerr << "[ERROR] " << e.what() << endl;
        }
    }

    BatchProcessor processor(params);
    if (args.verbose) {
        cout << "[PROGRESS] Processing " << items.size() << " images on " << processor.workerCount()
             << " workers" << endl;
    }

    BatchProcessor::Generation generation = processor.submit(move(items));
    auto results = processor.wait(generation);
    if (!results) {
        cerr << "[ERROR] Batch was cancelled" << endl;
        return 1;
    }

    int failures = static_cast<int>(args.inputPaths.size() - loadedPaths.size());
    for (size_t i = 0; i < results->size(); i++) {
        const string& inputPath = loadedPaths[i];
        reportResult(inputPath, (*results)[i]);

        string outputPath = defaultOutputPath(inputPath);
        if (ImageProcessor::saveImage((*results)[i].image, outputPath)) {
            cout << "[INFO] Output saved to: " << outputPath << endl;
        } else {
            cerr << "[ERROR] Failed to write " << outputPath << endl;
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    Arguments args = parseArguments(argc, argv);

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] SymbolCutter CLI v" << symbol_cutter_get_version() << endl;
    }

    ImageProcessor::ProcessingParams params = buildParams(args);
    try {
        ImageProcessor::validateParams(params);
    } catch (const InvalidConfig& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    }

    for (const auto& inputPath : args.inputPaths) {
        if (!symbol_cutter_is_valid_image_file(inputPath.c_str())) {
            cerr << "[ERROR] Input file is not a valid image or does not exist: " << inputPath << endl;
            return 1;
        }
    }

    try {
        if (args.stage != 0) {
            if (args.inputPaths.size() != 1) {
                cerr << "[ERROR] --stage requires exactly one input" << endl;
                return 1;
            }
            if (!writeStage(args.inputPaths.front(), args.outputPath, params, args.stage)) {
                cerr << "[ERROR] Failed to write " << args.outputPath << endl;
                return 1;
            }
            cout << "[INFO] Stage " << args.stage << " (" << ImageProcessor::stageName(args.stage)
                 << ") saved to: " << args.outputPath << endl;
            return 0;
        }

        int status = args.inputPaths.size() == 1 ? runSingle(args, params) : runBatch(args, params);
        if (status == 0) {
            cout << "[SUCCESS] Symbol isolation completed successfully!" << endl;
        }
        return status;

    } catch (const InvalidConfig& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    } catch (const invalid_argument& e) {
        cerr << "[ERROR] Invalid argument: " << e.what() << endl;
        return 1;
    } catch (const runtime_error& e) {
        cerr << "[ERROR] Processing failed: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "[ERROR] Unexpected error: " << e.what() << endl;
        return 1;
    }
}
