#include "CommandLine.hpp"
#include <exception>
#include <iostream>

using namespace std;

namespace SymbolCutter {

string defaultOutputPath(const string& inputPath) {
    size_t dotPos = inputPath.find_last_of('.');
    size_t slashPos = inputPath.find_last_of("/\\");
    if (dotPos == string::npos || (slashPos != string::npos && dotPos < slashPos)) {
        return inputPath + "_isolated.png";
    }
    return inputPath.substr(0, dotPos) + "_isolated.png";
}

Arguments parseArguments(int argc, const char* const argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    try {
        for (int i = 1; i < argc; i++) {
            string arg = argv[i];
            if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
                args.inputPaths.push_back(argv[++i]);
            } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
                args.outputPath = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-d" || arg == "--debug") {
                args.debug = true;
            } else if (arg == "-f" || arg == "--force") {
                args.force = true;
            } else if ((arg == "--edge-threshold") && (i + 1 < argc)) {
                args.edgeThreshold = stod(argv[++i]);
            } else if ((arg == "--padding") && (i + 1 < argc)) {
                args.paddingMin = stoi(argv[++i]);
            } else if ((arg == "--border-ratio") && (i + 1 < argc)) {
                args.borderRatio = stod(argv[++i]);
            } else if (arg == "--no-cleanup") {
                args.disableCleanup = true;
            } else if (arg == "--no-sharpen") {
                args.disableSharpen = true;
            } else if ((arg == "--timeout") && (i + 1 < argc)) {
                args.timeoutMs = stoi(argv[++i]);
            } else if ((arg == "--stage") && (i + 1 < argc)) {
                args.stage = stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                return args; // Will trigger usage display
            } else {
                cerr << "[ERROR] Unknown or incomplete option: " << arg << endl;
                return args;
            }
        }
    } catch (const exception& e) {
        cerr << "[ERROR] Invalid numeric option value: " << e.what() << endl;
        return args;
    }

    if (args.inputPaths.empty()) {
        return args;
    }

    if (args.inputPaths.size() > 1 && !args.outputPath.empty()) {
        cerr << "[ERROR] -o can only be used with a single input" << endl;
        return args;
    }

    if (args.outputPath.empty() && args.inputPaths.size() == 1) {
        args.outputPath = defaultOutputPath(args.inputPaths.front());
    }

    args.valid = true;
    return args;
}

ImageProcessor::ProcessingParams buildParams(const Arguments& args) {
    ImageProcessor::ProcessingParams params;
    params.verboseOutput = args.verbose;
    params.enableDebugOutput = args.debug;
    params.enableCleanup = !args.disableCleanup;
    params.enableSharpen = !args.disableSharpen;
    params.timeBudgetMs = args.timeoutMs;
    if (args.edgeThreshold) params.edgeThreshold = *args.edgeThreshold;
    if (args.paddingMin) params.cropPaddingMin = *args.paddingMin;
    if (args.borderRatio) params.borderWhiteRatio = *args.borderRatio;
    return params;
}

} // namespace SymbolCutter
