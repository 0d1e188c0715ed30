#include "audio/AudioAnalyzer.h"
#include "backend/Telemetry.h"
#include "pipeline/JobRegistry.h"
#include "pipeline/ReelConfig.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace ReelSync;

void printUsage(const char* programName) {
    std::cout << "ReelSync - Beat-synced vertical reel assembler\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  analyze    Detect beats in an audio file and print the beat map\n";
    std::cout << "  assemble   Build a captioned reel from narration and a clip folder\n\n";
    std::cout << "Options (assemble):\n";
    std::cout << "  -t, --transcript <file.srt>  Transcript to burn in as captions\n";
    std::cout << "  -k, --keywords <a,b,...>     Keywords to pick clips for (default: whole pool)\n";
    std::cout << "  -o, --output <dir>           Output directory (default: output)\n";
    std::cout << "      --seed <n>               Seed for trim offsets and transitions\n";
    std::cout << "      --fps <n>                Output frame rate (default: 30)\n";
    std::cout << "  -h, --help                   Show this help message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  REELSYNC_SEED, REELSYNC_FPS, REELSYNC_CRF, REELSYNC_PRESET,\n";
    std::cout << "  REELSYNC_TRANSITION_DURATION, REELSYNC_OUTPUT_DIR, REELSYNC_MIN_BEAT_SPACING,\n";
    std::cout << "  REELSYNC_FFMPEG_PATH, REELSYNC_DEBUG\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " analyze narration.wav\n";
    std::cout << "  " << programName << " assemble narration.wav clips -t transcript.srt -o out\n";
    std::cout << "  " << programName << " assemble narration.wav clips -k \"city,ocean waves\" --seed 7\n";
}

static std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

static int runAnalyze(int argc, char* argv[], const ReelConfig& config) {
    if (argc < 3) {
        std::cerr << "Error: Missing audio file path\n\n";
        printUsage(argv[0]);
        return 1;
    }
    std::string audioFile = argv[2];

    std::cout << "========================================\n";
    std::cout << "ReelSync Audio Analyzer\n";
    std::cout << "========================================\n\n";
    std::cout << "Analyzing: " << audioFile << "\n\n";

    AudioAnalyzer analyzer(config.audio);
    BeatMap beatMap = analyzer.analyzeFile(audioFile);

    std::cout << beatMap.toString() << "\n";
    if (beatMap.isFallback()) {
        std::cout << "(no usable onsets; uniform beat map at the fallback tempo)\n";
    }

    std::cout << std::fixed << std::setprecision(3);
    size_t limit = std::min(static_cast<size_t>(20), beatMap.getNumBeats());
    for (size_t i = 0; i < limit; ++i) {
        double timestamp = beatMap.getBeatAt(i);
        int minutes = static_cast<int>(timestamp) / 60;
        double seconds = timestamp - (minutes * 60);
        std::cout << "  Beat " << std::setw(3) << (i + 1) << ": "
                  << std::setw(2) << minutes << ":" << std::setw(6) << seconds
                  << " (" << timestamp << "s)\n";
    }
    if (beatMap.getNumBeats() > limit) {
        std::cout << "  ... and " << (beatMap.getNumBeats() - limit) << " more beats\n";
    }
    return 0;
}

static int runAssemble(int argc, char* argv[], ReelConfig config) {
    if (argc < 4) {
        std::cerr << "Error: assemble needs <audio> <clips_dir>\n\n";
        printUsage(argv[0]);
        return 1;
    }

    PipelineRequest request;
    request.narrationPath = argv[2];
    request.clipDirectory = argv[3];

    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(std::string(name) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-t" || arg == "--transcript") {
            request.transcriptSrtPath = needValue("--transcript");
        } else if (arg == "-k" || arg == "--keywords") {
            request.keywords = splitList(needValue("--keywords"));
        } else if (arg == "-o" || arg == "--output") {
            request.outputDirectory = needValue("--output");
        } else if (arg == "--seed") {
            std::string value = needValue("--seed");
            try {
                request.seed = std::stoull(value);
            } catch (const std::exception&) {
                throw ConfigError("Invalid seed: " + value);
            }
        } else if (arg == "--fps") {
            std::string value = needValue("--fps");
            try {
                config.setFps(std::stoi(value));
            } catch (const std::logic_error&) {
                throw ConfigError("Invalid fps: " + value);
            }
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }
    request.jobId = "cli";

    std::cout << "========================================\n";
    std::cout << "ReelSync Assembler\n";
    std::cout << "========================================\n\n";
    std::cout << "Narration: " << request.narrationPath << "\n";
    std::cout << "Clips:     " << request.clipDirectory << "\n\n";

    JobRegistry registry(config);
    registry.submit(request, [](const ProgressEvent& event) {
        std::cout << "[" << std::setw(3) << static_cast<int>(event.percent) << "%] "
                  << event.stage << " - " << event.message << std::endl;
    });

    std::optional<PipelineResult> result = registry.wait(request.jobId);
    if (!result || !result->success) {
        std::cerr << "\nError: pipeline failed";
        if (result) {
            std::cerr << " in " << result->failedStage << " (" << errorKindName(result->errorKind)
                      << "): " << result->error;
            if (!result->workDirectory.empty()) {
                std::cerr << "\nIntermediate files kept in " << result->workDirectory;
            }
        }
        std::cerr << "\n";
        return 1;
    }

    std::cout << "\n========================================\n";
    std::cout << "Reel complete!\n";
    std::cout << "========================================\n";
    std::cout << "Video:     " << result->reel.videoPath << "\n";
    std::cout << "Captions:  " << (result->reel.captionPath.empty() ? "(none)" : result->reel.captionPath);
    if (!result->reel.captionsBurned) {
        std::cout << " [not burned: " << result->reel.captionNote << "]";
    }
    std::cout << "\nNarration: " << result->reel.narrationPath << "\n";
    std::cout << "Segments:  " << result->segmentCount << ", transitions: " << result->transitionCount
              << ", seed: " << result->seed << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    tracing::ScopedInit tracerInit;
    if (!telemetry::initialize("reelsync")) {
        logDebug("Span export disabled; spans go to the trace log only");
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    int exitCode = 1;
    try {
        ReelConfig config = ReelConfig::fromEnvironment();
        if (command == "analyze") {
            exitCode = runAnalyze(argc, argv, config);
        } else if (command == "assemble") {
            exitCode = runAssemble(argc, argv, config);
        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n\n";
            printUsage(argv[0]);
        }
    } catch (const ReelError& e) {
        std::cerr << "Error (" << errorKindName(e.getKind()) << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    telemetry::shutdown();
    return exitCode;
}
