#include "ReelConfig.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <cmath>
#include <cstdlib>

namespace ReelSync {

namespace {

const char* getEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

double parseDouble(const char* name, const char* value) {
    char* end = nullptr;
    double result = std::strtod(value, &end);
    if (end == value || *end != '\0' || !std::isfinite(result)) {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
    return result;
}

long long parseInteger(const char* name, const char* value) {
    char* end = nullptr;
    long long result = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    return result;
}

uint64_t parseSeed(const char* name, const char* value) {
    char* end = nullptr;
    unsigned long long result = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0' || value[0] == '-') {
        throw ConfigError(std::string(name) + " is not an unsigned integer: " + value);
    }
    return static_cast<uint64_t>(result);
}

void require(bool condition, const std::string& field, const std::string& reason) {
    if (!condition) {
        throw ConfigError("Invalid configuration: " + field + " " + reason);
    }
}

} // namespace

void ReelConfig::setFps(int fps) {
    output.fps = fps;
    sequencer.fps = static_cast<double>(fps);
}

void ReelConfig::validate() const {
    require(audio.minTrackSeconds > 0.0, "audio.minTrackSeconds", "must be positive");
    require(audio.minBeatSpacing > 0.0, "audio.minBeatSpacing", "must be positive");
    require(audio.fallbackBpm > 0.0, "audio.fallbackBpm", "must be positive");
    require(audio.silenceThreshold >= 0.0, "audio.silenceThreshold", "must not be negative");
    require(audio.onset.windowSize >= 16, "audio.onset.windowSize", "must be at least 16");
    require(audio.onset.hopSize > 0 && audio.onset.hopSize <= audio.onset.windowSize,
            "audio.onset.hopSize", "must be in (0, windowSize]");
    require(audio.onset.smoothSigma >= 0.0, "audio.onset.smoothSigma", "must not be negative");
    require(audio.onset.thresholdFactor > 0.0, "audio.onset.thresholdFactor", "must be positive");
    require(audio.onset.thresholdWindow > 0, "audio.onset.thresholdWindow", "must be positive");

    require(clips.perKeyword > 0, "clips.perKeyword", "must be positive");

    require(sequencer.beatDivisor >= 1, "sequencer.beatDivisor", "must be at least 1");
    require(sequencer.fps > 0.0, "sequencer.fps", "must be positive");

    require(transitions.duration >= 0.0, "transitions.duration", "must not be negative");
    require(transitions.cutProbability >= 0.0 && transitions.cutProbability <= 1.0,
            "transitions.cutProbability", "must be in [0, 1]");
    require(transitions.maxInputsPerPass >= 2, "transitions.maxInputsPerPass", "must be at least 2");
    for (const auto& name : transitions.styles) {
        require(findTransition(name) != nullptr, "transitions.styles", "has unknown style '" + name + "'");
    }

    require(output.width > 0 && output.width % 2 == 0, "output.width", "must be a positive even number");
    require(output.height > 0 && output.height % 2 == 0, "output.height", "must be a positive even number");
    require(output.fps > 0 && output.fps <= 120, "output.fps", "must be in [1, 120]");
    require(std::fabs(sequencer.fps - output.fps) < 1e-9, "sequencer.fps", "must equal output.fps");
    // Shorter intervals cannot be rendered as whole frames
    require(audio.minBeatSpacing >= 1.0 / output.fps, "audio.minBeatSpacing", "must be at least one output frame");
    require(output.crf >= 0 && output.crf <= 51, "output.crf", "must be in [0, 51]");
    require(!output.preset.empty(), "output.preset", "must not be empty");
    require(!output.videoCodec.empty(), "output.videoCodec", "must not be empty");
    require(!output.audioCodec.empty(), "output.audioCodec", "must not be empty");

    require(subtitles.maxWordsPerCue > 0, "subtitles.maxWordsPerCue", "must be positive");
    require(subtitles.targetWordsPerCue > 0 && subtitles.targetWordsPerCue <= subtitles.maxWordsPerCue,
            "subtitles.targetWordsPerCue", "must be in [1, maxWordsPerCue]");
    require(subtitles.minGap >= 0.0, "subtitles.minGap", "must not be negative");
    require(subtitles.minCueDuration >= 0.0, "subtitles.minCueDuration", "must not be negative");
    require(subtitles.style.fontSize > 0, "subtitles.style.fontSize", "must be positive");
    require(!subtitles.style.fontName.empty(), "subtitles.style.fontName", "must not be empty");
    require(subtitles.style.alignment >= 1 && subtitles.style.alignment <= 9,
            "subtitles.style.alignment", "must be in [1, 9]");

    require(jobs.retentionSeconds >= 0.0, "jobs.retentionSeconds", "must not be negative");
    require(!outputDirectory.empty(), "outputDirectory", "must not be empty");
}

void ReelConfig::applyEnvironment() {
    if (const char* v = getEnv("REELSYNC_SEED")) {
        seed = parseSeed("REELSYNC_SEED", v);
    }
    if (const char* v = getEnv("REELSYNC_FPS")) {
        long long fps = parseInteger("REELSYNC_FPS", v);
        if (fps <= 0 || fps > 120) throw ConfigError(std::string("REELSYNC_FPS out of range: ") + v);
        setFps(static_cast<int>(fps));
    }
    if (const char* v = getEnv("REELSYNC_CRF")) {
        output.crf = static_cast<int>(parseInteger("REELSYNC_CRF", v));
    }
    if (const char* v = getEnv("REELSYNC_PRESET")) {
        output.preset = v;
    }
    if (const char* v = getEnv("REELSYNC_TRANSITION_DURATION")) {
        transitions.duration = parseDouble("REELSYNC_TRANSITION_DURATION", v);
    }
    if (const char* v = getEnv("REELSYNC_OUTPUT_DIR")) {
        outputDirectory = v;
    }
    if (const char* v = getEnv("REELSYNC_MIN_BEAT_SPACING")) {
        audio.minBeatSpacing = parseDouble("REELSYNC_MIN_BEAT_SPACING", v);
    }
    logDebug("Configuration environment overrides applied");
}

ReelConfig ReelConfig::fromEnvironment() {
    ReelConfig config;
    config.applyEnvironment();
    return config;
}

} // namespace ReelSync
