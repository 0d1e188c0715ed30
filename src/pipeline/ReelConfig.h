#pragma once

#include "audio/AudioAnalyzer.h"
#include "subtitles/SubtitleAligner.h"
#include "video/ClipSequencer.h"
#include "video/TransitionCompositor.h"
#include "video/TransitionLibrary.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ReelSync {

struct ClipSelectionConfig {
    size_t perKeyword = 2;   // clips taken per keyword before de-duplication
};

struct JobConfig {
    double retentionSeconds = 3600.0;  // finished jobs stay pollable this long
};

/**
 * @brief Every pipeline option with its default, validated once per run
 */
struct ReelConfig {
    AudioAnalysisConfig audio;
    ClipSelectionConfig clips;
    SequencerConfig sequencer;
    TransitionConfig transitions;
    OutputSettings output;
    SubtitleConfig subtitles;
    JobConfig jobs;

    // Unset = derived from the clock at run start
    std::optional<uint64_t> seed;
    std::string outputDirectory = "output";

    // Output and sequencer frame rates must agree; this sets both
    void setFps(int fps);

    /**
     * @brief Check every field
     * @throws ConfigError naming the first invalid field
     */
    void validate() const;

    /**
     * @brief Override fields from REELSYNC_SEED, REELSYNC_FPS, REELSYNC_CRF, REELSYNC_PRESET,
     *        REELSYNC_TRANSITION_DURATION, REELSYNC_OUTPUT_DIR and REELSYNC_MIN_BEAT_SPACING
     * @throws ConfigError if a variable is set but does not parse
     */
    void applyEnvironment();

    // Defaults with the environment applied
    static ReelConfig fromEnvironment();
};

} // namespace ReelSync
