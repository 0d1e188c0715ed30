#pragma once

#include "AudioTrack.h"
#include "BeatMap.h"
#include "SpectralFlux.h"
#include <string>

namespace ReelSync {

/**
 * @brief Beat-analysis options
 */
struct AudioAnalysisConfig {
    double minTrackSeconds = 1.0;     // shorter tracks are rejected
    double minBeatSpacing = 0.5;      // BeatMap spacing floor (seconds)
    double fallbackBpm = 120.0;       // tempo of the uniform fallback map
    bool allowUniformFallback = true; // false: analyze() surfaces AnalysisError
    double silenceThreshold = 1e-4;   // RMS below this counts as silent
    OnsetParams onset;
};

/**
 * @brief Analyzes audio tracks to detect beats and tempo
 *
 * Uses a spectral-flux onset detector over the decoded waveform. When no usable
 * signal is found the analyzer synthesizes a uniform beat map instead of failing.
 */
class AudioAnalyzer {
public:
    AudioAnalyzer();
    explicit AudioAnalyzer(const AudioAnalysisConfig& config);
    ~AudioAnalyzer();

    /**
     * @brief Raw detection without fallback
     * @throws AnalysisError if the track is too short, silent, or yields fewer than 2 beats
     */
    BeatMap detect(const AudioTrack& track) const;

    /**
     * @brief Detect beats, falling back to a uniform map when detection fails
     * @throws AnalysisError only when allowUniformFallback is false
     */
    BeatMap analyze(const AudioTrack& track) const;

    /**
     * @brief Decode then analyze a file
     * @throws InvalidMediaError if the file cannot be decoded
     */
    BeatMap analyzeFile(const std::string& audioFilePath) const;

    void setConfig(const AudioAnalysisConfig& config) { m_config = config; }
    const AudioAnalysisConfig& getConfig() const { return m_config; }

    static double computeRms(const std::vector<float>& samples);

private:
    AudioAnalysisConfig m_config;
};

} // namespace ReelSync
