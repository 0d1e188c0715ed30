#pragma once

#include <cstddef>
#include <vector>

namespace ReelSync {

/**
 * @brief Tuning for the spectral-flux onset detector
 */
struct OnsetParams {
    int windowSize = 2048;          // FFT window (samples)
    int hopSize = 512;              // hop between frames (samples)
    double smoothSigma = 2.0;       // Gaussian smoothing of the envelope (frames)
    double thresholdFactor = 1.5;   // peak must exceed local mean * factor
    int thresholdWindow = 8;        // half-width of the local mean window (frames)
    double minStrength = 0.1;       // minimum relative spectral increase at a peak
    double minSpacing = 0.25;       // onsets closer than this are dropped (seconds)
};

/**
 * @brief Per-frame onset strength
 *
 * raw holds the positive spectral flux divided by the frame's magnitude sum;
 * envelope is the z-normalized, Gaussian-smoothed flux used for peak picking.
 */
struct OnsetEnvelope {
    std::vector<double> raw;
    std::vector<double> envelope;
    int hopSize = 0;
    int windowSize = 0;
    int sampleRate = 0;

    double frameTime(std::size_t frame) const;
};

OnsetEnvelope computeOnsetEnvelope(const std::vector<float>& samples, int sampleRate,
                                   const OnsetParams& params = OnsetParams());

// Local maxima above the adaptive threshold, in seconds; the first onset of a cluster wins
std::vector<double> pickOnsets(const OnsetEnvelope& env, const OnsetParams& params = OnsetParams());

// Simple spectral-flux based beat detector.
// Usage: call detectBeatsFromWaveform() with mono float samples (range [-1,1])
// and the sample rate. Returns onset times in seconds.
std::vector<double> detectBeatsFromWaveform(const std::vector<float>& samples, int sampleRate,
                                            const OnsetParams& params = OnsetParams());

} // namespace ReelSync
