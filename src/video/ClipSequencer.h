#pragma once

#include "Timeline.h"
#include "audio/BeatMap.h"

#include <cstdint>
#include <random>
#include <vector>

namespace ReelSync {

struct SequencerConfig {
    uint64_t seed = 0;     // trim-offset randomness
    int beatDivisor = 1;   // cut on every Nth beat
    double fps = 30.0;     // output frame rate; one frame is the timing tolerance
};

/**
 * @brief Assigns clip segments to beat-delimited time slots
 *
 * Intervals come from the BeatMap boundaries used verbatim (0, beats, track end),
 * so segment durations sum to the track duration without drift. Clips are
 * taken round-robin from the pool.
 */
class ClipSequencer {
public:
    explicit ClipSequencer(const SequencerConfig& config = SequencerConfig());

    /**
     * @brief Build a validated Timeline
     * @throws NotFoundError if the pool is empty
     * @throws TimelineError if the beat map has no duration
     */
    Timeline sequence(const BeatMap& beatMap, const std::vector<VideoClip>& pool) const;

    /**
     * @brief Cut points actually used: 0, beats at least one frame from either end, duration
     */
    std::vector<double> computeBoundaries(const BeatMap& beatMap) const;

    const SequencerConfig& getConfig() const { return m_config; }

private:
    SequencerConfig m_config;

    double pickOffset(std::mt19937_64& rng, double maxOffset,
                      const std::vector<double>& previousOffsets, double frame) const;
};

// Uniform double in [0, 1) from the top 53 bits of one draw
double unitInterval(std::mt19937_64& rng);

} // namespace ReelSync
