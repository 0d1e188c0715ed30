#pragma once

#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief Ordered beat timestamps for one audio track
 *
 * Invariants: strictly increasing, every beat inside (0, audioDuration),
 * consecutive beats at least minSpacing apart. Built only through the
 * factory functions, immutable afterwards.
 */
class BeatMap {
public:
    BeatMap();

    /**
     * @brief Build from raw onset times
     *
     * Sorts, drops beats outside (0, audioDuration), removes duplicates and keeps
     * the first beat of any cluster closer than minSpacing.
     */
    static BeatMap fromOnsets(std::vector<double> onsets, double audioDuration, double minSpacing);

    /**
     * @brief Evenly spaced fallback map
     *
     * Beats at k * max(60/bpm, minSpacing) for k >= 1 while inside the track. A track
     * too short for a single step gets one beat at its midpoint.
     */
    static BeatMap uniform(double audioDuration, double bpm, double minSpacing);

    const std::vector<double>& getBeats() const { return m_beats; }
    size_t getNumBeats() const { return m_beats.size(); }
    bool isEmpty() const { return m_beats.empty(); }
    double getBeatAt(size_t index) const;

    double getAudioDuration() const { return m_audioDuration; }
    double getMinSpacing() const { return m_minSpacing; }

    // Median-interval tempo estimate (0 with fewer than two beats)
    double getBPM() const { return m_bpm; }
    double getAverageBeatInterval() const;

    // True when the map was synthesized instead of detected
    bool isFallback() const { return m_fallback; }

    /**
     * @brief Cut points for the sequencer: 0, every divisor-th beat, then the track end
     */
    std::vector<double> getBoundaries(int divisor = 1) const;

    // Re-checks the invariants listed above
    bool isValid() const;

    std::string toString() const;

private:
    std::vector<double> m_beats;
    double m_audioDuration;
    double m_minSpacing;
    double m_bpm;
    bool m_fallback;

    static double estimateBPM(const std::vector<double>& beats);
};

} // namespace ReelSync
