#include "BeatMap.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ReelSync {

namespace {
// Float slack for spacing comparisons on synthesized grids
constexpr double kSpacingEpsilon = 1e-9;
}

BeatMap::BeatMap()
    : m_audioDuration(0.0)
    , m_minSpacing(0.0)
    , m_bpm(0.0)
    , m_fallback(false)
{
}

BeatMap BeatMap::fromOnsets(std::vector<double> onsets, double audioDuration, double minSpacing) {
    BeatMap map;
    map.m_audioDuration = std::max(0.0, audioDuration);
    map.m_minSpacing = std::max(0.0, minSpacing);

    std::sort(onsets.begin(), onsets.end());
    double last = 0.0;
    bool haveLast = false;
    for (double t : onsets) {
        if (!std::isfinite(t) || t <= 0.0 || t >= map.m_audioDuration) continue;
        if (haveLast && (t - last) < map.m_minSpacing - kSpacingEpsilon) continue;
        if (haveLast && t <= last) continue;
        map.m_beats.push_back(t);
        last = t;
        haveLast = true;
    }

    map.m_bpm = estimateBPM(map.m_beats);
    return map;
}

BeatMap BeatMap::uniform(double audioDuration, double bpm, double minSpacing) {
    BeatMap map;
    map.m_audioDuration = std::max(0.0, audioDuration);
    map.m_minSpacing = std::max(0.0, minSpacing);
    map.m_fallback = true;

    double interval = bpm > 0.0 ? 60.0 / bpm : 0.5;
    interval = std::max(interval, map.m_minSpacing);
    if (interval <= 0.0) interval = 0.5;

    for (int k = 1; ; ++k) {
        double t = k * interval;
        if (t >= map.m_audioDuration) break;
        map.m_beats.push_back(t);
    }
    if (map.m_beats.empty() && map.m_audioDuration > 0.0) {
        map.m_beats.push_back(map.m_audioDuration / 2.0);
    }

    map.m_bpm = 60.0 / interval;
    return map;
}

double BeatMap::getBeatAt(size_t index) const {
    if (index >= m_beats.size()) {
        return 0.0;
    }
    return m_beats[index];
}

double BeatMap::getAverageBeatInterval() const {
    if (m_beats.size() < 2) {
        return 0.0;
    }
    return (m_beats.back() - m_beats.front()) / (m_beats.size() - 1);
}

std::vector<double> BeatMap::getBoundaries(int divisor) const {
    if (divisor < 1) divisor = 1;
    std::vector<double> bounds;
    bounds.reserve(m_beats.size() / divisor + 2);
    bounds.push_back(0.0);
    for (size_t i = divisor - 1; i < m_beats.size(); i += divisor) {
        bounds.push_back(m_beats[i]);
    }
    bounds.push_back(m_audioDuration);
    return bounds;
}

bool BeatMap::isValid() const {
    for (size_t i = 0; i < m_beats.size(); ++i) {
        if (m_beats[i] <= 0.0 || m_beats[i] >= m_audioDuration) return false;
        if (i > 0) {
            if (m_beats[i] <= m_beats[i - 1]) return false;
            if (m_beats[i] - m_beats[i - 1] < m_minSpacing - kSpacingEpsilon) return false;
        }
    }
    return true;
}

double BeatMap::estimateBPM(const std::vector<double>& beats) {
    if (beats.size() < 2) {
        return 0.0;
    }

    std::vector<double> intervals;
    intervals.reserve(beats.size() - 1);
    for (size_t i = 1; i < beats.size(); ++i) {
        intervals.push_back(beats[i] - beats[i - 1]);
    }

    // Median interval (more robust than mean)
    std::sort(intervals.begin(), intervals.end());
    double medianInterval = intervals[intervals.size() / 2];
    return medianInterval > 0.0 ? 60.0 / medianInterval : 0.0;
}

std::string BeatMap::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "BeatMap Information:\n";
    oss << "  Number of beats: " << m_beats.size() << (m_fallback ? " (uniform fallback)" : "") << "\n";
    oss << "  BPM: " << m_bpm << "\n";
    oss << "  Audio duration: " << m_audioDuration << " seconds\n";
    oss << "  Average interval: " << getAverageBeatInterval() << " seconds\n";

    if (!m_beats.empty() && m_beats.size() <= 10) {
        oss << "  Beat timestamps: ";
        for (size_t i = 0; i < m_beats.size(); ++i) {
            oss << m_beats[i];
            if (i < m_beats.size() - 1) {
                oss << ", ";
            }
        }
        oss << "\n";
    } else if (m_beats.size() > 10) {
        oss << "  First 5 beats: ";
        for (size_t i = 0; i < 5; ++i) {
            oss << m_beats[i] << ", ";
        }
        oss << "...\n";
        oss << "  Last 5 beats: ";
        for (size_t i = m_beats.size() - 5; i < m_beats.size(); ++i) {
            oss << m_beats[i];
            if (i < m_beats.size() - 1) {
                oss << ", ";
            }
        }
        oss << "\n";
    }

    return oss.str();
}

} // namespace ReelSync
