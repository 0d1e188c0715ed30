#include "ClipSequencer.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <cmath>
#include <map>

namespace ReelSync {

double unitInterval(std::mt19937_64& rng) {
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

ClipSequencer::ClipSequencer(const SequencerConfig& config)
    : m_config(config)
{
    if (m_config.beatDivisor < 1) m_config.beatDivisor = 1;
    if (!(m_config.fps > 0.0)) m_config.fps = 30.0;
}

std::vector<double> ClipSequencer::computeBoundaries(const BeatMap& beatMap) const {
    const double duration = beatMap.getAudioDuration();
    const double frame = 1.0 / m_config.fps;
    std::vector<double> raw = beatMap.getBoundaries(m_config.beatDivisor);

    std::vector<double> bounds;
    bounds.reserve(raw.size());
    bounds.push_back(0.0);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        double t = raw[i];
        if (t < frame || duration - t < frame) continue;
        if (t - bounds.back() <= 0.0) continue;
        bounds.push_back(t);
    }
    bounds.push_back(duration);
    return bounds;
}

double ClipSequencer::pickOffset(std::mt19937_64& rng, double maxOffset,
                                 const std::vector<double>& previousOffsets, double frame) const {
    auto distinct = [&](double candidate) {
        for (double prev : previousOffsets) {
            if (std::abs(candidate - prev) < frame) return false;
        }
        return true;
    };

    double offset = unitInterval(rng) * maxOffset;
    if (previousOffsets.empty() || maxOffset < frame) {
        return offset;
    }

    const int maxDraws = 8;
    for (int attempt = 0; attempt < maxDraws && !distinct(offset); ++attempt) {
        offset = unitInterval(rng) * maxOffset;
    }
    if (!distinct(offset)) {
        // Walk the golden-ratio sequence; it spreads points evenly over [0, maxOffset]
        const double phi = 0.6180339887498949;
        double base = previousOffsets.back() / maxOffset;
        for (size_t k = 1; k <= previousOffsets.size() + 16; ++k) {
            double candidate = std::fmod(base + k * phi, 1.0) * maxOffset;
            if (distinct(candidate)) {
                return candidate;
            }
        }
        logDebug("No distinct trim offset available, reusing a nearby offset");
    }
    return offset;
}

Timeline ClipSequencer::sequence(const BeatMap& beatMap, const std::vector<VideoClip>& pool) const {
    TRACE_FUNC();
    if (pool.empty()) {
        throw NotFoundError("Clip pool is empty; nothing to sequence");
    }
    const double duration = beatMap.getAudioDuration();
    if (!(duration > 0.0)) {
        throw TimelineError("Beat map has no duration");
    }

    const double frame = 1.0 / m_config.fps;
    const std::vector<double> bounds = computeBoundaries(beatMap);

    std::mt19937_64 rng(m_config.seed);
    std::map<std::string, std::vector<double>> usedOffsets;
    std::vector<Segment> segments;
    segments.reserve(bounds.size() - 1);

    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
        const VideoClip& clip = pool[i % pool.size()];
        Segment seg;
        seg.clip = clip;
        seg.timelineStart = bounds[i];
        seg.duration = bounds[i + 1] - bounds[i];

        if (clip.duration >= seg.duration) {
            double maxOffset = clip.duration - seg.duration;
            auto& previous = usedOffsets[clip.id];
            seg.offset = pickOffset(rng, maxOffset, previous, frame);
            previous.push_back(seg.offset);
        } else {
            seg.offset = 0.0;
            seg.looped = true;
        }
        segments.push_back(seg);
    }

    Timeline timeline(std::move(segments), duration, m_config.fps);
    timeline.validate();

    logInfo("Sequenced " + std::to_string(timeline.size()) + " segments from " +
            std::to_string(pool.size()) + " clips");
    logDebug(timeline.toString());
    return timeline;
}

} // namespace ReelSync
