#include "Timeline.h"
#include "utils/Errors.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ReelSync {

namespace {
constexpr double kEpsilon = 1e-9;
}

Timeline::Timeline()
    : m_audioDuration(0.0)
    , m_fps(30.0)
{
}

Timeline::Timeline(std::vector<Segment> segments, double audioDuration, double fps)
    : m_segments(std::move(segments))
    , m_audioDuration(audioDuration)
    , m_fps(fps)
{
}

double Timeline::getTotalDuration() const {
    double total = 0.0;
    for (const auto& seg : m_segments) {
        total += seg.duration;
    }
    return total;
}

std::vector<double> Timeline::getBoundaries() const {
    std::vector<double> bounds;
    bounds.reserve(m_segments.size() + 1);
    for (const auto& seg : m_segments) {
        bounds.push_back(seg.timelineStart);
    }
    if (!m_segments.empty()) {
        bounds.push_back(m_segments.back().timelineEnd());
    }
    return bounds;
}

void Timeline::validate() const {
    if (m_segments.empty()) {
        throw TimelineError("Timeline has no segments");
    }
    if (!(m_fps > 0.0)) {
        throw TimelineError("Timeline frame rate must be positive");
    }

    for (size_t i = 0; i < m_segments.size(); ++i) {
        const Segment& seg = m_segments[i];
        std::ostringstream where;
        where << "segment " << i << " (" << seg.clip.id << ")";

        if (!(seg.duration > 0.0)) {
            throw TimelineError(where.str() + " has non-positive duration");
        }
        if (seg.offset < 0.0) {
            throw TimelineError(where.str() + " has negative offset");
        }
        if (seg.looped) {
            if (seg.offset != 0.0) {
                throw TimelineError(where.str() + " is looped but does not start at offset 0");
            }
        } else if (seg.offset + seg.duration > seg.clip.duration + kEpsilon) {
            throw TimelineError(where.str() + " extends past the end of its clip");
        }

        double expectedStart = (i == 0) ? 0.0 : m_segments[i - 1].timelineEnd();
        if (std::abs(seg.timelineStart - expectedStart) > kEpsilon) {
            throw TimelineError(where.str() + " is not contiguous with its predecessor");
        }
    }

    double drift = std::abs(getTotalDuration() - m_audioDuration);
    if (drift > getFrameDuration()) {
        std::ostringstream oss;
        oss << "Timeline duration " << getTotalDuration() << "s differs from audio duration "
            << m_audioDuration << "s by more than one frame";
        throw TimelineError(oss.str());
    }
}

std::string Timeline::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "Timeline: " << m_segments.size() << " segments, total " << getTotalDuration()
        << "s (audio " << m_audioDuration << "s, " << m_fps << " fps)\n";
    for (size_t i = 0; i < m_segments.size(); ++i) {
        const Segment& seg = m_segments[i];
        oss << "  [" << i << "] " << seg.timelineStart << " +" << seg.duration << "s  "
            << seg.clip.id << " @" << seg.offset << (seg.looped ? " (looped)" : "") << "\n";
    }
    return oss.str();
}

} // namespace ReelSync
