#pragma once

#include "ClipLibrary.h"

#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief Trimmed portion of one clip filling one beat interval
 *
 * offset + duration <= clip.duration unless looped; a looped segment starts at
 * offset 0 and repeats the clip to fill an interval longer than the clip.
 */
struct Segment {
    VideoClip clip;
    double offset = 0.0;
    double duration = 0.0;
    double timelineStart = 0.0;
    bool looped = false;

    double timelineEnd() const { return timelineStart + duration; }
};

/**
 * @brief Ordered, contiguous segments whose total matches the audio duration
 */
class Timeline {
public:
    Timeline();
    Timeline(std::vector<Segment> segments, double audioDuration, double fps);

    const std::vector<Segment>& getSegments() const { return m_segments; }
    size_t size() const { return m_segments.size(); }
    bool isEmpty() const { return m_segments.empty(); }

    double getAudioDuration() const { return m_audioDuration; }
    double getFps() const { return m_fps; }
    double getFrameDuration() const { return m_fps > 0.0 ? 1.0 / m_fps : 0.0; }

    // Sum of segment durations
    double getTotalDuration() const;

    // size()+1 cut points: each segment start, then the last segment's end
    std::vector<double> getBoundaries() const;

    /**
     * @brief Check segment invariants, contiguity and total duration
     * @throws TimelineError naming the first violation
     */
    void validate() const;

    std::string toString() const;

private:
    std::vector<Segment> m_segments;
    double m_audioDuration;
    double m_fps;
};

} // namespace ReelSync
