#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ReelSync {

class Timeline;

/**
 * @brief Closed set of boundary styles; every non-cut style is an ffmpeg xfade transition
 */
enum class TransitionStyle {
    Cut,
    Fade,
    FadeBlack,
    FadeWhite,
    Dissolve,
    WipeLeft,
    WipeRight,
    WipeUp,
    WipeDown,
    SlideLeft,
    SlideRight,
    SlideUp,
    SlideDown,
    CircleCrop,
    CircleOpen,
    Radial,
    ZoomIn,
    Pixelize,
    SmoothLeft,
    SmoothRight
};

struct TransitionDescriptor {
    TransitionStyle style;
    std::string name;      // e.g. "fade", "wipeleft"
    std::string category;  // cut, blend, wipe, slide, shape, distortion
    std::string xfadeName; // value for xfade=transition=...; empty for cut
};

// Every style, cut first
const std::vector<TransitionDescriptor>& allTransitions();

// Lookup a transition by name. Returns nullptr if not found.
const TransitionDescriptor* findTransition(const std::string& name);
const TransitionDescriptor& describe(TransitionStyle style);

struct TransitionSpec {
    TransitionStyle style = TransitionStyle::Cut;
    double duration = 0.0; // seconds, whole frames

    bool isCut() const { return style == TransitionStyle::Cut || duration <= 0.0; }
};

/**
 * @brief One TransitionSpec per timeline boundary 0..N
 *
 * Boundary 0 is the start of the first segment and boundary N the end of the last;
 * both are always cuts. Boundary k (0 < k < N) joins segment k-1 and segment k.
 */
class TransitionPlan {
public:
    TransitionPlan() = default;
    explicit TransitionPlan(std::vector<TransitionSpec> specs);

    // All-cut plan for a timeline with segmentCount segments
    static TransitionPlan allCuts(size_t segmentCount);

    size_t getBoundaryCount() const { return m_specs.size(); }
    const TransitionSpec& at(size_t boundary) const { return m_specs.at(boundary); }
    const std::vector<TransitionSpec>& getSpecs() const { return m_specs; }

    // Number of non-cut boundaries
    size_t getTransitionCount() const;
    bool isAllCuts() const { return getTransitionCount() == 0; }

    // Endpoints are cuts and there is one spec per boundary of a segmentCount timeline
    bool isValid(size_t segmentCount) const;

    std::string toString() const;

private:
    std::vector<TransitionSpec> m_specs;
};

struct TransitionConfig {
    bool enabled = true;
    double duration = 0.2;             // requested overlap (seconds)
    double cutProbability = 0.0;       // chance an internal boundary stays a plain cut
    std::vector<std::string> styles;   // enabled style names; empty = every non-cut style
    size_t maxInputsPerPass = 48;      // stitch long chains in batches
};

/**
 * @brief Chooses a transition per boundary from a seeded generator
 *
 * Durations are clamped to half of the shorter neighbouring segment and quantized
 * to whole frames; anything shorter than one frame becomes a cut.
 */
class TransitionSelector {
public:
    TransitionSelector(const TransitionConfig& config, uint64_t seed);

    // Same timeline and seed always produce the same plan
    TransitionPlan plan(const Timeline& timeline) const;

    // Largest whole-frame duration <= requested and <= half of either neighbour
    static double clampDuration(double requested, double leftSegment, double rightSegment, double fps);

    const TransitionConfig& getConfig() const { return m_config; }
    const std::vector<TransitionStyle>& getEnabledStyles() const { return m_styles; }

private:
    TransitionConfig m_config;
    uint64_t m_seed;
    std::vector<TransitionStyle> m_styles;
};

// "xfade=transition=<name>:duration=<d>:offset=<o>"
std::string buildXfadeFilter(const TransitionSpec& spec, double offset);

} // namespace ReelSync
