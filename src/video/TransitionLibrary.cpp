#include "TransitionLibrary.h"
#include "ClipSequencer.h"
#include "Timeline.h"
#include "utils/DebugLogger.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace ReelSync {

namespace {
// Mixed into the run seed so transition draws are independent of trim-offset draws
constexpr uint64_t kSelectorSeedSalt = 0x9E3779B97F4A7C15ull;
}

const std::vector<TransitionDescriptor>& allTransitions() {
    static const std::vector<TransitionDescriptor> transitions = {
        {TransitionStyle::Cut,         "cut",         "cut",        ""},
        {TransitionStyle::Fade,        "fade",        "blend",      "fade"},
        {TransitionStyle::FadeBlack,   "fadeblack",   "blend",      "fadeblack"},
        {TransitionStyle::FadeWhite,   "fadewhite",   "blend",      "fadewhite"},
        {TransitionStyle::Dissolve,    "dissolve",    "blend",      "dissolve"},
        {TransitionStyle::WipeLeft,    "wipeleft",    "wipe",       "wipeleft"},
        {TransitionStyle::WipeRight,   "wiperight",   "wipe",       "wiperight"},
        {TransitionStyle::WipeUp,      "wipeup",      "wipe",       "wipeup"},
        {TransitionStyle::WipeDown,    "wipedown",    "wipe",       "wipedown"},
        {TransitionStyle::SlideLeft,   "slideleft",   "slide",      "slideleft"},
        {TransitionStyle::SlideRight,  "slideright",  "slide",      "slideright"},
        {TransitionStyle::SlideUp,     "slideup",     "slide",      "slideup"},
        {TransitionStyle::SlideDown,   "slidedown",   "slide",      "slidedown"},
        {TransitionStyle::CircleCrop,  "circlecrop",  "shape",      "circlecrop"},
        {TransitionStyle::CircleOpen,  "circleopen",  "shape",      "circleopen"},
        {TransitionStyle::Radial,      "radial",      "shape",      "radial"},
        {TransitionStyle::ZoomIn,      "zoomin",      "distortion", "zoomin"},
        {TransitionStyle::Pixelize,    "pixelize",    "distortion", "pixelize"},
        {TransitionStyle::SmoothLeft,  "smoothleft",  "slide",      "smoothleft"},
        {TransitionStyle::SmoothRight, "smoothright", "slide",      "smoothright"},
    };
    return transitions;
}

const TransitionDescriptor* findTransition(const std::string& name) {
    for (const auto& t : allTransitions()) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

const TransitionDescriptor& describe(TransitionStyle style) {
    for (const auto& t : allTransitions()) {
        if (t.style == style) return t;
    }
    return allTransitions().front();
}

TransitionPlan::TransitionPlan(std::vector<TransitionSpec> specs)
    : m_specs(std::move(specs))
{
}

TransitionPlan TransitionPlan::allCuts(size_t segmentCount) {
    return TransitionPlan(std::vector<TransitionSpec>(segmentCount + 1));
}

size_t TransitionPlan::getTransitionCount() const {
    return static_cast<size_t>(std::count_if(m_specs.begin(), m_specs.end(),
                                             [](const TransitionSpec& s) { return !s.isCut(); }));
}

bool TransitionPlan::isValid(size_t segmentCount) const {
    if (m_specs.size() != segmentCount + 1) return false;
    return m_specs.front().isCut() && m_specs.back().isCut();
}

std::string TransitionPlan::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < m_specs.size(); ++i) {
        if (i > 0) oss << " | ";
        oss << describe(m_specs[i].style).name;
        if (!m_specs[i].isCut()) oss << "(" << m_specs[i].duration << ")";
    }
    return oss.str();
}

TransitionSelector::TransitionSelector(const TransitionConfig& config, uint64_t seed)
    : m_config(config)
    , m_seed(seed ^ kSelectorSeedSalt)
{
    if (m_config.styles.empty()) {
        for (const auto& t : allTransitions()) {
            if (t.style != TransitionStyle::Cut) m_styles.push_back(t.style);
        }
    } else {
        for (const auto& name : m_config.styles) {
            const TransitionDescriptor* t = findTransition(name);
            if (!t) {
                logWarn("Unknown transition style '" + name + "' ignored");
                continue;
            }
            if (t->style != TransitionStyle::Cut &&
                std::find(m_styles.begin(), m_styles.end(), t->style) == m_styles.end()) {
                m_styles.push_back(t->style);
            }
        }
    }
}

double TransitionSelector::clampDuration(double requested, double leftSegment, double rightSegment, double fps) {
    if (!(fps > 0.0) || !(requested > 0.0)) return 0.0;
    double limit = std::min({requested, 0.5 * leftSegment, 0.5 * rightSegment});
    if (!(limit > 0.0)) return 0.0;
    // Small epsilon so exact multiples of a frame are not lost to rounding
    double frames = std::floor(limit * fps + 1e-6);
    return frames >= 1.0 ? frames / fps : 0.0;
}

TransitionPlan TransitionSelector::plan(const Timeline& timeline) const {
    const auto& segments = timeline.getSegments();
    std::vector<TransitionSpec> specs(segments.size() + 1);
    if (!m_config.enabled || m_styles.empty() || segments.size() < 2) {
        return TransitionPlan(std::move(specs));
    }

    std::mt19937_64 rng(m_seed);
    for (size_t k = 1; k < segments.size(); ++k) {
        // Both draws happen for every boundary so one boundary's outcome never shifts the next
        double cutRoll = unitInterval(rng);
        size_t styleIndex = static_cast<size_t>(unitInterval(rng) * m_styles.size());
        styleIndex = std::min(styleIndex, m_styles.size() - 1);

        if (cutRoll < m_config.cutProbability) continue;

        double duration = clampDuration(m_config.duration, segments[k - 1].duration,
                                        segments[k].duration, timeline.getFps());
        if (duration <= 0.0) continue;

        specs[k].style = m_styles[styleIndex];
        specs[k].duration = duration;
    }
    return TransitionPlan(std::move(specs));
}

std::string buildXfadeFilter(const TransitionSpec& spec, double offset) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "xfade=transition=" << describe(spec.style).xfadeName
        << ":duration=" << spec.duration
        << ":offset=" << std::max(0.0, offset);
    return oss.str();
}

} // namespace ReelSync
