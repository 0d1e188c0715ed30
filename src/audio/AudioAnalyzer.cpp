#include "AudioAnalyzer.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <cmath>
#include <sstream>

namespace ReelSync {

AudioAnalyzer::AudioAnalyzer()
{
}

AudioAnalyzer::AudioAnalyzer(const AudioAnalysisConfig& config)
    : m_config(config)
{
}

AudioAnalyzer::~AudioAnalyzer() {
}

double AudioAnalyzer::computeRms(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0;
    double energy = 0.0;
    for (float s : samples) {
        energy += double(s) * double(s);
    }
    return std::sqrt(energy / samples.size());
}

BeatMap AudioAnalyzer::detect(const AudioTrack& track) const {
    TRACE_FUNC();
    if (track.isEmpty() || track.getDuration() < m_config.minTrackSeconds) {
        std::ostringstream oss;
        oss << "Audio track too short for analysis: " << track.getDuration()
            << "s (minimum " << m_config.minTrackSeconds << "s)";
        throw AnalysisError(oss.str());
    }

    double rms = computeRms(track.getSamples());
    if (rms < m_config.silenceThreshold) {
        throw AnalysisError("Audio track is silent (rms=" + std::to_string(rms) + ")");
    }

    OnsetParams params = m_config.onset;
    std::vector<double> onsets = detectBeatsFromWaveform(track.getSamples(), track.getSampleRate(), params);
    BeatMap map = BeatMap::fromOnsets(onsets, track.getDuration(), m_config.minBeatSpacing);

    logDebug("Detected " + std::to_string(onsets.size()) + " onsets, " +
             std::to_string(map.getNumBeats()) + " beats after spacing");

    if (map.getNumBeats() < 2) {
        throw AnalysisError("Fewer than 2 beats detected (" + std::to_string(map.getNumBeats()) + ")");
    }
    return map;
}

BeatMap AudioAnalyzer::analyze(const AudioTrack& track) const {
    TRACE_FUNC();
    try {
        BeatMap map = detect(track);
        std::ostringstream oss;
        oss << "Detected " << map.getNumBeats() << " beats, estimated BPM " << map.getBPM();
        logInfo(oss.str());
        return map;
    } catch (const AnalysisError& e) {
        if (!m_config.allowUniformFallback) {
            throw;
        }
        logWarn(std::string("Beat detection failed (") + e.what() + "), using uniform fallback at " +
                std::to_string(m_config.fallbackBpm) + " BPM");
        return BeatMap::uniform(track.getDuration(), m_config.fallbackBpm, m_config.minBeatSpacing);
    }
}

BeatMap AudioAnalyzer::analyzeFile(const std::string& audioFilePath) const {
    AudioTrack track = loadAudioTrack(audioFilePath);
    return analyze(track);
}

} // namespace ReelSync
