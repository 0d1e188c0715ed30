#pragma once

#include <memory>
#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief Immutable handle to a decoded mono waveform
 *
 * Samples are shared, so copies of an AudioTrack are cheap and never mutate
 * the underlying buffer.
 */
class AudioTrack {
public:
    AudioTrack();
    AudioTrack(std::vector<float> samples, int sampleRate, int channelCount = 1,
               std::string sourcePath = "");

    const std::vector<float>& getSamples() const { return *m_samples; }
    int getSampleRate() const { return m_sampleRate; }
    int getChannelCount() const { return m_channelCount; }
    double getDuration() const { return m_duration; }
    const std::string& getSourcePath() const { return m_sourcePath; }

    bool isEmpty() const { return m_samples->empty() || m_sampleRate <= 0; }

private:
    std::shared_ptr<const std::vector<float>> m_samples;
    int m_sampleRate;
    int m_channelCount;
    double m_duration;
    std::string m_sourcePath;
};

/**
 * @brief Decode an audio file with FFmpeg, down-mixed to mono float at its native rate
 * @throws InvalidMediaError if the file cannot be opened, has no audio stream or decodes to nothing
 */
AudioTrack loadAudioTrack(const std::string& filePath);

} // namespace ReelSync
