#pragma once

#include <cstdint>
#include <string>

// Forward declarations
struct AVFormatContext;
struct AVStream;

namespace ReelSync {

/**
 * @brief Stream metadata for one media file
 */
struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;      // seconds, container duration when known
    int64_t totalFrames = 0;    // estimated from duration when the stream does not say
    std::string codec;
    int64_t bitrate = 0;
    bool hasAudio = false;
};

/**
 * @brief Reads clip metadata through libavformat
 *
 * The decoder for the video stream is located and opened so that files with an
 * unsupported codec fail here instead of halfway through a render. No frames
 * are decoded.
 */
class VideoProcessor {
public:
    VideoProcessor() = default;
    ~VideoProcessor();

    VideoProcessor(const VideoProcessor&) = delete;
    VideoProcessor& operator=(const VideoProcessor&) = delete;

    /**
     * @brief Inspect a media file
     * @return true when a decodable video stream was found; getInfo() is then valid
     */
    bool inspect(const std::string& filePath);

    const VideoInfo& getInfo() const { return m_info; }
    std::string getLastError() const { return m_lastError; }

private:
    bool fail(const std::string& what, int averror = 0);
    bool checkDecoder(const AVStream* stream);
    void fillInfo(const AVStream* stream, int audioIndex);
    void release();

    AVFormatContext* m_formatCtx = nullptr;
    std::string m_filePath;
    std::string m_lastError;
    VideoInfo m_info;
};

/**
 * @brief Seam for reading media metadata; tests substitute a fake
 */
class MediaProbe {
public:
    virtual ~MediaProbe() = default;

    /**
     * @brief Probe a media file
     * @param path File to inspect
     * @param info Receives metadata on success
     * @param error Receives a description on failure
     * @return true if the file has a readable video stream
     */
    virtual bool probe(const std::string& path, VideoInfo& info, std::string& error) = 0;
};

class FFmpegMediaProbe : public MediaProbe {
public:
    bool probe(const std::string& path, VideoInfo& info, std::string& error) override;
};

} // namespace ReelSync
