#pragma once

#include "Timeline.h"
#include "TransitionLibrary.h"
#include "VideoProcessor.h"
#include "utils/ProcessUtils.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief Encoding settings for the rendered reel
 */
struct OutputSettings {
    int width = 1080;
    int height = 1920;
    int fps = 30;
    std::string videoCodec = "libx264";
    std::string preset = "ultrafast";
    int crf = 23;
    std::string audioCodec = "aac";
    std::string audioBitrate = "192k";
    std::string ffmpegPath;   // empty = resolveFfmpegPath()
};

/**
 * @brief Result of compositing; muxedPath is empty until muxAudio() succeeds
 */
struct RenderedVideo {
    std::string silentPath;
    std::string muxedPath;
    double duration = 0.0;
    size_t segmentCount = 0;
    size_t transitionCount = 0;
};

/**
 * @brief Stitches timeline segments with transitions into one video matched to the audio
 *
 * Each segment is cut, scaled and center-cropped to the portrait frame by its own
 * ffmpeg run, then the pieces are joined with xfade/concat. Segment i is rendered
 * with a tail equal to the next transition, so every transition starts on its beat
 * and the stitched length equals the timeline total.
 */
class TransitionCompositor {
public:
    TransitionCompositor(std::shared_ptr<CommandRunner> runner,
                         std::shared_ptr<MediaProbe> probe,
                         const OutputSettings& settings = OutputSettings(),
                         const TransitionConfig& transitions = TransitionConfig());

    /**
     * @brief Render a silent video for the timeline
     * @param workDir Directory for intermediates and the silent output
     * @throws RenderError if a source becomes unreadable, ffmpeg fails, or the
     *         probed duration drifts from the timeline by more than a frame
     */
    RenderedVideo compose(const Timeline& timeline, const TransitionPlan& plan,
                          const std::string& workDir);

    RenderedVideo compose(const Timeline& timeline, const TransitionSelector& selector,
                          const std::string& workDir);

    /**
     * @brief Mux the narration onto the silent video (video stream copied, audio to AAC)
     * @throws RenderError naming the mux step on failure
     */
    void muxAudio(RenderedVideo& video, const std::string& audioPath, const std::string& outputPath);

    /**
     * @brief Set progress callback
     * @param callback Function called with progress (0.0 to 1.0)
     */
    void setProgressCallback(std::function<void(double)> callback);

    /**
     * @brief Frames each segment occupies in the output, from frame-rounded boundaries
     */
    static std::vector<int> computeSegmentFrames(const Timeline& timeline, int fps);

    /**
     * @brief ffmpeg command extracting one normalized segment
     * @param frames Output frame count (interval plus transition tail)
     */
    std::string buildSegmentCommand(const Segment& segment, int frames, int tailFrames,
                                    const std::string& outputPath) const;

    const OutputSettings& getOutputSettings() const { return m_settings; }
    const std::string& getFfmpegPath() const { return m_ffmpegPath; }

private:
    // An already-rendered piece of the output and its length in frames
    struct Piece {
        std::string path;
        int frames = 0;
    };

    std::shared_ptr<CommandRunner> m_runner;
    std::shared_ptr<MediaProbe> m_probe;
    OutputSettings m_settings;
    TransitionConfig m_transitions;
    std::string m_ffmpegPath;
    std::function<void(double)> m_progressCallback;
    int m_passCounter = 0;

    Piece stitch(const std::vector<Piece>& pieces, const std::vector<TransitionSpec>& joins,
                 const std::string& workDir, const std::string& outputPath);
    Piece stitchPass(const std::vector<Piece>& pieces, const std::vector<TransitionSpec>& joins,
                     const std::string& workDir, const std::string& outputPath);
    void concatDemuxer(const std::vector<Piece>& pieces, const std::string& workDir,
                       const std::string& outputPath);

    void runChecked(const std::string& cmd, const std::string& label, const std::string& outputPath,
                    const std::string& failurePrefix);
    std::string encoderArgs() const;
    void reportProgress(double progress);
};

} // namespace ReelSync
