#pragma once

#include "utils/ProcessUtils.h"
#include "video/TransitionCompositor.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ReelSync {

struct TranscriptWord {
    std::string text;
    double start = 0.0;
    double end = 0.0;
};

/**
 * @brief One transcription segment; words are optional word-level timestamps
 */
struct TranscriptSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::vector<TranscriptWord> words;
};

struct SubtitleCue {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/**
 * @brief Fixed caption look for hard subtitles
 */
struct CaptionStyle {
    std::string fontName = "Arial";
    int fontSize = 24;
    uint32_t primaryColour = 0xFFFFFF;   // 0xRRGGBB fill
    uint32_t outlineColour = 0x000000;   // 0xRRGGBB outline
    int outline = 2;
    int marginV = 200;
    int alignment = 2;                   // ASS numpad layout, 2 = bottom centre
    bool bold = false;
};

struct SubtitleConfig {
    size_t maxWordsPerCue = 5;
    size_t targetWordsPerCue = 4;
    double minGap = 0.1;          // closer cues are joined to avoid flicker
    double minCueDuration = 0.3;  // overlapping cues starting closer than this are merged
    CaptionStyle style;
    bool burnIn = true;
    bool embedSoftTrack = false;  // also add a mov_text track to the container
};

/**
 * @brief Final artifact description
 */
struct Reel {
    std::string videoPath;
    std::string captionPath;
    std::string narrationPath;
    double duration = 0.0;
    bool captionsBurned = false;
    std::string captionNote;      // why captions were not burned
    size_t cueCount = 0;
};

std::string formatSrtTimestamp(double seconds);
// Parses "HH:MM:SS,mmm" (a '.' separator is accepted); false on malformed input
bool parseSrtTimestamp(const std::string& text, double& seconds);

std::string formatSrt(const std::vector<SubtitleCue>& cues);

/**
 * @brief Parse SRT text; malformed blocks are skipped with a warning
 */
std::vector<SubtitleCue> parseSrt(const std::string& text);

/**
 * @brief Load an SRT transcript as segments (lines of a block joined with spaces)
 * @throws AlignmentError if the file cannot be read
 */
std::vector<TranscriptSegment> loadTranscriptSrt(const std::string& path);

/**
 * @brief Write cues as SRT
 * @throws AlignmentError on I/O failure
 */
void writeSrt(const std::vector<SubtitleCue>& cues, const std::string& path);

// Valid UTF-8 without control characters (tab excepted)
bool isBurnableText(const std::string& text);

// ASS force_style value for the subtitles filter
std::string buildForceStyle(const CaptionStyle& style);

// Quote a value for use inside an ffmpeg filter option
std::string escapeFilterValue(const std::string& value);

/**
 * @brief Turns transcript timestamps into caption cues and burns them into the video
 */
class SubtitleAligner {
public:
    SubtitleAligner(const SubtitleConfig& config,
                    std::shared_ptr<CommandRunner> runner,
                    const OutputSettings& output = OutputSettings());

    /**
     * @brief Derive ordered, non-overlapping cues clipped to videoDuration
     *
     * Long segments are split into cues of about targetWordsPerCue words. Overlaps are
     * resolved by ending the earlier cue where the next begins (merging the two when
     * the earlier one would be shorter than minCueDuration); gaps under minGap are closed.
     */
    std::vector<SubtitleCue> align(const std::vector<TranscriptSegment>& transcript,
                                   double videoDuration) const;

    // Split one segment into cues of at most maxWordsPerCue words
    std::vector<SubtitleCue> splitSegment(const TranscriptSegment& segment) const;

    /**
     * @brief Write the caption file and burn the cues into the video
     *
     * Never throws for caption problems: an unwritable caption file, unburnable text or
     * an ffmpeg failure yields the unburned video with captionsBurned = false.
     * @throws RenderError only if the output video itself cannot be written
     */
    Reel burn(const std::string& videoPath, double videoDuration,
              const std::vector<SubtitleCue>& cues,
              const std::string& outputPath, const std::string& captionPath) const;

    std::string buildBurnCommand(const std::string& videoPath, const std::string& captionPath,
                                 const std::string& outputPath) const;

    const SubtitleConfig& getConfig() const { return m_config; }

private:
    SubtitleConfig m_config;
    std::shared_ptr<CommandRunner> m_runner;
    OutputSettings m_output;
    std::string m_ffmpegPath;
};

} // namespace ReelSync
