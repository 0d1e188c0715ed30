#pragma once

#include "ProgressChannel.h"
#include "ReelConfig.h"
#include "audio/AudioTrack.h"
#include "audio/BeatMap.h"
#include "subtitles/SubtitleAligner.h"
#include "utils/ProcessUtils.h"
#include "video/VideoProcessor.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ReelSync {

enum class PipelineState {
    Init,
    AnalyzingAudio,
    SequencingClips,
    Compositing,
    AligningSubtitles,
    Done,
    Failed
};

// "INIT", "ANALYZING_AUDIO", ...
const char* stateName(PipelineState state);

/**
 * @brief Inputs for one run, supplied by the upstream collaborators
 */
struct PipelineRequest {
    std::string jobId;
    std::string narrationPath;
    std::string clipDirectory;              // every supported file is registered
    std::vector<std::string> clipPaths;     // keyword taken from the file name
    std::vector<std::string> keywords;      // empty = whole pool
    std::vector<TranscriptSegment> transcript;
    std::string transcriptSrtPath;          // used when transcript is empty
    std::string outputDirectory;            // empty = config.outputDirectory
    std::optional<uint64_t> seed;           // overrides config.seed
};

struct PipelineResult {
    PipelineState state = PipelineState::Init;
    bool success = false;
    Reel reel;

    std::string failedStage;
    ErrorKind errorKind = ErrorKind::None;
    std::string error;

    uint64_t seed = 0;
    std::string runStamp;
    std::string artifactTag;    // "<jobId>_<runStamp>[_n]", names the work directory and artifacts
    std::string workDirectory;  // kept after failures for inspection
    BeatMap beatMap;
    size_t segmentCount = 0;
    size_t transitionCount = 0;
};

/**
 * @brief External tools the pipeline talks to; tests replace them with fakes
 */
struct PipelineServices {
    std::shared_ptr<CommandRunner> runner;
    std::shared_ptr<MediaProbe> probe;
    std::function<AudioTrack(const std::string&)> loadAudio;

    // ffmpeg through the shell, libav probing and decoding
    static PipelineServices defaults();
};

/**
 * @brief Runs analysis, sequencing, compositing and captioning strictly in order
 *
 * Linear state machine INIT -> ANALYZING_AUDIO -> SEQUENCING_CLIPS -> COMPOSITING ->
 * ALIGNING_SUBTITLES -> DONE, with FAILED reachable from every non-terminal state.
 * Every transition is published on the ProgressChannel; the last event is terminal.
 * Cancellation is checked between stages. Failed runs are never retried and their
 * work directory is left in place.
 */
class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(const ReelConfig& config,
                                  PipelineServices services = PipelineServices::defaults());

    // Never throws for pipeline failures; the result and final event carry stage and kind
    PipelineResult run(const PipelineRequest& request, ProgressChannel& channel,
                       const CancellationToken& cancel);

    PipelineState getState() const { return m_state.load(); }
    const ReelConfig& getConfig() const { return m_config; }

    // Artifact timestamp "YYYYmmdd_HHMMSS" (local time)
    static std::string makeRunStamp(std::chrono::system_clock::time_point time);

    // "<jobId>_<stamp>" with characters unsafe in file names replaced by '_'; the stamp alone without an id
    static std::string makeArtifactTag(const std::string& jobId, const std::string& stamp);

    // Create <outputDir>/work_<tag> exclusively; on collision a _2, _3... suffix is appended to tag
    static std::string claimWorkDirectory(const std::string& outputDir, std::string& tag);

    // Percent published when a stage is entered
    static double stagePercent(PipelineState state);

private:
    ReelConfig m_config;
    PipelineServices m_services;
    std::atomic<PipelineState> m_state{PipelineState::Init};

    void enter(PipelineState state, const std::string& message, ProgressChannel& channel);
    std::vector<TranscriptSegment> loadTranscript(const PipelineRequest& request) const;
    std::string retainNarration(const std::string& narrationPath, const std::string& outputDir,
                                const std::string& stamp) const;
};

} // namespace ReelSync
