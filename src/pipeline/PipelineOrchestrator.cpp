#include "PipelineOrchestrator.h"
#include "audio/AudioAnalyzer.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "video/ClipLibrary.h"
#include "video/ClipSequencer.h"
#include "video/TransitionCompositor.h"
#include "video/TransitionLibrary.h"

#include <cctype>
#include <ctime>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace ReelSync {

const char* stateName(PipelineState state) {
    switch (state) {
        case PipelineState::Init:              return "INIT";
        case PipelineState::AnalyzingAudio:    return "ANALYZING_AUDIO";
        case PipelineState::SequencingClips:   return "SEQUENCING_CLIPS";
        case PipelineState::Compositing:       return "COMPOSITING";
        case PipelineState::AligningSubtitles: return "ALIGNING_SUBTITLES";
        case PipelineState::Done:              return "DONE";
        case PipelineState::Failed:            return "FAILED";
    }
    return "UNKNOWN";
}

PipelineServices PipelineServices::defaults() {
    PipelineServices services;
    services.runner = std::make_shared<ShellCommandRunner>();
    services.probe = std::make_shared<FFmpegMediaProbe>();
    services.loadAudio = [](const std::string& path) { return loadAudioTrack(path); };
    return services;
}

PipelineOrchestrator::PipelineOrchestrator(const ReelConfig& config, PipelineServices services)
    : m_config(config)
    , m_services(std::move(services))
{
    PipelineServices fallback;
    if (!m_services.runner || !m_services.probe || !m_services.loadAudio) {
        fallback = PipelineServices::defaults();
    }
    if (!m_services.runner) m_services.runner = fallback.runner;
    if (!m_services.probe) m_services.probe = fallback.probe;
    if (!m_services.loadAudio) m_services.loadAudio = fallback.loadAudio;
}

std::string PipelineOrchestrator::makeRunStamp(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string PipelineOrchestrator::makeArtifactTag(const std::string& jobId, const std::string& stamp) {
    std::string id;
    for (char c : jobId) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        id += safe ? c : '_';
    }
    return id.empty() ? stamp : id + "_" + stamp;
}

std::string PipelineOrchestrator::claimWorkDirectory(const std::string& outputDir, std::string& tag) {
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        throw RenderError("Cannot create output directory " + outputDir + ": " + ec.message());
    }

    // create_directory reports false for an existing entry, so each run owns its directory
    const std::string base = tag;
    for (int n = 1; n < 1000; ++n) {
        std::string candidate = n == 1 ? base : base + "_" + std::to_string(n);
        fs::path workDir = fs::path(outputDir) / ("work_" + candidate);
        if (fs::create_directory(workDir, ec)) {
            tag = candidate;
            return workDir.string();
        }
        if (ec) {
            throw RenderError("Cannot create work directory " + workDir.string() + ": " + ec.message());
        }
    }
    throw RenderError("No free work directory for " + base + " in " + outputDir);
}

double PipelineOrchestrator::stagePercent(PipelineState state) {
    switch (state) {
        case PipelineState::Init:              return 0.0;
        case PipelineState::AnalyzingAudio:    return 5.0;
        case PipelineState::SequencingClips:   return 25.0;
        case PipelineState::Compositing:       return 35.0;
        case PipelineState::AligningSubtitles: return 85.0;
        case PipelineState::Done:              return 100.0;
        case PipelineState::Failed:            return 100.0;
    }
    return 0.0;
}

void PipelineOrchestrator::enter(PipelineState state, const std::string& message, ProgressChannel& channel) {
    m_state.store(state);
    logInfo(std::string("Pipeline -> ") + stateName(state) + ": " + message);

    ProgressEvent event;
    event.stage = stateName(state);
    event.percent = stagePercent(state);
    event.message = message;
    channel.publish(event);
}

std::vector<TranscriptSegment> PipelineOrchestrator::loadTranscript(const PipelineRequest& request) const {
    if (!request.transcript.empty() || request.transcriptSrtPath.empty()) {
        return request.transcript;
    }
    try {
        return loadTranscriptSrt(request.transcriptSrtPath);
    } catch (const AlignmentError& e) {
        // Captions are optional output; the reel ships without them
        logWarn(std::string("Transcript unavailable, continuing without captions: ") + e.what());
        return {};
    }
}

std::string PipelineOrchestrator::retainNarration(const std::string& narrationPath, const std::string& outputDir,
                                                  const std::string& stamp) const {
    std::string ext = fs::path(narrationPath).extension().string();
    if (ext.empty()) ext = ".wav";
    fs::path target = fs::path(outputDir) / ("narration_" + stamp + ext);

    std::error_code ec;
    fs::copy_file(narrationPath, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logWarn("Could not retain narration copy " + target.string() + ": " + ec.message());
        return narrationPath;
    }
    return target.string();
}

PipelineResult PipelineOrchestrator::run(const PipelineRequest& request, ProgressChannel& channel,
                                         const CancellationToken& cancel) {
    TRACE_FUNC();
    PipelineResult result;
    m_state.store(PipelineState::Init);

    ReelConfig config = m_config;
    try {
        {
            TRACE_SCOPE("INIT");
            enter(PipelineState::Init, "Preparing run" +
                  (request.jobId.empty() ? std::string() : " for job " + request.jobId), channel);

            if (request.seed) config.seed = request.seed;
            if (!request.outputDirectory.empty()) config.outputDirectory = request.outputDirectory;
            config.validate();

            if (request.narrationPath.empty()) {
                throw InvalidMediaError("No narration audio supplied");
            }

            auto now = std::chrono::system_clock::now();
            result.seed = config.seed ? *config.seed
                                      : static_cast<uint64_t>(now.time_since_epoch().count());
            result.runStamp = makeRunStamp(now);

            std::string tag = makeArtifactTag(request.jobId, result.runStamp);
            result.workDirectory = claimWorkDirectory(config.outputDirectory, tag);
            result.artifactTag = tag;
            logInfo("Run " + result.artifactTag + " seed " + std::to_string(result.seed));
        }

        cancel.throwIfCancelled(stateName(PipelineState::AnalyzingAudio));
        {
            TRACE_SCOPE("ANALYZING_AUDIO");
            enter(PipelineState::AnalyzingAudio, "Detecting beats in " + request.narrationPath, channel);

            AudioTrack track = m_services.loadAudio(request.narrationPath);
            AudioAnalyzer analyzer(config.audio);
            result.beatMap = analyzer.analyze(track);
            logInfo("Beat map: " + std::to_string(result.beatMap.getNumBeats()) + " beats, " +
                    std::to_string(result.beatMap.getBPM()) + " BPM" +
                    (result.beatMap.isFallback() ? " (uniform fallback)" : ""));
        }

        cancel.throwIfCancelled(stateName(PipelineState::SequencingClips));
        Timeline timeline;
        {
            TRACE_SCOPE("SEQUENCING_CLIPS");
            enter(PipelineState::SequencingClips, "Assigning clips to beat intervals", channel);

            ClipLibrary library(m_services.probe, (fs::path(result.workDirectory) / "clips").string());
            if (!request.clipDirectory.empty()) {
                library.registerDirectory(request.clipDirectory);
            }
            for (const auto& path : request.clipPaths) {
                std::string keyword;
                std::string providerId;
                if (!parseClipFileName(fs::path(path).filename().string(), keyword, providerId)) {
                    logWarn("Skipping clip with unusable name: " + path);
                    continue;
                }
                try {
                    library.registerClip(path, keyword, providerId);
                } catch (const InvalidMediaError& e) {
                    logWarn(std::string("Skipping invalid clip: ") + e.what());
                }
            }

            std::vector<VideoClip> pool = library.pickWithFallback(request.keywords, config.clips.perKeyword);

            SequencerConfig seqConfig = config.sequencer;
            seqConfig.seed = result.seed;
            ClipSequencer sequencer(seqConfig);
            timeline = sequencer.sequence(result.beatMap, pool);
            result.segmentCount = timeline.size();
            logDebug(timeline.toString());
        }

        cancel.throwIfCancelled(stateName(PipelineState::Compositing));
        RenderedVideo rendered;
        {
            TRACE_SCOPE("COMPOSITING");
            enter(PipelineState::Compositing, "Rendering " + std::to_string(timeline.size()) + " segments", channel);

            TransitionSelector selector(config.transitions, result.seed);
            TransitionPlan plan = selector.plan(timeline);
            result.transitionCount = plan.getTransitionCount();

            TransitionCompositor compositor(m_services.runner, m_services.probe, config.output, config.transitions);
            compositor.setProgressCallback([&channel](double progress) {
                ProgressEvent event;
                event.stage = stateName(PipelineState::Compositing);
                event.percent = 35.0 + 45.0 * progress;
                event.message = "Compositing";
                channel.publish(event);
            });

            rendered = compositor.compose(timeline, plan, result.workDirectory);
            compositor.muxAudio(rendered, request.narrationPath,
                                (fs::path(result.workDirectory) / "muxed.mp4").string());
        }

        cancel.throwIfCancelled(stateName(PipelineState::AligningSubtitles));
        {
            TRACE_SCOPE("ALIGNING_SUBTITLES");
            enter(PipelineState::AligningSubtitles, "Aligning captions", channel);

            std::vector<TranscriptSegment> transcript = loadTranscript(request);
            SubtitleAligner aligner(config.subtitles, m_services.runner, config.output);
            double videoDuration = rendered.duration > 0.0 ? rendered.duration : timeline.getTotalDuration();
            std::vector<SubtitleCue> cues = aligner.align(transcript, videoDuration);

            fs::path outDir(config.outputDirectory);
            result.reel = aligner.burn(rendered.muxedPath, videoDuration, cues,
                                       (outDir / ("reel_" + result.artifactTag + ".mp4")).string(),
                                       (outDir / ("reel_" + result.artifactTag + ".srt")).string());
            result.reel.narrationPath = retainNarration(request.narrationPath, config.outputDirectory,
                                                        result.artifactTag);
            if (!result.reel.captionsBurned) {
                logWarn("Reel delivered without burned captions: " + result.reel.captionNote);
            }
        }

        m_state.store(PipelineState::Done);
        result.state = PipelineState::Done;
        result.success = true;

        ProgressEvent done;
        done.stage = stateName(PipelineState::Done);
        done.percent = 100.0;
        done.message = "Reel ready: " + result.reel.videoPath;
        done.terminal = true;
        done.success = true;
        done.artifactPath = result.reel.videoPath;
        logInfo(done.message);
        channel.publish(done);
        return result;
    } catch (const ReelError& e) {
        result.errorKind = e.getKind();
        result.error = e.what();
    } catch (const std::exception& e) {
        result.errorKind = ErrorKind::Internal;
        result.error = e.what();
    }

    // The stage that was active when the run stopped
    result.failedStage = stateName(m_state.load());
    result.state = PipelineState::Failed;
    m_state.store(PipelineState::Failed);

    logError("Pipeline failed in " + result.failedStage + " (" + errorKindName(result.errorKind) + "): " +
             result.error);

    ProgressEvent failed;
    failed.stage = stateName(PipelineState::Failed);
    failed.percent = 100.0;
    failed.message = result.error;
    failed.terminal = true;
    failed.success = false;
    failed.failedStage = result.failedStage;
    failed.errorKind = result.errorKind;
    channel.publish(failed);
    return result;
}

} // namespace ReelSync
