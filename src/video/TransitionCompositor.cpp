#include "TransitionCompositor.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace ReelSync {

namespace {

// Container timestamps may round the probed duration by a few milliseconds
constexpr double kContainerTolerance = 0.02;

// Filter graphs longer than this go through -filter_complex_script
constexpr size_t kMaxInlineFilterLength = 4000;

const char* kCommandLog = "reelsync_ffmpeg.log";

// ffmpeg rejects scientific notation, so always print fixed-point
std::string seconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

std::string lastLine(const std::string& output) {
    std::string trimmed = output;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    size_t pos = trimmed.rfind('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

std::string pathIn(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

std::string numbered(const std::string& prefix, size_t index, const std::string& ext) {
    std::ostringstream oss;
    oss << prefix << std::setw(4) << std::setfill('0') << index << ext;
    return oss.str();
}

} // namespace

TransitionCompositor::TransitionCompositor(std::shared_ptr<CommandRunner> runner,
                                           std::shared_ptr<MediaProbe> probe,
                                           const OutputSettings& settings,
                                           const TransitionConfig& transitions)
    : m_runner(std::move(runner))
    , m_probe(std::move(probe))
    , m_settings(settings)
    , m_transitions(transitions)
{
    m_ffmpegPath = m_settings.ffmpegPath.empty() ? resolveFfmpegPath() : m_settings.ffmpegPath;
    if (m_transitions.maxInputsPerPass < 2) {
        m_transitions.maxInputsPerPass = 2;
    }
}

void TransitionCompositor::setProgressCallback(std::function<void(double)> callback) {
    m_progressCallback = std::move(callback);
}

void TransitionCompositor::reportProgress(double progress) {
    if (m_progressCallback) {
        m_progressCallback(std::clamp(progress, 0.0, 1.0));
    }
}

std::vector<int> TransitionCompositor::computeSegmentFrames(const Timeline& timeline, int fps) {
    std::vector<double> bounds = timeline.getBoundaries();
    std::vector<int> frames;
    if (bounds.size() < 2) return frames;
    frames.reserve(bounds.size() - 1);
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
        long long a = std::llround(bounds[i] * fps);
        long long b = std::llround(bounds[i + 1] * fps);
        frames.push_back(static_cast<int>(std::max<long long>(1, b - a)));
    }
    return frames;
}

std::string TransitionCompositor::encoderArgs() const {
    std::ostringstream oss;
    oss << "-c:v " << m_settings.videoCodec
        << " -preset " << m_settings.preset
        << " -crf " << m_settings.crf
        << " -pix_fmt yuv420p";
    return oss.str();
}

std::string TransitionCompositor::buildSegmentCommand(const Segment& segment, int frames, int tailFrames,
                                                      const std::string& outputPath) const {
    const int W = m_settings.width;
    const int H = m_settings.height;
    const int F = m_settings.fps;

    std::ostringstream vf;
    // Fill the portrait frame, then crop the overflow from the centre
    vf << "scale=" << W << ":" << H << ":force_original_aspect_ratio=increase"
       << ",crop=" << W << ":" << H
       << ",setsar=1,fps=" << F;
    if (!segment.looped) {
        // Hold the last frame when the clip cannot supply the transition tail
        vf << ",tpad=stop_mode=clone:stop_duration=" << seconds((tailFrames + 2.0) / F);
    }
    vf << ",format=yuv420p";

    std::ostringstream cmd;
    cmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error";
    if (segment.looped) {
        cmd << " -stream_loop -1";
    }
    // Clamp tiny offsets to zero
    if (segment.offset >= 0.001) {
        cmd << " -ss " << seconds(segment.offset);
    }
    cmd << " -i " << quoteArg(segment.clip.path)
        << " -frames:v " << frames
        << " -an -vf " << quoteArg(vf.str())
        << " " << encoderArgs()
        << " -r " << F
        << " -video_track_timescale 90000"
        << " -y " << quoteArg(outputPath);
    return cmd.str();
}

void TransitionCompositor::runChecked(const std::string& cmd, const std::string& label,
                                      const std::string& outputPath, const std::string& failurePrefix) {
    std::error_code ec;
    fs::remove(outputPath, ec);

    std::string output;
    int exitCode = m_runner->run(cmd, output);
    appendCommandLog(kCommandLog, label, cmd, exitCode, output);

    if (exitCode != 0) {
        throw RenderError(failurePrefix + " (exit " + std::to_string(exitCode) + "): " + lastLine(output));
    }
    if (!fs::exists(outputPath, ec)) {
        throw RenderError(failurePrefix + ": ffmpeg produced no output at " + outputPath);
    }
}

RenderedVideo TransitionCompositor::compose(const Timeline& timeline, const TransitionSelector& selector,
                                            const std::string& workDir) {
    return compose(timeline, selector.plan(timeline), workDir);
}

RenderedVideo TransitionCompositor::compose(const Timeline& timeline, const TransitionPlan& plan,
                                            const std::string& workDir) {
    TRACE_FUNC();
    timeline.validate();
    if (!plan.isValid(timeline.size())) {
        throw RenderError("Transition plan does not match the timeline boundaries");
    }

    std::error_code ec;
    fs::create_directories(workDir, ec);
    if (ec) {
        throw RenderError("Cannot create work directory " + workDir + ": " + ec.message());
    }

    const int fps = m_settings.fps;
    const auto& segments = timeline.getSegments();
    const std::vector<int> frames = computeSegmentFrames(timeline, fps);
    const size_t n = segments.size();
    m_passCounter = 0;

    logInfo("Compositing " + std::to_string(n) + " segments, " +
            std::to_string(plan.getTransitionCount()) + " transitions");
    logDebug("Transition plan: " + plan.toString());
    reportProgress(0.0);

    // 1. Extract every segment at the output geometry
    std::vector<Piece> pieces;
    pieces.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const Segment& seg = segments[i];
        std::ifstream source(seg.clip.path, std::ios::binary);
        if (!source) {
            throw RenderError("Source clip became unreadable during compositing: " + seg.clip.path);
        }

        const TransitionSpec& next = plan.at(i + 1);
        int tailFrames = next.isCut() ? 0 : static_cast<int>(std::llround(next.duration * fps));

        Piece piece;
        piece.path = pathIn(workDir, numbered("segment_", i, ".mp4"));
        piece.frames = frames[i] + tailFrames;

        std::string cmd = buildSegmentCommand(seg, piece.frames, tailFrames, piece.path);
        runChecked(cmd, "extractSegment", piece.path,
                   "Segment " + std::to_string(i) + " extraction failed for " + seg.clip.path);
        pieces.push_back(piece);
        reportProgress(0.9 * double(i + 1) / double(n));
    }

    // 2. Join the pieces; join k sits at timeline boundary k+1
    std::vector<TransitionSpec> joins;
    for (size_t k = 1; k < n; ++k) {
        joins.push_back(plan.at(k));
    }
    const std::string silentPath = pathIn(workDir, "silent.mp4");
    Piece stitched = stitch(pieces, joins, workDir, silentPath);
    reportProgress(0.97);

    // 3. Verify the rendered length against the timeline
    VideoInfo info;
    std::string probeError;
    if (!m_probe || !m_probe->probe(silentPath, info, probeError)) {
        throw RenderError("Cannot probe rendered video " + silentPath + ": " + probeError);
    }
    const double expected = timeline.getTotalDuration();
    const double tolerance = 1.0 / fps + kContainerTolerance;
    if (std::abs(info.duration - expected) > tolerance) {
        std::ostringstream oss;
        oss << "Rendered duration " << info.duration << "s does not match timeline " << expected
            << "s (" << stitched.frames << " frames expected)";
        throw RenderError(oss.str());
    }

    RenderedVideo result;
    result.silentPath = silentPath;
    result.duration = info.duration;
    result.segmentCount = n;
    result.transitionCount = plan.getTransitionCount();
    reportProgress(1.0);
    return result;
}

TransitionCompositor::Piece TransitionCompositor::stitch(const std::vector<Piece>& pieces,
                                                         const std::vector<TransitionSpec>& joins,
                                                         const std::string& workDir,
                                                         const std::string& outputPath) {
    if (pieces.size() == 1) {
        std::error_code ec;
        fs::copy_file(pieces.front().path, outputPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw RenderError("Cannot write " + outputPath + ": " + ec.message());
        }
        return Piece{outputPath, pieces.front().frames};
    }

    bool allCuts = std::all_of(joins.begin(), joins.end(), [](const TransitionSpec& s) { return s.isCut(); });
    if (allCuts) {
        int total = 0;
        for (const auto& p : pieces) total += p.frames;
        concatDemuxer(pieces, workDir, outputPath);
        return Piece{outputPath, total};
    }

    const size_t maxInputs = m_transitions.maxInputsPerPass;
    if (pieces.size() <= maxInputs) {
        return stitchPass(pieces, joins, workDir, outputPath);
    }

    // Too many inputs for one filter graph: stitch batches, then join the batches
    std::vector<Piece> batches;
    std::vector<TransitionSpec> batchJoins;
    for (size_t start = 0; start < pieces.size(); start += maxInputs) {
        size_t end = std::min(start + maxInputs, pieces.size());
        std::vector<Piece> group(pieces.begin() + start, pieces.begin() + end);
        std::vector<TransitionSpec> groupJoins(joins.begin() + start, joins.begin() + (end - 1));
        std::string batchPath = pathIn(workDir, numbered("batch_", ++m_passCounter, ".mp4"));
        batches.push_back(stitch(group, groupJoins, workDir, batchPath));
        if (end < pieces.size()) {
            batchJoins.push_back(joins[end - 1]);
        }
    }
    return stitch(batches, batchJoins, workDir, outputPath);
}

TransitionCompositor::Piece TransitionCompositor::stitchPass(const std::vector<Piece>& pieces,
                                                             const std::vector<TransitionSpec>& joins,
                                                             const std::string& workDir,
                                                             const std::string& outputPath) {
    const int fps = m_settings.fps;
    std::ostringstream graph;
    for (size_t i = 0; i < pieces.size(); ++i) {
        graph << "[" << i << ":v]settb=AVTB,setpts=PTS-STARTPTS[v" << i << "];";
    }

    std::string acc = "v0";
    int accFrames = pieces[0].frames;
    for (size_t k = 1; k < pieces.size(); ++k) {
        const TransitionSpec& spec = joins[k - 1];
        std::string out = "x" + std::to_string(k);
        graph << "[" << acc << "][v" << k << "]";
        if (spec.isCut()) {
            graph << "concat=n=2:v=1:a=0";
            accFrames += pieces[k].frames;
        } else {
            int tFrames = static_cast<int>(std::llround(spec.duration * fps));
            double offset = double(accFrames - tFrames) / fps;
            graph << buildXfadeFilter(spec, offset);
            accFrames += pieces[k].frames - tFrames;
        }
        graph << "[" << out << "]";
        if (k + 1 < pieces.size()) graph << ";";
        acc = out;
    }

    std::ostringstream cmd;
    cmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error";
    for (const auto& p : pieces) {
        cmd << " -i " << quoteArg(p.path);
    }

    const std::string filter = graph.str();
    if (filter.size() > kMaxInlineFilterLength) {
        std::string scriptPath = pathIn(workDir, numbered("filter_pass_", ++m_passCounter, ".txt"));
        std::ofstream script(scriptPath);
        if (!script) {
            throw RenderError("Cannot write filter script " + scriptPath);
        }
        script << filter;
        script.close();
        cmd << " -filter_complex_script " << quoteArg(scriptPath);
    } else {
        cmd << " -filter_complex " << quoteArg(filter);
    }
    cmd << " -map " << quoteArg("[" + acc + "]")
        << " " << encoderArgs()
        << " -r " << fps
        << " -video_track_timescale 90000"
        << " -y " << quoteArg(outputPath);

    runChecked(cmd.str(), "stitchTransitions", outputPath, "Transition stitching failed");
    return Piece{outputPath, accFrames};
}

void TransitionCompositor::concatDemuxer(const std::vector<Piece>& pieces, const std::string& workDir,
                                         const std::string& outputPath) {
    std::string listFile = pathIn(workDir, "concat_list.txt");
    {
        std::ofstream list(listFile);
        if (!list) {
            throw RenderError("Could not create concat list file " + listFile);
        }
        for (const auto& p : pieces) {
            std::string abs = fs::absolute(p.path).string();
            std::string escaped;
            for (char c : abs) {
                if (c == '\'') escaped += "'\\''"; else escaped += c;
            }
            list << "file '" << escaped << "'\n";
        }
    }

    // Segments share one encoding, so stream copy normally works; re-encode otherwise
    std::ostringstream copyCmd;
    copyCmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error -fflags +genpts"
            << " -f concat -safe 0 -i " << quoteArg(listFile)
            << " -c copy -video_track_timescale 90000 -y " << quoteArg(outputPath);
    try {
        runChecked(copyCmd.str(), "concatCopy", outputPath, "Concat (stream copy) failed");
        return;
    } catch (const RenderError& e) {
        logWarn(std::string(e.what()) + "; retrying with re-encode");
    }

    std::ostringstream reencodeCmd;
    reencodeCmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error -fflags +genpts"
                << " -f concat -safe 0 -i " << quoteArg(listFile)
                << " " << encoderArgs() << " -r " << m_settings.fps
                << " -video_track_timescale 90000 -y " << quoteArg(outputPath);
    runChecked(reencodeCmd.str(), "concatReencode", outputPath, "Concat and re-encode both failed");
}

void TransitionCompositor::muxAudio(RenderedVideo& video, const std::string& audioPath,
                                    const std::string& outputPath) {
    TRACE_FUNC();
    if (video.silentPath.empty()) {
        throw RenderError("Audio mux step failed: no rendered video to mux onto");
    }
    std::ifstream audio(audioPath, std::ios::binary);
    if (!audio) {
        throw RenderError("Audio mux step failed: narration unreadable: " + audioPath);
    }

    std::error_code ec;
    fs::path parent = fs::path(outputPath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    // Video from the first input, audio from the second
    std::ostringstream cmd;
    cmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error"
        << " -i " << quoteArg(video.silentPath)
        << " -i " << quoteArg(audioPath)
        << " -c:v copy -c:a " << m_settings.audioCodec << " -b:a " << m_settings.audioBitrate
        << " -map 0:v:0 -map 1:a:0 -shortest"
        << " -y " << quoteArg(outputPath);

    runChecked(cmd.str(), "muxAudio", outputPath, "Audio mux step failed");
    video.muxedPath = outputPath;
    logInfo("Muxed narration into " + outputPath);
}

} // namespace ReelSync
