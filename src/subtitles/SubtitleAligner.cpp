#include "SubtitleAligner.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace ReelSync {

namespace {

const char* kCommandLog = "reelsync_ffmpeg.log";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::string joinWords(const std::vector<std::string>& words, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

std::string assColour(uint32_t rgb) {
    // ASS colours are &HAABBGGRR
    unsigned r = (rgb >> 16) & 0xFF;
    unsigned g = (rgb >> 8) & 0xFF;
    unsigned b = rgb & 0xFF;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "&H00%02X%02X%02X", b, g, r);
    return buf;
}

bool copyVideo(const std::string& from, const std::string& to, std::string& error) {
    if (from == to) return true;
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

} // namespace

std::string formatSrtTimestamp(double seconds) {
    long long ms = std::llround(std::max(0.0, seconds) * 1000.0);
    long long h = ms / 3600000;
    ms %= 3600000;
    long long m = ms / 60000;
    ms %= 60000;
    long long s = ms / 1000;
    ms %= 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", h, m, s, ms);
    return buf;
}

bool parseSrtTimestamp(const std::string& text, double& seconds) {
    std::string t = trim(text);
    int h = 0, m = 0, s = 0, ms = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(t.c_str(), "%d:%d:%d%c%d%n", &h, &m, &s, &sep, &ms, &consumed) != 5) {
        return false;
    }
    if ((sep != ',' && sep != '.') || consumed != static_cast<int>(t.size())) return false;
    if (h < 0 || m < 0 || m > 59 || s < 0 || s > 59 || ms < 0 || ms > 999) return false;
    seconds = h * 3600.0 + m * 60.0 + s + ms / 1000.0;
    return true;
}

std::string formatSrt(const std::vector<SubtitleCue>& cues) {
    std::ostringstream oss;
    for (size_t i = 0; i < cues.size(); ++i) {
        oss << (i + 1) << "\n"
            << formatSrtTimestamp(cues[i].start) << " --> " << formatSrtTimestamp(cues[i].end) << "\n"
            << cues[i].text << "\n\n";
    }
    return oss.str();
}

std::vector<SubtitleCue> parseSrt(const std::string& text) {
    std::vector<SubtitleCue> cues;
    std::istringstream in(text);
    std::string line;
    std::vector<std::string> block;

    auto flush = [&]() {
        if (block.empty()) return;
        size_t timingLine = 0;
        if (block[0].find("-->") == std::string::npos) timingLine = 1;
        if (timingLine >= block.size() || block[timingLine].find("-->") == std::string::npos) {
            logWarn("Skipping SRT block without timing line");
            block.clear();
            return;
        }
        const std::string& timing = block[timingLine];
        size_t arrow = timing.find("-->");
        SubtitleCue cue;
        if (!parseSrtTimestamp(timing.substr(0, arrow), cue.start) ||
            !parseSrtTimestamp(timing.substr(arrow + 3), cue.end)) {
            logWarn("Skipping SRT block with malformed timing: " + timing);
            block.clear();
            return;
        }
        for (size_t i = timingLine + 1; i < block.size(); ++i) {
            if (!cue.text.empty()) cue.text += "\n";
            cue.text += block[i];
        }
        cues.push_back(cue);
        block.clear();
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Strip a UTF-8 BOM on the first line
        if (cues.empty() && block.empty() && line.size() >= 3 &&
            static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line = line.substr(3);
        }
        if (trim(line).empty()) {
            flush();
        } else {
            block.push_back(line);
        }
    }
    flush();
    return cues;
}

std::vector<TranscriptSegment> loadTranscriptSrt(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw AlignmentError("Cannot read transcript " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::vector<TranscriptSegment> segments;
    for (const auto& cue : parseSrt(buffer.str())) {
        TranscriptSegment seg;
        seg.start = cue.start;
        seg.end = cue.end;
        seg.text = cue.text;
        std::replace(seg.text.begin(), seg.text.end(), '\n', ' ');
        segments.push_back(seg);
    }
    return segments;
}

void writeSrt(const std::vector<SubtitleCue>& cues, const std::string& path) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw AlignmentError("Cannot write caption file " + path);
    }
    out << formatSrt(cues);
    if (!out) {
        throw AlignmentError("Short write for caption file " + path);
    }
}

bool isBurnableText(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if ((c < 0x20 && c != '\t' && c != '\n') || c == 0x7F) return false;
            ++i;
            continue;
        }
        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string buildForceStyle(const CaptionStyle& style) {
    std::ostringstream oss;
    oss << "FontName=" << style.fontName
        << ",FontSize=" << style.fontSize
        << ",PrimaryColour=" << assColour(style.primaryColour)
        << ",OutlineColour=" << assColour(style.outlineColour)
        << ",BorderStyle=1"
        << ",Outline=" << style.outline
        << ",Shadow=0"
        << ",Bold=" << (style.bold ? 1 : 0)
        << ",Alignment=" << style.alignment
        << ",MarginV=" << style.marginV;
    return oss.str();
}

std::string escapeFilterValue(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

SubtitleAligner::SubtitleAligner(const SubtitleConfig& config,
                                 std::shared_ptr<CommandRunner> runner,
                                 const OutputSettings& output)
    : m_config(config)
    , m_runner(std::move(runner))
    , m_output(output)
{
    if (m_config.maxWordsPerCue == 0) m_config.maxWordsPerCue = 1;
    if (m_config.targetWordsPerCue == 0) m_config.targetWordsPerCue = 1;
    m_ffmpegPath = m_output.ffmpegPath.empty() ? resolveFfmpegPath() : m_output.ffmpegPath;
}

std::vector<SubtitleCue> SubtitleAligner::splitSegment(const TranscriptSegment& segment) const {
    std::vector<SubtitleCue> cues;
    std::vector<std::string> words = splitWords(segment.text);
    if (words.empty() || !(segment.end > segment.start)) {
        return cues;
    }

    const size_t n = words.size();
    if (n <= m_config.maxWordsPerCue) {
        cues.push_back({segment.start, segment.end, joinWords(words, 0, n)});
        return cues;
    }

    size_t chunks = std::max((n + m_config.maxWordsPerCue - 1) / m_config.maxWordsPerCue,
                             n / m_config.targetWordsPerCue);
    chunks = std::max<size_t>(1, std::min(chunks, n));
    const size_t base = n / chunks;
    const size_t extra = n % chunks;

    bool useWordTimes = segment.words.size() == n;
    for (const auto& w : segment.words) {
        if (!(w.end >= w.start)) useWordTimes = false;
    }

    const double span = segment.end - segment.start;
    size_t j = 0;
    for (size_t c = 0; c < chunks; ++c) {
        size_t len = base + (c < extra ? 1 : 0);
        SubtitleCue cue;
        cue.text = joinWords(words, j, j + len);
        if (useWordTimes) {
            cue.start = segment.words[j].start;
            cue.end = segment.words[j + len - 1].end;
        } else {
            // Time proportional to word count
            cue.start = segment.start + span * double(j) / double(n);
            cue.end = segment.start + span * double(j + len) / double(n);
        }
        cues.push_back(cue);
        j += len;
    }
    return cues;
}

std::vector<SubtitleCue> SubtitleAligner::align(const std::vector<TranscriptSegment>& transcript,
                                                double videoDuration) const {
    TRACE_FUNC();
    std::vector<SubtitleCue> cues;
    for (const auto& seg : transcript) {
        TranscriptSegment cleaned = seg;
        cleaned.text = trim(seg.text);
        if (cleaned.text.empty()) continue;
        for (auto& cue : splitSegment(cleaned)) {
            cues.push_back(std::move(cue));
        }
    }
    std::stable_sort(cues.begin(), cues.end(),
                     [](const SubtitleCue& a, const SubtitleCue& b) { return a.start < b.start; });

    std::vector<SubtitleCue> resolved;
    for (const auto& cue : cues) {
        if (!(cue.end > cue.start)) continue;
        if (!resolved.empty()) {
            SubtitleCue& prev = resolved.back();
            if (cue.start < prev.end) {
                if (cue.start - prev.start < m_config.minCueDuration) {
                    prev.text += " " + cue.text;
                    prev.end = std::max(prev.end, cue.end);
                    continue;
                }
                prev.end = cue.start;
            } else if (cue.start - prev.end < m_config.minGap) {
                prev.end = cue.start;
            }
        }
        resolved.push_back(cue);
    }

    std::vector<SubtitleCue> clipped;
    for (auto cue : resolved) {
        if (cue.start >= videoDuration) break;
        cue.end = std::min(cue.end, videoDuration);
        if (cue.end - cue.start < 0.001) continue;
        clipped.push_back(cue);
    }

    logInfo("Aligned " + std::to_string(clipped.size()) + " caption cues from " +
            std::to_string(transcript.size()) + " transcript segments");
    return clipped;
}

std::string SubtitleAligner::buildBurnCommand(const std::string& videoPath, const std::string& captionPath,
                                              const std::string& outputPath) const {
    std::ostringstream vf;
    vf << "subtitles=filename=" << escapeFilterValue(captionPath)
       << ":force_style=" << escapeFilterValue(buildForceStyle(m_config.style));

    std::ostringstream cmd;
    cmd << quoteArg(m_ffmpegPath) << " -hide_banner -loglevel error"
        << " -i " << quoteArg(videoPath);
    if (m_config.embedSoftTrack) {
        cmd << " -i " << quoteArg(captionPath)
            << " -map 0:v:0 -map 0:a? -map 1:s:0 -c:s mov_text";
    }
    cmd << " -vf " << quoteArg(vf.str())
        << " -c:v " << m_output.videoCodec
        << " -preset " << m_output.preset
        << " -crf " << m_output.crf
        << " -pix_fmt yuv420p -c:a copy"
        << " -y " << quoteArg(outputPath);
    return cmd.str();
}

Reel SubtitleAligner::burn(const std::string& videoPath, double videoDuration,
                           const std::vector<SubtitleCue>& cues,
                           const std::string& outputPath, const std::string& captionPath) const {
    TRACE_FUNC();
    Reel reel;
    reel.videoPath = outputPath;
    reel.duration = videoDuration;
    reel.cueCount = cues.size();

    auto degrade = [&](const std::string& note) {
        logWarn("Captions not burned: " + note);
        std::string error;
        if (!copyVideo(videoPath, outputPath, error)) {
            throw RenderError("Cannot write reel video " + outputPath + ": " + error);
        }
        reel.captionsBurned = false;
        reel.captionNote = note;
        return reel;
    };

    try {
        writeSrt(cues, captionPath);
        reel.captionPath = captionPath;
    } catch (const AlignmentError& e) {
        return degrade(e.what());
    }

    if (!m_config.burnIn) {
        return degrade("burn-in disabled");
    }
    if (cues.empty()) {
        return degrade("no caption cues");
    }

    try {
        for (const auto& cue : cues) {
            if (!isBurnableText(cue.text)) {
                throw AlignmentError("caption text is not valid UTF-8 or holds control characters");
            }
        }

        std::string cmd = buildBurnCommand(videoPath, captionPath, outputPath);
        std::error_code ec;
        fs::remove(outputPath, ec);
        std::string output;
        int exitCode = m_runner->run(cmd, output);
        appendCommandLog(kCommandLog, "burnSubtitles", cmd, exitCode, output);
        if (exitCode != 0 || !fs::exists(outputPath, ec)) {
            throw AlignmentError("subtitle burn failed (exit " + std::to_string(exitCode) + ")");
        }
    } catch (const AlignmentError& e) {
        return degrade(e.what());
    }

    reel.captionsBurned = true;
    logInfo("Burned " + std::to_string(cues.size()) + " captions into " + outputPath);
    return reel;
}

} // namespace ReelSync
