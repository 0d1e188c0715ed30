#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "subtitles/SubtitleAligner.h"
#include "utils/Errors.h"
#include "test_helpers.h"
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace ReelSync;
using ReelSync::testing::RecordingCommandRunner;
using ReelSync::testing::TempDir;

namespace {

TranscriptSegment segment(const std::string& text, double start, double end) {
    TranscriptSegment seg;
    seg.text = text;
    seg.start = start;
    seg.end = end;
    return seg;
}

OutputSettings testOutput() {
    OutputSettings output;
    output.ffmpegPath = "ffmpeg";
    return output;
}

void requireOrderedAndDisjoint(const std::vector<SubtitleCue>& cues, double videoDuration) {
    for (size_t i = 0; i < cues.size(); ++i) {
        REQUIRE(cues[i].end > cues[i].start);
        REQUIRE(cues[i].end <= videoDuration);
        if (i > 0) {
            REQUIRE(cues[i].start >= cues[i - 1].end);
        }
    }
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Overlapping cues are clipped without losing coverage", "[subtitles][scenario]") {
    SubtitleAligner aligner(SubtitleConfig(), std::make_shared<RecordingCommandRunner>(), testOutput());
    auto cues = aligner.align({segment("hello", 0.0, 2.0), segment("world", 1.5, 3.0)}, 3.0);

    REQUIRE(cues.size() == 2);
    requireOrderedAndDisjoint(cues, 3.0);
    CHECK(cues[0].text == "hello");
    CHECK(cues[0].start == 0.0);
    CHECK(cues[0].end == Catch::Approx(1.5));
    CHECK(cues[1].text == "world");
    CHECK(cues[1].start == Catch::Approx(1.5));
    CHECK(cues[1].end == Catch::Approx(3.0));
}

TEST_CASE("Cues starting almost together are merged", "[subtitles][merge]") {
    SubtitleAligner aligner(SubtitleConfig(), std::make_shared<RecordingCommandRunner>(), testOutput());
    auto cues = aligner.align({segment("first", 0.0, 2.0), segment("second", 0.1, 1.0)}, 5.0);
    REQUIRE(cues.size() == 1);
    CHECK(cues[0].text == "first second");
    CHECK(cues[0].end == Catch::Approx(2.0));
}

TEST_CASE("Short gaps are closed, long silences stay uncaptioned", "[subtitles][gap]") {
    SubtitleAligner aligner(SubtitleConfig(), std::make_shared<RecordingCommandRunner>(), testOutput());
    auto cues = aligner.align({segment("a", 0.0, 1.0), segment("b", 1.05, 2.0), segment("c", 4.0, 5.0)}, 6.0);
    REQUIRE(cues.size() == 3);
    CHECK(cues[0].end == Catch::Approx(1.05));
    CHECK(cues[1].end == Catch::Approx(2.0));
    CHECK(cues[2].start == Catch::Approx(4.0));
}

TEST_CASE("Cues are clipped to the video duration", "[subtitles][clip]") {
    SubtitleAligner aligner(SubtitleConfig(), std::make_shared<RecordingCommandRunner>(), testOutput());
    auto cues = aligner.align({segment("late", 2.5, 4.0), segment("after", 3.2, 3.8), segment("  ", 0.0, 1.0)}, 3.0);
    REQUIRE(cues.size() == 1);
    CHECK(cues[0].end == Catch::Approx(3.0));
    requireOrderedAndDisjoint(cues, 3.0);
}

TEST_CASE("Long segments are split into short cues", "[subtitles][split]") {
    SubtitleAligner aligner(SubtitleConfig(), std::make_shared<RecordingCommandRunner>(), testOutput());

    SECTION("proportional timing without word stamps") {
        auto cues = aligner.splitSegment(segment("one two three four five six seven eight nine ten eleven twelve", 0.0, 6.0));
        REQUIRE(cues.size() == 3);
        CHECK(cues[0].text == "one two three four");
        CHECK(cues[0].end == Catch::Approx(2.0));
        CHECK(cues[2].text == "nine ten eleven twelve");
        CHECK(cues[2].start == Catch::Approx(4.0));
    }

    SECTION("word timestamps are followed when present") {
        TranscriptSegment seg = segment("a b c d e f", 0.0, 6.0);
        const double starts[] = {0.0, 0.5, 1.0, 3.0, 3.5, 5.0};
        const char* words[] = {"a", "b", "c", "d", "e", "f"};
        for (int i = 0; i < 6; ++i) {
            seg.words.push_back({words[i], starts[i], starts[i] + 0.4});
        }
        auto cues = aligner.splitSegment(seg);
        REQUIRE(cues.size() == 2);
        CHECK(cues[0].text == "a b c");
        CHECK(cues[0].end == Catch::Approx(1.4));
        CHECK(cues[1].start == Catch::Approx(3.0));
    }

    SECTION("short segments stay whole") {
        auto cues = aligner.splitSegment(segment("just four words here", 1.0, 2.0));
        REQUIRE(cues.size() == 1);
        CHECK(cues[0].start == 1.0);
        CHECK(cues[0].end == 2.0);
    }
}

TEST_CASE("SRT timestamps", "[subtitles][srt]") {
    CHECK(formatSrtTimestamp(3661.5) == "01:01:01,500");
    CHECK(formatSrtTimestamp(0.0) == "00:00:00,000");

    double t = 0.0;
    REQUIRE(parseSrtTimestamp("00:00:01.250", t));
    CHECK(t == Catch::Approx(1.25));
    REQUIRE(parseSrtTimestamp(" 00:01:02,003 ", t));
    CHECK(t == Catch::Approx(62.003));
    CHECK_FALSE(parseSrtTimestamp("1:2", t));
    CHECK_FALSE(parseSrtTimestamp("00:61:00,000", t));
}

TEST_CASE("SRT text parses and skips malformed blocks", "[subtitles][srt]") {
    std::string text =
        "1\r\n00:00:00,000 --> 00:00:01,500\r\nhello there\r\n\r\n"
        "2\nnot a timing line\nbroken\n\n"
        "3\n00:00:02,000 --> 00:00:03,000\nsecond\nline\n";
    auto cues = parseSrt(text);
    REQUIRE(cues.size() == 2);
    CHECK(cues[0].text == "hello there");
    CHECK(cues[0].end == Catch::Approx(1.5));
    CHECK(cues[1].text == "second\nline");

    CHECK(parseSrt(formatSrt(cues)).size() == 2);
}

TEST_CASE("Transcript files", "[subtitles][srt]") {
    TempDir dir("transcript");
    std::string path = dir.touch("t.srt", "1\n00:00:00,000 --> 00:00:02,000\nhello\nworld\n");
    auto segments = loadTranscriptSrt(path);
    REQUIRE(segments.size() == 1);
    CHECK(segments[0].text == "hello world");

    CHECK_THROWS_AS(loadTranscriptSrt(dir.file("missing.srt")), AlignmentError);
    CHECK_THROWS_AS(writeSrt({}, dir.file("t.srt/nested.srt")), AlignmentError);
}

TEST_CASE("Burnable caption text", "[subtitles][text]") {
    CHECK(isBurnableText("hello world"));
    CHECK(isBurnableText("caf\xC3\xA9"));
    CHECK_FALSE(isBurnableText("bad \xFF byte"));
    CHECK_FALSE(isBurnableText("bell\x07"));
    CHECK_FALSE(isBurnableText("\xC3"));
}

TEST_CASE("Caption style becomes an ASS force_style", "[subtitles][style]") {
    CaptionStyle style;
    std::string fs = buildForceStyle(style);
    CHECK(fs.find("FontName=Arial") != std::string::npos);
    CHECK(fs.find("FontSize=24") != std::string::npos);
    CHECK(fs.find("PrimaryColour=&H00FFFFFF") != std::string::npos);
    CHECK(fs.find("OutlineColour=&H00000000") != std::string::npos);
    CHECK(fs.find("Outline=2") != std::string::npos);
    CHECK(fs.find("MarginV=200") != std::string::npos);

    style.primaryColour = 0x112233;
    CHECK(buildForceStyle(style).find("PrimaryColour=&H00332211") != std::string::npos);

    CHECK(escapeFilterValue("it's") == "'it'\\''s'");
}

TEST_CASE("Burning captions", "[subtitles][burn]") {
    TempDir dir("burn");
    auto runner = std::make_shared<RecordingCommandRunner>();
    std::string video = dir.touch("muxed.mp4", "video bytes");
    std::vector<SubtitleCue> cues = {{0.0, 1.0, "hello"}, {1.0, 2.0, "world"}};
    SubtitleConfig config;

    SECTION("success") {
        SubtitleAligner aligner(config, runner, testOutput());
        Reel reel = aligner.burn(video, 2.0, cues, dir.file("reel.mp4"), dir.file("reel.srt"));
        CHECK(reel.captionsBurned);
        CHECK(reel.cueCount == 2);
        CHECK(reel.captionPath == dir.file("reel.srt"));
        CHECK(readFile(reel.captionPath).find("00:00:01,000 --> 00:00:02,000") != std::string::npos);
        REQUIRE(runner->commands.size() == 1);
        CHECK(runner->commands[0].find("subtitles=filename=") != std::string::npos);
        CHECK(runner->commands[0].find("mov_text") == std::string::npos);
    }

    SECTION("ffmpeg failure degrades to caption file only") {
        runner->failOn.push_back("subtitles=");
        SubtitleAligner aligner(config, runner, testOutput());
        Reel reel = aligner.burn(video, 2.0, cues, dir.file("reel.mp4"), dir.file("reel.srt"));
        CHECK_FALSE(reel.captionsBurned);
        CHECK_FALSE(reel.captionNote.empty());
        CHECK(readFile(reel.videoPath) == "video bytes");
        CHECK(std::filesystem::exists(reel.captionPath));
    }

    SECTION("unburnable text never reaches ffmpeg") {
        SubtitleAligner aligner(config, runner, testOutput());
        cues[1].text = "bad \xFF";
        Reel reel = aligner.burn(video, 2.0, cues, dir.file("reel.mp4"), dir.file("reel.srt"));
        CHECK_FALSE(reel.captionsBurned);
        CHECK(runner->commands.empty());
    }

    SECTION("burn-in disabled") {
        config.burnIn = false;
        SubtitleAligner aligner(config, runner, testOutput());
        Reel reel = aligner.burn(video, 2.0, cues, dir.file("reel.mp4"), dir.file("reel.srt"));
        CHECK_FALSE(reel.captionsBurned);
        CHECK(runner->commands.empty());
        CHECK(std::filesystem::exists(reel.videoPath));
    }

    SECTION("soft track") {
        config.embedSoftTrack = true;
        SubtitleAligner aligner(config, runner, testOutput());
        aligner.burn(video, 2.0, cues, dir.file("reel.mp4"), dir.file("reel.srt"));
        REQUIRE(runner->commands.size() == 1);
        CHECK(runner->commands[0].find("-c:s mov_text") != std::string::npos);
    }
}
