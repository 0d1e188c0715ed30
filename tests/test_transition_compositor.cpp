#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "video/TransitionCompositor.h"
#include "utils/Errors.h"
#include "test_helpers.h"
#include <filesystem>
#include <memory>

using namespace ReelSync;
using ReelSync::testing::FakeMediaProbe;
using ReelSync::testing::RecordingCommandRunner;
using ReelSync::testing::TempDir;

namespace {

struct CompositorFixture {
    TempDir dir{"compositor"};
    std::shared_ptr<RecordingCommandRunner> runner = std::make_shared<RecordingCommandRunner>();
    std::shared_ptr<FakeMediaProbe> probe = std::make_shared<FakeMediaProbe>();
    OutputSettings settings;

    CompositorFixture() { settings.ffmpegPath = "ffmpeg"; }

    // Contiguous segments with the given lengths, each from its own clip file
    Timeline timeline(const std::vector<double>& lengths) {
        std::vector<Segment> segments;
        double t = 0.0;
        for (size_t i = 0; i < lengths.size(); ++i) {
            Segment seg;
            seg.clip.id = "clip#" + std::to_string(i);
            seg.clip.path = dir.touch("clip_" + std::to_string(i) + ".mp4");
            seg.clip.duration = 10.0;
            seg.timelineStart = t;
            seg.duration = lengths[i];
            segments.push_back(seg);
            t += lengths[i];
        }
        probe->byFileName["silent.mp4"] = probe->withDuration(t);
        return Timeline(segments, t, 30.0);
    }

    TransitionPlan fadeAt(size_t segments, std::vector<size_t> boundaries, double duration = 0.2) {
        std::vector<TransitionSpec> specs(segments + 1);
        for (size_t k : boundaries) {
            specs[k].style = TransitionStyle::Fade;
            specs[k].duration = duration;
        }
        return TransitionPlan(specs);
    }

    std::string work() const { return dir.file("work"); }
};

} // namespace

TEST_CASE("Segment frames come from frame-rounded boundaries", "[compositor][frames]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({1.0, 1.5, 1.5});
    CHECK(TransitionCompositor::computeSegmentFrames(t, 30) == std::vector<int>{30, 45, 45});
}

TEST_CASE("All-cut plan extracts every segment and concatenates", "[compositor][cut]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({1.0, 1.5, 1.5});
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);

    RenderedVideo video = compositor.compose(t, TransitionPlan::allCuts(3), fx.work());

    CHECK(fx.runner->commands.size() == 4);
    CHECK(fx.runner->countContaining("-frames:v 30 ") == 1);
    CHECK(fx.runner->countContaining("-frames:v 45 ") == 2);
    CHECK(fx.runner->countContaining("-f concat") == 1);
    CHECK(fx.runner->countContaining("crop=1080:1920") == 3);
    CHECK(video.segmentCount == 3);
    CHECK(video.transitionCount == 0);
    CHECK(video.duration == Catch::Approx(4.0));
    CHECK(std::filesystem::exists(video.silentPath));
}

TEST_CASE("Transitions start on their beat", "[compositor][xfade]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({2.0, 2.0, 2.0});
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);

    compositor.compose(t, fx.fadeAt(3, {1}), fx.work());

    // The first segment carries the 6-frame transition tail
    CHECK(fx.runner->countContaining("-frames:v 66 ") == 1);
    CHECK(fx.runner->countContaining("tpad=stop_mode=clone") == 3);
    CHECK(fx.runner->countContaining("xfade=transition=fade:duration=0.200000:offset=2.000000") == 1);
    CHECK(fx.runner->countContaining("concat=n=2:v=1:a=0") == 1);
    CHECK(fx.runner->countContaining("-f concat") == 0);
}

TEST_CASE("Long chains are stitched in batches", "[compositor][batch]") {
    CompositorFixture fx;
    fx.settings.fps = 30;
    TransitionConfig transitions;
    transitions.maxInputsPerPass = 2;
    Timeline t = fx.timeline({2.0, 2.0, 2.0});
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings, transitions);

    RenderedVideo video = compositor.compose(t, fx.fadeAt(3, {1, 2}), fx.work());
    CHECK(fx.runner->countContaining("batch_0001.mp4") >= 1);
    CHECK(video.transitionCount == 2);
}

TEST_CASE("Concat falls back to re-encoding", "[compositor][concat]") {
    CompositorFixture fx;
    fx.runner->failOn.push_back("-c copy");
    Timeline t = fx.timeline({1.0, 1.0});
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);

    CHECK_NOTHROW(compositor.compose(t, TransitionPlan::allCuts(2), fx.work()));
    CHECK(fx.runner->countContaining("-f concat") == 2);
}

TEST_CASE("Compositing failures raise RenderError", "[compositor][errors]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({1.0, 1.0});

    SECTION("source removed after sequencing") {
        std::filesystem::remove(t.getSegments()[1].clip.path);
        TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
        try {
            compositor.compose(t, TransitionPlan::allCuts(2), fx.work());
            FAIL("expected RenderError");
        } catch (const RenderError& e) {
            CHECK(std::string(e.what()).find("unreadable") != std::string::npos);
        }
    }

    SECTION("ffmpeg fails") {
        fx.runner->failOn.push_back("segment_0001");
        TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
        CHECK_THROWS_AS(compositor.compose(t, TransitionPlan::allCuts(2), fx.work()), RenderError);
    }

    SECTION("rendered length drifts") {
        fx.probe->byFileName["silent.mp4"] = fx.probe->withDuration(1.5);
        TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
        CHECK_THROWS_AS(compositor.compose(t, TransitionPlan::allCuts(2), fx.work()), RenderError);
    }

    SECTION("plan does not fit the timeline") {
        TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
        CHECK_THROWS_AS(compositor.compose(t, TransitionPlan::allCuts(5), fx.work()), RenderError);
    }
}

TEST_CASE("Audio is muxed with a stream-copied video", "[compositor][mux]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({1.0, 1.0});
    std::string narration = fx.dir.touch("narration.wav");
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
    RenderedVideo video = compositor.compose(t, TransitionPlan::allCuts(2), fx.work());

    compositor.muxAudio(video, narration, fx.dir.file("muxed.mp4"));
    CHECK(video.muxedPath == fx.dir.file("muxed.mp4"));
    CHECK(fx.runner->countContaining("-c:v copy -c:a aac -b:a 192k") == 1);

    fx.runner->failOn.push_back("-map 1:a:0");
    try {
        compositor.muxAudio(video, narration, fx.dir.file("muxed2.mp4"));
        FAIL("expected RenderError");
    } catch (const RenderError& e) {
        CHECK(std::string(e.what()).find("Audio mux step failed") == 0);
    }
}

TEST_CASE("Progress rises to completion", "[compositor][progress]") {
    CompositorFixture fx;
    Timeline t = fx.timeline({1.0, 1.0, 1.0});
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
    std::vector<double> reports;
    compositor.setProgressCallback([&](double p) { reports.push_back(p); });

    compositor.compose(t, TransitionPlan::allCuts(3), fx.work());
    REQUIRE_FALSE(reports.empty());
    CHECK(reports.front() == 0.0);
    CHECK(reports.back() == 1.0);
    for (size_t i = 1; i < reports.size(); ++i) {
        CHECK(reports[i] >= reports[i - 1]);
    }
}

TEST_CASE("Segment command for looped and trimmed clips", "[compositor][command]") {
    CompositorFixture fx;
    TransitionCompositor compositor(fx.runner, fx.probe, fx.settings);
    Segment seg;
    seg.clip.path = "/clips/beach_1.mp4";
    seg.clip.duration = 5.0;
    seg.offset = 1.5;
    seg.duration = 2.0;

    std::string trimmed = compositor.buildSegmentCommand(seg, 60, 0, "/tmp/out.mp4");
    CHECK(trimmed.find("-ss 1.500000 -i '/clips/beach_1.mp4'") != std::string::npos);
    CHECK(trimmed.find("-stream_loop") == std::string::npos);

    seg.looped = true;
    seg.offset = 0.0;
    std::string looped = compositor.buildSegmentCommand(seg, 60, 0, "/tmp/out.mp4");
    CHECK(looped.find("-stream_loop -1") != std::string::npos);
    CHECK(looped.find("-ss") == std::string::npos);
    CHECK(looped.find("tpad") == std::string::npos);
}
