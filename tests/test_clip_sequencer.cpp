#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "video/ClipSequencer.h"
#include "utils/Errors.h"
#include <cmath>
#include <set>
#include <vector>

using namespace ReelSync;

static VideoClip makeClip(const std::string& id, double duration) {
    VideoClip clip;
    clip.id = id;
    clip.keyword = id;
    clip.path = "/clips/" + id + ".mp4";
    clip.duration = duration;
    clip.width = 1920;
    clip.height = 1080;
    clip.fps = 30.0;
    return clip;
}

static std::vector<VideoClip> fourTenSecondClips() {
    return {makeClip("a#1", 10.0), makeClip("b#1", 10.0), makeClip("c#1", 10.0), makeClip("d#1", 10.0)};
}

static BeatMap tenBeats() {
    std::vector<double> beats = {2.5, 5.1, 7.9, 10.4, 13.0, 15.6, 18.2, 21.0, 24.3, 27.7};
    return BeatMap::fromOnsets(beats, 30.0, 0.5);
}

TEST_CASE("30 s track with 10 beats and 4 clips yields 11 segments", "[sequencer][scenario]") {
    SequencerConfig config;
    config.seed = 42;
    ClipSequencer sequencer(config);
    Timeline timeline = sequencer.sequence(tenBeats(), fourTenSecondClips());

    REQUIRE(timeline.size() == 11);
    CHECK(std::abs(timeline.getTotalDuration() - 30.0) <= timeline.getFrameDuration());

    // Round-robin assignment, offsets inside the clip
    const auto& segments = timeline.getSegments();
    for (size_t i = 0; i < segments.size(); ++i) {
        CHECK(segments[i].clip.id == fourTenSecondClips()[i % 4].id);
        CHECK(segments[i].offset >= 0.0);
        CHECK(segments[i].offset + segments[i].duration <= segments[i].clip.duration + 1e-9);
        CHECK_FALSE(segments[i].looped);
    }
    CHECK_NOTHROW(timeline.validate());
}

TEST_CASE("Segment boundaries are the beats themselves", "[sequencer]") {
    ClipSequencer sequencer;
    Timeline timeline = sequencer.sequence(tenBeats(), fourTenSecondClips());
    std::vector<double> expected = {0.0, 2.5, 5.1, 7.9, 10.4, 13.0, 15.6, 18.2, 21.0, 24.3, 27.7, 30.0};
    auto bounds = timeline.getBoundaries();
    REQUIRE(bounds.size() == expected.size());
    for (size_t i = 0; i < bounds.size(); ++i) {
        CHECK(bounds[i] == Catch::Approx(expected[i]).margin(1e-9));
    }
}

TEST_CASE("Same seed gives identical timelines", "[sequencer][determinism]") {
    SequencerConfig config;
    config.seed = 1234;
    Timeline a = ClipSequencer(config).sequence(tenBeats(), fourTenSecondClips());
    Timeline b = ClipSequencer(config).sequence(tenBeats(), fourTenSecondClips());

    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a.getSegments()[i].timelineStart == b.getSegments()[i].timelineStart);
        CHECK(a.getSegments()[i].duration == b.getSegments()[i].duration);
        CHECK(a.getSegments()[i].offset == b.getSegments()[i].offset);
    }

    config.seed = 99;
    Timeline c = ClipSequencer(config).sequence(tenBeats(), fourTenSecondClips());
    CHECK(c.getBoundaries() == a.getBoundaries());
}

TEST_CASE("Reused clips get distinct trim offsets", "[sequencer][reuse]") {
    SequencerConfig config;
    config.seed = 7;
    ClipSequencer sequencer(config);
    std::vector<VideoClip> pool = {makeClip("only#1", 20.0)};
    Timeline timeline = sequencer.sequence(tenBeats(), pool);

    std::vector<double> offsets;
    for (const auto& seg : timeline.getSegments()) {
        for (double prev : offsets) {
            CHECK(std::abs(seg.offset - prev) >= timeline.getFrameDuration());
        }
        offsets.push_back(seg.offset);
    }
}

TEST_CASE("Clips shorter than their interval are looped", "[sequencer][loop]") {
    ClipSequencer sequencer;
    BeatMap map = BeatMap::fromOnsets({6.0}, 8.0, 0.5);
    Timeline timeline = sequencer.sequence(map, {makeClip("short#1", 1.5)});

    REQUIRE(timeline.size() == 2);
    CHECK(timeline.getSegments()[0].looped);
    CHECK(timeline.getSegments()[0].offset == 0.0);
    CHECK(timeline.getSegments()[1].looped);
    CHECK(timeline.getTotalDuration() == Catch::Approx(8.0));
}

TEST_CASE("Beat divisor cuts on every Nth beat", "[sequencer][divisor]") {
    SequencerConfig config;
    config.beatDivisor = 2;
    Timeline timeline = ClipSequencer(config).sequence(tenBeats(), fourTenSecondClips());
    REQUIRE(timeline.size() == 6);
    CHECK(timeline.getBoundaries().front() == 0.0);
    CHECK(timeline.getBoundaries().back() == Catch::Approx(30.0));
}

TEST_CASE("Beats within a frame of either end are not cut points", "[sequencer][edge]") {
    ClipSequencer sequencer;
    BeatMap map = BeatMap::fromOnsets({0.01, 2.0, 3.99}, 4.0, 0.5);
    auto bounds = sequencer.computeBoundaries(map);
    CHECK(bounds == std::vector<double>{0.0, 2.0, 4.0});
}

TEST_CASE("Sequencer errors", "[sequencer][errors]") {
    ClipSequencer sequencer;
    CHECK_THROWS_AS(sequencer.sequence(tenBeats(), {}), NotFoundError);
    CHECK_THROWS_AS(sequencer.sequence(BeatMap(), fourTenSecondClips()), TimelineError);
}

TEST_CASE("Timeline::validate catches broken invariants", "[timeline]") {
    VideoClip clip = makeClip("a#1", 5.0);
    Segment first;
    first.clip = clip;
    first.duration = 2.0;
    Segment second;
    second.clip = clip;
    second.timelineStart = 2.0;
    second.duration = 2.0;

    CHECK_NOTHROW(Timeline({first, second}, 4.0, 30.0).validate());
    CHECK_THROWS_AS(Timeline({}, 4.0, 30.0).validate(), TimelineError);
    CHECK_THROWS_AS(Timeline({first, second}, 4.5, 30.0).validate(), TimelineError);

    Segment gap = second;
    gap.timelineStart = 2.5;
    CHECK_THROWS_AS(Timeline({first, gap}, 4.5, 30.0).validate(), TimelineError);

    Segment overrun = second;
    overrun.offset = 3.5;
    CHECK_THROWS_AS(Timeline({first, overrun}, 4.0, 30.0).validate(), TimelineError);

    Segment badLoop = second;
    badLoop.looped = true;
    badLoop.offset = 1.0;
    CHECK_THROWS_AS(Timeline({first, badLoop}, 4.0, 30.0).validate(), TimelineError);
}

TEST_CASE("unitInterval stays in [0, 1)", "[sequencer][rng]") {
    std::mt19937_64 rng(5);
    for (int i = 0; i < 1000; ++i) {
        double u = unitInterval(rng);
        REQUIRE(u >= 0.0);
        REQUIRE(u < 1.0);
    }
}
