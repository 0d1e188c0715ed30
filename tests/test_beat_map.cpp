#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "audio/BeatMap.h"
#include <vector>

using namespace ReelSync;

TEST_CASE("BeatMap::fromOnsets sorts, trims and enforces spacing", "[beatmap]") {
    std::vector<double> onsets = {2.0, 0.0, 1.0, 1.2, 1.0, 5.0, 3.0};
    BeatMap map = BeatMap::fromOnsets(onsets, 4.0, 0.5);

    REQUIRE(map.getBeats() == std::vector<double>{1.0, 2.0, 3.0});
    CHECK(map.isValid());
    CHECK_FALSE(map.isFallback());
    CHECK(map.getBPM() == Catch::Approx(60.0));
    CHECK(map.getAudioDuration() == 4.0);
}

TEST_CASE("BeatMap keeps the first beat of a cluster", "[beatmap][spacing]") {
    BeatMap map = BeatMap::fromOnsets({1.0, 1.3, 1.6, 2.1}, 5.0, 0.5);
    // 1.3 is too close to 1.0; 1.6 is far enough from the kept 1.0
    REQUIRE(map.getBeats() == std::vector<double>{1.0, 1.6, 2.1});
    for (size_t i = 1; i < map.getNumBeats(); ++i) {
        CHECK(map.getBeatAt(i) - map.getBeatAt(i - 1) >= 0.5 - 1e-9);
    }
}

TEST_CASE("BeatMap::uniform spaces beats at the fallback tempo", "[beatmap][fallback]") {
    BeatMap map = BeatMap::uniform(10.0, 120.0, 0.5);
    REQUIRE(map.getNumBeats() == 19);
    CHECK(map.getBeatAt(0) == Catch::Approx(0.5));
    CHECK(map.getBeats().back() == Catch::Approx(9.5));
    CHECK(map.isFallback());
    CHECK(map.isValid());
    CHECK(map.getBPM() == Catch::Approx(120.0));
}

TEST_CASE("BeatMap::uniform never spaces beats closer than the floor", "[beatmap][fallback]") {
    BeatMap map = BeatMap::uniform(3.0, 240.0, 0.5);
    REQUIRE(map.getNumBeats() == 5);
    CHECK(map.getBPM() == Catch::Approx(120.0));
    CHECK(map.isValid());
}

TEST_CASE("BeatMap::uniform on a very short track still has one beat", "[beatmap][fallback][edge]") {
    BeatMap map = BeatMap::uniform(0.4, 120.0, 0.5);
    REQUIRE(map.getNumBeats() == 1);
    CHECK(map.getBeatAt(0) == Catch::Approx(0.2));
}

TEST_CASE("BeatMap boundaries anchor to the track start and end", "[beatmap]") {
    BeatMap map = BeatMap::fromOnsets({1.0, 2.0, 3.0}, 4.0, 0.5);
    CHECK(map.getBoundaries() == std::vector<double>{0.0, 1.0, 2.0, 3.0, 4.0});
    CHECK(map.getBoundaries(2) == std::vector<double>{0.0, 2.0, 4.0});
}

TEST_CASE("Empty BeatMap has no tempo", "[beatmap][edge]") {
    BeatMap map;
    CHECK(map.isEmpty());
    CHECK(map.getBPM() == 0.0);
    CHECK(map.getAverageBeatInterval() == 0.0);
    CHECK(map.getBeatAt(3) == 0.0);
}
