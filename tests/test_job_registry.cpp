#include <catch2/catch_test_macros.hpp>
#include "pipeline/JobRegistry.h"
#include "utils/Errors.h"
#include "test_helpers.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>

using namespace ReelSync;
using ReelSync::testing::FakeMediaProbe;
using ReelSync::testing::RecordingCommandRunner;
using ReelSync::testing::TempDir;
using ReelSync::testing::makeClickTrack;

namespace {

// Services whose audio loading blocks until release() so a run stays in flight
struct GatedServices {
    TempDir dir{"jobs"};
    std::shared_ptr<RecordingCommandRunner> runner = std::make_shared<RecordingCommandRunner>();
    std::shared_ptr<FakeMediaProbe> probe = std::make_shared<FakeMediaProbe>();
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> started{0};

    GatedServices() {
        probe->byFileName["silent.mp4"] = probe->withDuration(4.0);
        std::filesystem::create_directories(dir.path() / "clips");
        dir.touch("clips/forest_1.mp4");
        dir.touch("clips/forest_2.mp4");
        dir.touch("narration.wav", "RIFF");
    }

    ~GatedServices() { release(); }

    void release() {
        if (!m_released) {
            m_released = true;
            gate.set_value();
        }
    }

    PipelineServices services() {
        PipelineServices s;
        s.runner = runner;
        s.probe = probe;
        std::shared_future<void> wait = opened;
        std::atomic<int>* counter = &started;
        s.loadAudio = [wait, counter](const std::string& path) {
            ++*counter;
            wait.wait();
            return AudioTrack(makeClickTrack({1.0, 2.0, 3.0}, 22050, 4.0), 22050, 1, path);
        };
        return s;
    }

    PipelineRequest request(const std::string& jobId) const {
        PipelineRequest r;
        r.jobId = jobId;
        r.narrationPath = dir.file("narration.wav");
        r.clipDirectory = dir.file("clips");
        r.outputDirectory = dir.file("out_" + jobId);
        r.seed = 3;
        return r;
    }

    void waitUntilStarted(int count) const {
        while (started.load() < count) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

private:
    bool m_released = false;
};

ReelConfig testConfig() {
    ReelConfig config;
    config.output.ffmpegPath = "ffmpeg";
    return config;
}

} // namespace

TEST_CASE("A second run for an in-flight job is rejected", "[jobs][conflict]") {
    GatedServices gated;
    JobRegistry registry(testConfig(), gated.services());

    registry.submit(gated.request("reel-a"));
    gated.waitUntilStarted(1);

    CHECK_THROWS_AS(registry.submit(gated.request("reel-a")), JobConflictError);
    CHECK_NOTHROW(registry.submit(gated.request("reel-b")));
    CHECK(registry.activeCount() == 2);

    auto status = registry.status("reel-a");
    REQUIRE(status);
    CHECK_FALSE(status->finished);
    CHECK(status->state == PipelineState::AnalyzingAudio);

    gated.release();
    auto a = registry.wait("reel-a");
    auto b = registry.wait("reel-b");
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a->success);
    CHECK(b->success);
    CHECK(registry.activeCount() == 0);

    // Finished jobs can be run again
    CHECK_NOTHROW(registry.submit(gated.request("reel-a")));
    auto again = registry.wait("reel-a");
    REQUIRE(again);
    CHECK(again->success);
}

TEST_CASE("Observers receive every event of their job", "[jobs][progress]") {
    GatedServices gated;
    gated.release();
    JobRegistry registry(testConfig(), gated.services());

    std::atomic<int> events{0};
    std::atomic<bool> sawTerminal{false};
    registry.submit(gated.request("observed"), [&](const ProgressEvent& e) {
        ++events;
        if (e.terminal) sawTerminal = true;
    });
    auto result = registry.wait("observed");
    REQUIRE(result);
    CHECK(sawTerminal);
    CHECK(events >= 6);

    auto status = registry.status("observed");
    REQUIRE(status);
    CHECK(status->finished);
    CHECK(status->state == PipelineState::Done);
    REQUIRE(status->latest);
    CHECK(status->latest->terminal);
}

TEST_CASE("Cancelling a job stops it at the next stage", "[jobs][cancel]") {
    GatedServices gated;
    JobRegistry registry(testConfig(), gated.services());

    registry.submit(gated.request("cancel-me"));
    gated.waitUntilStarted(1);
    CHECK(registry.cancel("cancel-me"));
    gated.release();

    auto result = registry.wait("cancel-me");
    REQUIRE(result);
    CHECK_FALSE(result->success);
    CHECK(result->errorKind == ErrorKind::Cancelled);
    CHECK(result->failedStage == "ANALYZING_AUDIO");
    CHECK_FALSE(registry.cancel("cancel-me"));
    CHECK_FALSE(registry.cancel("unknown"));
}

TEST_CASE("Finished jobs expire after the retention window", "[jobs][retention]") {
    GatedServices gated;
    gated.release();
    ReelConfig config = testConfig();
    config.jobs.retentionSeconds = 60.0;
    JobRegistry registry(config, gated.services());

    registry.submit(gated.request("old"));
    REQUIRE(registry.wait("old"));

    auto now = std::chrono::steady_clock::now();
    CHECK(registry.purgeExpired(now) == 0);
    CHECK(registry.size() == 1);
    CHECK(registry.purgeExpired(now + std::chrono::minutes(2)) == 1);
    CHECK_FALSE(registry.status("old").has_value());
    CHECK_FALSE(registry.wait("old").has_value());
}

TEST_CASE("Concurrent jobs sharing an output directory keep separate artifacts", "[jobs][artifacts]") {
    GatedServices gated;
    JobRegistry registry(testConfig(), gated.services());

    PipelineRequest first = gated.request("job-a");
    PipelineRequest second = gated.request("job-b");
    second.outputDirectory = first.outputDirectory;

    registry.submit(first);
    registry.submit(second);
    gated.waitUntilStarted(2);
    gated.release();

    auto a = registry.wait("job-a");
    auto b = registry.wait("job-b");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a->success);
    REQUIRE(b->success);
    CHECK(a->workDirectory != b->workDirectory);
    CHECK(a->reel.videoPath != b->reel.videoPath);
    CHECK(a->reel.narrationPath != b->reel.narrationPath);
    CHECK(std::filesystem::path(a->reel.videoPath).filename().string().find("job-a") != std::string::npos);
    CHECK(std::filesystem::path(b->reel.videoPath).filename().string().find("job-b") != std::string::npos);
}

TEST_CASE("Submitting a job drops expired records", "[jobs][retention]") {
    GatedServices gated;
    gated.release();
    ReelConfig config = testConfig();
    config.jobs.retentionSeconds = 0.0;
    JobRegistry registry(config, gated.services());

    registry.submit(gated.request("first"));
    REQUIRE(registry.wait("first"));
    CHECK(registry.size() == 1);

    registry.submit(gated.request("second"));
    CHECK_FALSE(registry.status("first").has_value());
    REQUIRE(registry.wait("second"));
    CHECK(registry.size() == 1);
}

TEST_CASE("Job ids are required", "[jobs]") {
    GatedServices gated;
    JobRegistry registry(testConfig(), gated.services());
    CHECK_THROWS_AS(registry.submit(gated.request("")), ConfigError);
}

TEST_CASE("Destroying the registry cancels running jobs", "[jobs][shutdown]") {
    GatedServices gated;
    {
        JobRegistry registry(testConfig(), gated.services());
        registry.submit(gated.request("orphan"));
        gated.waitUntilStarted(1);
        gated.release();
    }
    SUCCEED("registry joined its worker");
}
