#pragma once

#include "PipelineOrchestrator.h"
#include "ProgressChannel.h"
#include "ReelConfig.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ReelSync {

/**
 * @brief Snapshot of one job for pollers
 */
struct JobStatus {
    std::string jobId;
    PipelineState state = PipelineState::Init;
    bool finished = false;
    std::optional<ProgressEvent> latest;
    std::optional<PipelineResult> result;   // set once finished
};

/**
 * @brief Host-owned map from job id to its run
 *
 * Each submitted job gets its own worker thread, progress channel and cancellation
 * token. At most one run per job id is in flight; finished jobs stay pollable for
 * jobs.retentionSeconds. Expired jobs are purged at the start of every submit();
 * long-lived hosts that stop submitting can call purgeExpired() themselves.
 */
class JobRegistry {
public:
    explicit JobRegistry(const ReelConfig& config,
                         PipelineServices services = PipelineServices::defaults());

    // Cancels every running job and joins the workers
    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    /**
     * @brief Start a run on a new worker thread
     * @param observer Called on the worker thread for every progress event (may be empty)
     * @throws JobConflictError if a run for request.jobId is still in flight
     * @throws ConfigError if the job id is empty
     */
    void submit(const PipelineRequest& request, ProgressChannel::Callback observer = nullptr);

    std::optional<JobStatus> status(const std::string& jobId) const;

    // Request cancellation; false if the job is unknown or already finished
    bool cancel(const std::string& jobId);

    /**
     * @brief Block until the job finishes
     * @return Its result, or nullopt for an unknown job id
     */
    std::optional<PipelineResult> wait(const std::string& jobId);

    // Drop finished jobs older than the retention window; returns the number removed
    size_t purgeExpired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    size_t activeCount() const;
    size_t size() const;

private:
    struct Job {
        std::string id;
        std::shared_ptr<ProgressChannel> channel;
        CancellationToken token;
        std::unique_ptr<PipelineOrchestrator> orchestrator;
        std::thread worker;
        bool finished = false;
        std::optional<PipelineResult> result;
        std::chrono::steady_clock::time_point finishedAt;
    };

    ReelConfig m_config;
    PipelineServices m_services;

    mutable std::mutex m_mutex;
    std::condition_variable m_finishedCv;
    std::map<std::string, std::shared_ptr<Job>> m_jobs;

    void runJob(std::shared_ptr<Job> job, PipelineRequest request);
};

} // namespace ReelSync
