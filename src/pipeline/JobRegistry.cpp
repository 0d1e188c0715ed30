#include "JobRegistry.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <exception>
#include <vector>

namespace ReelSync {

JobRegistry::JobRegistry(const ReelConfig& config, PipelineServices services)
    : m_config(config)
    , m_services(std::move(services))
{
}

JobRegistry::~JobRegistry() {
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_jobs) {
            entry.second->token.cancel();
            jobs.push_back(entry.second);
        }
    }
    for (auto& job : jobs) {
        if (job->worker.joinable()) {
            job->worker.join();
        }
    }
}

void JobRegistry::submit(const PipelineRequest& request, ProgressChannel::Callback observer) {
    if (request.jobId.empty()) {
        throw ConfigError("Job id must not be empty");
    }

    // Expired records are dropped on every submission so hosts need no timer
    purgeExpired();

    std::shared_ptr<Job> previous;
    auto job = std::make_shared<Job>();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(request.jobId);
        if (it != m_jobs.end()) {
            if (!it->second->finished) {
                throw JobConflictError("Job " + request.jobId + " already has a run in flight");
            }
            previous = it->second;
        }

        job->id = request.jobId;
        job->channel = std::make_shared<ProgressChannel>();
        if (observer) {
            job->channel->subscribe(std::move(observer));
        }
        job->orchestrator = std::make_unique<PipelineOrchestrator>(m_config, m_services);
        m_jobs[request.jobId] = job;
        job->worker = std::thread(&JobRegistry::runJob, this, job, request);
    }

    // The earlier run is finished; reap its thread outside the lock
    if (previous && previous->worker.joinable()) {
        previous->worker.join();
    }
    logInfo("Submitted job " + request.jobId);
}

void JobRegistry::runJob(std::shared_ptr<Job> job, PipelineRequest request) {
    PipelineResult result;
    try {
        result = job->orchestrator->run(request, *job->channel, job->token);
    } catch (const std::exception& e) {
        // run() reports pipeline failures itself; this is a bug in a collaborator
        logError("Job " + job->id + " crashed: " + e.what());
        result.state = PipelineState::Failed;
        result.errorKind = ErrorKind::Internal;
        result.error = e.what();

        ProgressEvent failed;
        failed.stage = stateName(PipelineState::Failed);
        failed.percent = 100.0;
        failed.message = e.what();
        failed.terminal = true;
        failed.failedStage = stateName(job->orchestrator->getState());
        failed.errorKind = ErrorKind::Internal;
        job->channel->publish(failed);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        job->result = result;
        job->finished = true;
        job->finishedAt = std::chrono::steady_clock::now();
    }
    m_finishedCv.notify_all();
    logInfo("Job " + job->id + " finished: " + stateName(result.state));
}

std::optional<JobStatus> JobRegistry::status(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return std::nullopt;

    const Job& job = *it->second;
    JobStatus s;
    s.jobId = job.id;
    s.finished = job.finished;
    s.state = job.finished && job.result ? job.result->state : job.orchestrator->getState();
    s.latest = job.channel->latest();
    s.result = job.result;
    return s;
}

bool JobRegistry::cancel(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end() || it->second->finished) return false;
    it->second->token.cancel();
    logInfo("Cancellation requested for job " + jobId);
    return true;
}

std::optional<PipelineResult> JobRegistry::wait(const std::string& jobId) {
    std::shared_ptr<Job> job;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(jobId);
        if (it == m_jobs.end()) return std::nullopt;
        job = it->second;
        m_finishedCv.wait(lock, [&job] { return job->finished; });
    }
    return job->result;
}

size_t JobRegistry::purgeExpired(std::chrono::steady_clock::time_point now) {
    const auto retention = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(m_config.jobs.retentionSeconds));

    std::vector<std::shared_ptr<Job>> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_jobs.begin(); it != m_jobs.end();) {
            if (it->second->finished && now - it->second->finishedAt >= retention) {
                expired.push_back(it->second);
                it = m_jobs.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& job : expired) {
        if (job->worker.joinable()) job->worker.join();
    }
    if (!expired.empty()) {
        logDebug("Purged " + std::to_string(expired.size()) + " expired jobs");
    }
    return expired.size();
}

size_t JobRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (const auto& entry : m_jobs) {
        if (!entry.second->finished) ++n;
    }
    return n;
}

size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

} // namespace ReelSync
