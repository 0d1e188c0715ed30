#pragma once

#include "utils/Errors.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief One progress record; the final record of a run has terminal = true
 */
struct ProgressEvent {
    std::string stage;
    double percent = 0.0;
    std::string message;

    bool terminal = false;
    bool success = false;
    std::string artifactPath;      // success: the reel video
    std::string failedStage;       // failure: stage that raised
    ErrorKind errorKind = ErrorKind::None;

    std::chrono::system_clock::time_point time;
};

/**
 * @brief Single-writer, multi-reader event log for one pipeline run
 *
 * Readers poll latest()/history() from any thread or subscribe a callback.
 * Callbacks run on the writer's thread.
 */
class ProgressChannel {
public:
    using Callback = std::function<void(const ProgressEvent&)>;

    ProgressChannel() = default;
    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Append an event (stamped with the current time if unset) and notify subscribers
    void publish(ProgressEvent event);

    std::optional<ProgressEvent> latest() const;
    std::vector<ProgressEvent> history() const;
    bool isFinished() const;

    void subscribe(Callback callback);

private:
    mutable std::mutex m_mutex;
    std::vector<ProgressEvent> m_events;
    std::vector<Callback> m_callbacks;
};

/**
 * @brief Shared cancellation flag; copies observe the same state
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

    /**
     * @throws CancelledError if cancellation was requested
     */
    void throwIfCancelled(const std::string& where) const;

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace ReelSync
