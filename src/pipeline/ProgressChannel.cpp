#include "ProgressChannel.h"
#include "utils/DebugLogger.h"

#include <exception>

namespace ReelSync {

void ProgressChannel::publish(ProgressEvent event) {
    if (event.time.time_since_epoch().count() == 0) {
        event.time = std::chrono::system_clock::now();
    }

    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
        callbacks = m_callbacks;
    }

    // Outside the lock so a callback may poll the channel
    for (const auto& cb : callbacks) {
        try {
            cb(event);
        } catch (const std::exception& e) {
            logWarn(std::string("Progress observer threw: ") + e.what());
        }
    }
}

std::optional<ProgressEvent> ProgressChannel::latest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) return std::nullopt;
    return m_events.back();
}

std::vector<ProgressEvent> ProgressChannel::history() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

bool ProgressChannel::isFinished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_events.empty() && m_events.back().terminal;
}

void ProgressChannel::subscribe(Callback callback) {
    if (!callback) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.push_back(std::move(callback));
}

void CancellationToken::throwIfCancelled(const std::string& where) const {
    if (isCancelled()) {
        throw CancelledError("Run cancelled before " + where);
    }
}

} // namespace ReelSync
