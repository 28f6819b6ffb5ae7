// CancellationToken.h — Признак отмены pairing сессии

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Adbee {

/// Один токен на сессию discovery. После stop() все задачи сессии видят отмену,
/// ожидания между попытками просыпаются сразу.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cancelled;
    }

    /// Подождать duration
    /// @return false если токен отменён (до или во время ожидания)
    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_cv.wait_for(lock, duration, [this]() { return m_cancelled; });
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancelled = false;
};

} // namespace Adbee
