#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace matchwatch {

// Shared stop signal for the worker loops. Loops check it at the top of every
// iteration and sleep through waitFor() so a stop request wakes them at once.
class CancellationToken {
public:
    void requestStop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopRequested = true;
        }
        m_cv.notify_all();
    }

    bool stopRequested() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stopRequested;
    }

    // Returns true when stop was requested before the timeout elapsed.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_stopRequested; });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_stopRequested = false;
};

} // namespace matchwatch
