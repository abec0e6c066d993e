#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace matchwatch {

// Single-value cell between one producer and one consumer. put() never
// blocks and overwrites an unconsumed value; consumers only ever see the
// most recent one.
template <typename T>
class LatestFrameSlot {
public:
    // Returns true when an unconsumed value was discarded.
    bool put(T value)
    {
        bool discarded = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            discarded = m_value.has_value();
            if (discarded) {
                ++m_discarded;
            }
            m_value = std::move(value);
        }
        m_cv.notify_one();
        return discarded;
    }

    // Destructive read. Empty when nothing new arrived since the last take.
    std::optional<T> take()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeLocked();
    }

    // Waits up to `timeout` for a value, then takes it.
    template <typename Rep, typename Period>
    std::optional<T> takeFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return m_value.has_value(); });
        return takeLocked();
    }

    // Non-destructive read.
    std::optional<T> peek() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_value;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_value.has_value();
    }

    std::size_t discardedCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_discarded;
    }

private:
    std::optional<T> takeLocked()
    {
        std::optional<T> out = std::move(m_value);
        m_value.reset();
        return out;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<T> m_value;
    std::size_t m_discarded = 0;
};

} // namespace matchwatch
