#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace matchwatch {

// Fixed-capacity FIFO. Pushing into a full buffer evicts the oldest element,
// so size() never exceeds capacity().
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : m_capacity(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
        m_items.reserve(capacity);
    }

    void push(T value)
    {
        if (m_items.size() < m_capacity) {
            m_items.push_back(std::move(value));
            return;
        }
        m_items[m_head] = std::move(value);
        m_head = (m_head + 1) % m_capacity;
    }

    std::size_t size() const
    {
        return m_items.size();
    }

    std::size_t capacity() const
    {
        return m_capacity;
    }

    bool empty() const
    {
        return m_items.empty();
    }

    // Element i counted from the oldest.
    const T &at(std::size_t index) const
    {
        if (index >= m_items.size()) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return m_items[(m_head + index) % m_items.size()];
    }

    const T &back() const
    {
        return at(m_items.size() - 1);
    }

    // Oldest first.
    std::vector<T> toVector() const
    {
        std::vector<T> out;
        out.reserve(m_items.size());
        for (std::size_t i = 0; i < m_items.size(); ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    // The newest `count` elements, oldest first.
    std::vector<T> newest(std::size_t count) const
    {
        const std::size_t n = count < m_items.size() ? count : m_items.size();
        std::vector<T> out;
        out.reserve(n);
        for (std::size_t i = m_items.size() - n; i < m_items.size(); ++i) {
            out.push_back(at(i));
        }
        return out;
    }

    void clear()
    {
        m_items.clear();
        m_head = 0;
    }

private:
    std::size_t m_capacity;
    std::size_t m_head = 0;
    std::vector<T> m_items;
};

} // namespace matchwatch
