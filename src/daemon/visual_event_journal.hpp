#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "common/event_sink.hpp"
#include "common/ring_buffer.hpp"

namespace matchwatch {

// In-process EventSink. Keeps a short tail of visual events for the API and
// logs everything that crosses the boundary.
class VisualEventJournal : public EventSink
{
public:
    static constexpr std::size_t kDefaultCapacity = 20;

    explicit VisualEventJournal(std::size_t capacity = kDefaultCapacity);

    void publishTacticalEvent(const TacticalEvent &event) override;
    void publishVisualEvent(const VisualEvent &event) override;

    // Oldest first.
    std::vector<VisualEvent> recentVisualEvents(std::size_t limit = kDefaultCapacity) const;
    std::size_t tacticalEventsPublished() const;

private:
    mutable std::mutex m_mutex;
    RingBuffer<VisualEvent> m_visualEvents;
    std::size_t m_tacticalPublished = 0;
};

} // namespace matchwatch
