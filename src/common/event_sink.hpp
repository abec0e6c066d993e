#pragma once

#include "common/models.hpp"

namespace matchwatch {

// Boundary where both sensor channels hand events to their consumers.
// Implementations are called from the worker threads and must be thread-safe.
class EventSink
{
public:
    virtual ~EventSink() = default;

    virtual void publishTacticalEvent(const TacticalEvent &event) = 0;
    virtual void publishVisualEvent(const VisualEvent &event) = 0;
};

} // namespace matchwatch
