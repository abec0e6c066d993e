#include "vision/event_debouncer.hpp"

namespace matchwatch {

EventDebouncer::EventDebouncer(std::chrono::milliseconds cooldown)
    : m_cooldown(cooldown)
{
}

bool EventDebouncer::isActionable(VisualLabel label)
{
    return label == VisualLabel::Kill || label == VisualLabel::Death
        || label == VisualLabel::RoundEnd;
}

bool EventDebouncer::shouldSurface(VisualLabel label, TimePoint now)
{
    if (!isActionable(label)) {
        return true;
    }

    const auto it = m_lastSurfaced.find(label);
    if (it != m_lastSurfaced.end() && now - it->second <= m_cooldown) {
        return false;
    }
    m_lastSurfaced[label] = now;
    return true;
}

void EventDebouncer::reset()
{
    m_lastSurfaced.clear();
}

} // namespace matchwatch
