#pragma once

#include <chrono>
#include <map>

#include "common/enums.hpp"

namespace matchwatch {

// Per-label cooldown for the actionable labels. NoEvent and Error always pass
// so they keep working as liveness signals.
class EventDebouncer
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit EventDebouncer(std::chrono::milliseconds cooldown);

    // Records `now` as the label's last surfaced time when it returns true.
    bool shouldSurface(VisualLabel label, TimePoint now);
    void reset();

    static bool isActionable(VisualLabel label);

private:
    std::chrono::milliseconds m_cooldown;
    std::map<VisualLabel, TimePoint> m_lastSurfaced;
};

} // namespace matchwatch
