#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/event_sink.hpp"

namespace matchwatch {

/**
 * TacticalEventDetector turns change events into tactical events and
 * human-readable conclusions.
 *
 * The event log is never trimmed here; consumers drain it with
 * clearEventLog() once they have read it. Conclusions are deduplicated by
 * exact text.
 */
class TacticalEventDetector
{
public:
    static constexpr std::size_t kExposedCount = 5;
    static constexpr const char *kFirstDeath = "FIRST_DEATH";

    explicit TacticalEventDetector(DetectorConfig config, EventSink *sink = nullptr);

    void processChange(const ChangeEvent &change, const Snapshot &current);

    // Most recent last.
    std::vector<std::string> tacticalConclusions(std::size_t limit = kExposedCount) const;
    std::vector<TacticalEvent> latestEvents(std::size_t limit = kExposedCount) const;

    std::size_t eventLogSize() const;
    void clearEventLog();

private:
    void handlePlayerDied(const ChangeEvent &change, const Snapshot &current);
    void handleWeaponChange(const ChangeEvent &change);
    void addConclusion(const std::string &text);

    DetectorConfig m_config;
    EventSink *m_sink = nullptr;

    mutable std::mutex m_mutex;
    std::vector<TacticalEvent> m_eventLog;
    std::vector<std::string> m_conclusions;
    std::set<std::string> m_seenConclusions;
};

} // namespace matchwatch
