#include "daemon/tactical_event_detector.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "common/logging.hpp"

namespace matchwatch {

namespace {

template <typename T>
std::vector<T> lastN(const std::vector<T> &items, std::size_t limit)
{
    const std::size_t count = std::min(limit, items.size());
    return std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(count), items.end());
}

std::size_t aliveCount(const Snapshot &snapshot)
{
    return static_cast<std::size_t>(std::count_if(
        snapshot.players.begin(), snapshot.players.end(),
        [](const auto &entry) { return entry.second.alive; }));
}

} // namespace

TacticalEventDetector::TacticalEventDetector(DetectorConfig config, EventSink *sink)
    : m_config(std::move(config))
    , m_sink(sink)
{
}

void TacticalEventDetector::processChange(const ChangeEvent &change, const Snapshot &current)
{
    switch (change.kind) {
    case ChangeKind::PlayerDied:
        handlePlayerDied(change, current);
        break;
    case ChangeKind::WeaponChange:
        handleWeaponChange(change);
        break;
    }
}

void TacticalEventDetector::handlePlayerDied(const ChangeEvent &change, const Snapshot &current)
{
    // Compares against every player in the snapshot, so a player missing from
    // the feed counts as neither alive nor dead.
    const std::size_t total = current.players.size();
    if (total == 0 || aliveCount(current) != total - 1) {
        return;
    }

    const PlayerState &player = change.player;
    TacticalEvent event;
    event.eventType = kFirstDeath;
    event.timestamp = std::chrono::system_clock::now();
    event.description = "First death of the round: " + player.name + " (" + player.teamName + ")";
    event.metadata = {
        {"player", player.name},
        {"team", player.teamName},
        {"position", player.position.region + " (" + player.position.quadrant + ")"},
        {"side", player.side}
    };

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_eventLog.push_back(event);
    }

    MWLOG_INFO(QStringLiteral("TacticalEventDetector"),
               QStringLiteral("processChange"),
               QStringLiteral("tactical_event"),
               QStringLiteral("first_death"),
               QStringLiteral("alive_count"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"eventType", event.eventType},
                               {"metadata", event.metadata}}));

    if (m_sink) {
        m_sink->publishTacticalEvent(event);
    }

    addConclusion("Entry engagement lost by " + player.teamName + " at "
                  + player.position.region + ".");
}

void TacticalEventDetector::handleWeaponChange(const ChangeEvent &change)
{
    if (m_config.premiumWeapons.count(change.newWeapon) == 0) {
        return;
    }
    addConclusion(change.player.name + " upgraded to " + change.newWeapon
                  + ". Strength increased.");
}

void TacticalEventDetector::addConclusion(const std::string &text)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_seenConclusions.insert(text).second) {
            return;
        }
        m_conclusions.push_back(text);
    }

    MWLOG_INFO(QStringLiteral("TacticalEventDetector"),
               QStringLiteral("addConclusion"),
               QStringLiteral("tactical_conclusion"),
               QStringLiteral("new_insight"),
               QStringLiteral("dedup_by_text"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"conclusion", text}}));
}

std::vector<std::string> TacticalEventDetector::tacticalConclusions(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lastN(m_conclusions, limit);
}

std::vector<TacticalEvent> TacticalEventDetector::latestEvents(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lastN(m_eventLog, limit);
}

std::size_t TacticalEventDetector::eventLogSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_eventLog.size();
}

void TacticalEventDetector::clearEventLog()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_eventLog.clear();
}

} // namespace matchwatch
