#include "daemon/snapshot_summary.hpp"

#include <algorithm>
#include <sstream>

#include "common/json_utils.hpp"

namespace matchwatch {

namespace {

std::size_t countAlive(const Snapshot &snapshot)
{
    return static_cast<std::size_t>(std::count_if(
        snapshot.players.begin(), snapshot.players.end(),
        [](const auto &entry) { return entry.second.alive; }));
}

} // namespace

std::string statsSummary(const std::optional<Snapshot> &snapshot)
{
    if (!snapshot.has_value()) {
        return "No live data available for stats.";
    }

    std::ostringstream out;
    out << "Snapshot (Game: " << snapshot->gameId << "): " << countAlive(*snapshot) << "/"
        << snapshot->players.size() << " players alive.";

    const auto firstAlive = std::find_if(
        snapshot->players.begin(), snapshot->players.end(),
        [](const auto &entry) { return entry.second.alive; });
    if (firstAlive != snapshot->players.end()) {
        const PlayerState &player = firstAlive->second;
        out << " Example: " << player.name << " is at " << player.position.region
            << " with " << player.weapon.value_or("unknown weapon") << ".";
    }
    return out.str();
}

std::string roundStatus(const std::optional<Snapshot> &snapshot)
{
    if (!snapshot.has_value()) {
        return "No live data available for round status.";
    }
    return "Round Status: " + std::to_string(countAlive(*snapshot))
        + " players alive. Game ID: " + snapshot->gameId + ".";
}

std::string conclusionsText(const std::vector<std::string> &conclusions)
{
    if (conclusions.empty()) {
        return "No significant tactical events logged yet.";
    }
    std::string text;
    for (const auto &conclusion : conclusions) {
        if (!text.empty()) {
            text += '\n';
        }
        text += conclusion;
    }
    return text;
}

std::string renderHistoryText(const std::vector<HistoryEntry> &entries)
{
    if (entries.empty()) {
        return "No data history available.";
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const HistoryEntry &entry = entries[i];
        out << "Snapshot " << i << " (" << toIso8601Utc(entry.timestamp) << "):\n";
        for (const auto &[id, record] : entry.players) {
            out << "  - " << id << ": HP=" << record.hpBucket
                << ", Weapon=" << record.weapon.value_or("none")
                << ", Alive=" << (record.alive ? "true" : "false") << "\n";
        }
    }
    return out.str();
}

} // namespace matchwatch
