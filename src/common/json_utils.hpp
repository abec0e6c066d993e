#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace matchwatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const auto sinceEpoch = timestamp.time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    out << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis);
    out << 'Z';
    return out.str();
}

// Accepts both second and millisecond precision ("...:SSZ" and "...:SS.mmmZ").
inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        digits = digits.substr(0, 3);
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        millis = std::stoi(digits);
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time) + std::chrono::milliseconds(millis);
}

inline std::string toHealthBucketString(HealthBucket bucket)
{
    switch (bucket) {
    case HealthBucket::Full:
        return "full";
    case HealthBucket::Damaged:
        return "damaged";
    case HealthBucket::Critical:
        return "critical";
    case HealthBucket::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline std::string toArmorBucketString(ArmorBucket bucket)
{
    switch (bucket) {
    case ArmorBucket::None:
        return "none";
    case ArmorBucket::Light:
        return "light";
    case ArmorBucket::Heavy:
        return "heavy";
    case ArmorBucket::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::PlayerDied:
        return "PLAYER_DIED";
    case ChangeKind::WeaponChange:
        return "WEAPON_CHANGE";
    }
    return "PLAYER_DIED";
}

inline std::string toVisualLabelString(VisualLabel label)
{
    switch (label) {
    case VisualLabel::Kill:
        return "KILL";
    case VisualLabel::Death:
        return "DEATH";
    case VisualLabel::RoundEnd:
        return "ROUND_END";
    case VisualLabel::NoEvent:
        return "NO_EVENT";
    case VisualLabel::Error:
        return "ERROR";
    }
    return "NO_EVENT";
}

inline HealthBucket parseHealthBucketString(const std::string &value)
{
    if (value == "full") {
        return HealthBucket::Full;
    }
    if (value == "damaged") {
        return HealthBucket::Damaged;
    }
    if (value == "critical") {
        return HealthBucket::Critical;
    }
    return HealthBucket::Unknown;
}

inline ArmorBucket parseArmorBucketString(const std::string &value)
{
    if (value == "none") {
        return ArmorBucket::None;
    }
    if (value == "light") {
        return ArmorBucket::Light;
    }
    if (value == "heavy") {
        return ArmorBucket::Heavy;
    }
    return ArmorBucket::Unknown;
}

inline VisualLabel parseVisualLabelString(const std::string &value)
{
    if (value == "KILL") {
        return VisualLabel::Kill;
    }
    if (value == "DEATH") {
        return VisualLabel::Death;
    }
    if (value == "ROUND_END") {
        return VisualLabel::RoundEnd;
    }
    if (value == "ERROR") {
        return VisualLabel::Error;
    }
    return VisualLabel::NoEvent;
}

inline nlohmann::json optionalToJson(const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

inline std::optional<std::string> optionalStringFromJson(const nlohmann::json &j,
                                                         const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

inline std::optional<double> optionalNumberFromJson(const nlohmann::json &j,
                                                    const char *key)
{
    if (!j.contains(key) || !j.at(key).is_number()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

inline void to_json(nlohmann::json &j, const HealthBucket &bucket)
{
    j = toHealthBucketString(bucket);
}

inline void from_json(const nlohmann::json &j, HealthBucket &bucket)
{
    bucket = j.is_string() ? parseHealthBucketString(j.get<std::string>())
                           : HealthBucket::Unknown;
}

inline void to_json(nlohmann::json &j, const ArmorBucket &bucket)
{
    j = toArmorBucketString(bucket);
}

inline void from_json(const nlohmann::json &j, ArmorBucket &bucket)
{
    bucket = j.is_string() ? parseArmorBucketString(j.get<std::string>())
                           : ArmorBucket::Unknown;
}

inline void to_json(nlohmann::json &j, const VisualLabel &label)
{
    j = toVisualLabelString(label);
}

inline void from_json(const nlohmann::json &j, VisualLabel &label)
{
    label = j.is_string() ? parseVisualLabelString(j.get<std::string>())
                          : VisualLabel::NoEvent;
}

inline void to_json(nlohmann::json &j, const Position &position)
{
    j = nlohmann::json{
        {"x", position.x.has_value() ? nlohmann::json(*position.x) : nlohmann::json(nullptr)},
        {"y", position.y.has_value() ? nlohmann::json(*position.y) : nlohmann::json(nullptr)},
        {"region_rc", position.region},
        {"x_band", position.xBand},
        {"y_band", position.yBand},
        {"quadrant", position.quadrant}
    };
}

inline void from_json(const nlohmann::json &j, Position &position)
{
    position.x = optionalNumberFromJson(j, "x");
    position.y = optionalNumberFromJson(j, "y");
    position.region = j.value("region_rc", "Unknown");
    position.xBand = j.value("x_band", "Unknown");
    position.yBand = j.value("y_band", "Unknown");
    position.quadrant = j.value("quadrant", "Unknown");
}

inline void to_json(nlohmann::json &j, const PlayerState &player)
{
    j = nlohmann::json{
        {"id", player.id},
        {"name", player.name},
        {"team_name", player.teamName},
        {"side", player.side},
        {"agent", player.agent},
        {"alive", player.alive},
        {"hp_bucket", player.hpBucket},
        {"armor_bucket", player.armorBucket},
        {"weapon", optionalToJson(player.weapon)},
        {"position", player.position}
    };
}

inline void from_json(const nlohmann::json &j, PlayerState &player)
{
    player.id = j.value("id", "");
    player.name = j.value("name", "");
    player.teamName = j.value("team_name", "");
    player.side = j.value("side", "");
    player.agent = j.value("agent", "");
    player.alive = j.value("alive", false);
    player.hpBucket = j.contains("hp_bucket") ? j.at("hp_bucket").get<HealthBucket>()
                                              : HealthBucket::Unknown;
    player.armorBucket = j.contains("armor_bucket") ? j.at("armor_bucket").get<ArmorBucket>()
                                                    : ArmorBucket::Unknown;
    player.weapon = optionalStringFromJson(j, "weapon");
    if (j.contains("position") && j.at("position").is_object()) {
        player.position = j.at("position").get<Position>();
    } else {
        player.position = Position{};
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    nlohmann::json players = nlohmann::json::object();
    for (const auto &[id, player] : snapshot.players) {
        players[id] = player;
    }
    j = nlohmann::json{
        {"series_id", snapshot.seriesId},
        {"game_id", snapshot.gameId},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"players", players}
    };
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.seriesId = j.value("series_id", "");
    snapshot.gameId = j.value("game_id", "");
    snapshot.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    snapshot.players.clear();
    if (j.contains("players") && j.at("players").is_object()) {
        for (const auto &item : j.at("players").items()) {
            snapshot.players[item.key()] = item.value().get<PlayerState>();
        }
    }
}

inline void to_json(nlohmann::json &j, const TacticalEvent &event)
{
    j = nlohmann::json{
        {"event_type", event.eventType},
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"description", event.description},
        {"metadata", event.metadata}
    };
}

inline void from_json(const nlohmann::json &j, TacticalEvent &event)
{
    event.eventType = j.value("event_type", "");
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.description = j.value("description", "");
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        event.metadata = j.at("metadata").get<std::map<std::string, std::string>>();
    } else {
        event.metadata.clear();
    }
}

inline void to_json(nlohmann::json &j, const VisualEvent &event)
{
    j = nlohmann::json{
        {"label", event.label},
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"detail", event.detail}
    };
}

inline void from_json(const nlohmann::json &j, VisualEvent &event)
{
    event.label = j.contains("label") ? j.at("label").get<VisualLabel>()
                                      : VisualLabel::NoEvent;
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.detail = j.value("detail", "");
}

inline void to_json(nlohmann::json &j, const HistoryEntry::PlayerRecord &record)
{
    j = nlohmann::json{
        {"alive", record.alive},
        {"hp_bucket", record.hpBucket},
        {"weapon", optionalToJson(record.weapon)}
    };
}

inline void from_json(const nlohmann::json &j, HistoryEntry::PlayerRecord &record)
{
    record.alive = j.value("alive", false);
    record.hpBucket = j.value("hp_bucket", "unknown");
    record.weapon = optionalStringFromJson(j, "weapon");
}

inline void to_json(nlohmann::json &j, const HistoryEntry &entry)
{
    nlohmann::json players = nlohmann::json::object();
    for (const auto &[id, record] : entry.players) {
        players[id] = record;
    }
    j = nlohmann::json{
        {"series_id", entry.seriesId},
        {"game_id", entry.gameId},
        {"timestamp", toIso8601Utc(entry.timestamp)},
        {"players", players}
    };
}

inline void from_json(const nlohmann::json &j, HistoryEntry &entry)
{
    entry.seriesId = j.value("series_id", "");
    entry.gameId = j.value("game_id", "");
    entry.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    entry.players.clear();
    if (j.contains("players") && j.at("players").is_object()) {
        for (const auto &item : j.at("players").items()) {
            entry.players[item.key()] = item.value().get<HistoryEntry::PlayerRecord>();
        }
    }
}

inline HistoryEntry toHistoryEntry(const Snapshot &snapshot)
{
    HistoryEntry entry;
    entry.seriesId = snapshot.seriesId;
    entry.gameId = snapshot.gameId;
    entry.timestamp = snapshot.timestamp;
    for (const auto &[id, player] : snapshot.players) {
        HistoryEntry::PlayerRecord record;
        record.alive = player.alive;
        record.hpBucket = toHealthBucketString(player.hpBucket);
        record.weapon = player.weapon;
        entry.players[id] = record;
    }
    return entry;
}

} // namespace matchwatch
