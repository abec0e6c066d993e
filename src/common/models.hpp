#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "common/enums.hpp"

namespace matchwatch {

struct Position {
    std::optional<double> x;
    std::optional<double> y;
    std::string region = "Unknown";
    std::string xBand = "Unknown";
    std::string yBand = "Unknown";
    std::string quadrant = "Unknown";
};

struct PlayerState {
    std::string id;
    std::string name;
    std::string teamName;
    std::string side;
    std::string agent;
    bool alive = false;
    HealthBucket hpBucket = HealthBucket::Unknown;
    ArmorBucket armorBucket = ArmorBucket::Unknown;
    std::optional<std::string> weapon;
    Position position;
};

// One poll result for a single game. Never mutated after the fetcher builds it.
struct Snapshot {
    std::string seriesId;
    std::string gameId;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, PlayerState> players;
};

struct ChangeEvent {
    ChangeKind kind;
    PlayerState player;
    // Only meaningful for ChangeKind::WeaponChange.
    std::optional<std::string> oldWeapon;
    std::string newWeapon;
};

struct TacticalEvent {
    std::string eventType;
    std::chrono::system_clock::time_point timestamp;
    std::string description;
    std::map<std::string, std::string> metadata;
};

struct VisualEvent {
    VisualLabel label;
    std::chrono::system_clock::time_point timestamp;
    std::string detail;
};

// Simplified projection of a Snapshot as written to the history file.
struct HistoryEntry {
    struct PlayerRecord {
        bool alive = false;
        std::string hpBucket;
        std::optional<std::string> weapon;
    };

    std::string seriesId;
    std::string gameId;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, PlayerRecord> players;
};

} // namespace matchwatch
