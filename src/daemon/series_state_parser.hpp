#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace matchwatch {

// GraphQL document for one live series-state request. The player type and
// inventory field vary between schema revisions, so both are injected.
std::string buildSeriesStateQuery(const std::string &playerType,
                                  const std::string &inventoryField);

// Picks the best equipped item (equipped count, then quantity, then name).
// Falls back to the first named item when nothing is equipped.
std::optional<std::string> extractWeaponFromInventory(const nlohmann::json &inventory);

// Builds a Snapshot from the `seriesState` object of a response. Uses the first
// game that has at least one player. Returns std::nullopt for malformed input
// or when no game carries players.
std::optional<Snapshot> parseSeriesState(const nlohmann::json &seriesState,
                                         const std::string &inventoryField,
                                         std::chrono::system_clock::time_point capturedAt);

} // namespace matchwatch
