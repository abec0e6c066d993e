#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace matchwatch {

// Plain-text views handed to the advisory layer.
std::string statsSummary(const std::optional<Snapshot> &snapshot);
std::string roundStatus(const std::optional<Snapshot> &snapshot);
std::string conclusionsText(const std::vector<std::string> &conclusions);

// "Snapshot <i> (<timestamp>):" blocks, one "  - <id>: HP=.., Weapon=.., Alive=.."
// line per player.
std::string renderHistoryText(const std::vector<HistoryEntry> &entries);

} // namespace matchwatch
