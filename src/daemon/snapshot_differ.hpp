#pragma once

#include <optional>
#include <vector>

#include "common/models.hpp"

namespace matchwatch {

class SnapshotDiffer
{
public:
    // Player deaths and weapon changes between two consecutive snapshots.
    // No events without a previous snapshot. Players present in only one of
    // the two snapshots are ignored.
    static std::vector<ChangeEvent> diff(const std::optional<Snapshot> &previous,
                                         const Snapshot &current);
};

} // namespace matchwatch
