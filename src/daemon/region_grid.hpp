#pragma once

#include <optional>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace matchwatch {

struct MapBounds {
    double minX = 0.0;
    double maxX = 0.0;
    double minY = 0.0;
    double maxY = 0.0;
};

struct Coordinate {
    double x = 0.0;
    double y = 0.0;
};

constexpr int kRegionGridSize = 8;

// Ratio of current to max health. Missing or zero max health is Unknown.
HealthBucket healthBucket(std::optional<double> current, std::optional<double> maximum);
ArmorBucket armorBucket(std::optional<double> armor);

// Bounds over every known coordinate in one game. Degenerate spans are widened
// by one unit so binning never divides by zero.
std::optional<MapBounds> computeBounds(const std::vector<Coordinate> &coordinates);

// Fills region ("R<row>C<col>"), bands and compass quadrant. Everything stays
// "Unknown" when the coordinate or the bounds are missing.
Position regionLabels(std::optional<double> x,
                      std::optional<double> y,
                      const std::optional<MapBounds> &bounds,
                      int gridSize = kRegionGridSize);

} // namespace matchwatch
