#include "daemon/region_grid.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace matchwatch {

namespace {

constexpr double kMaxNormalized = 0.999999;

int binIndex(double value, double minValue, double maxValue, int gridSize)
{
    double ratio = 0.0;
    if (std::abs(maxValue - minValue) > 1e-12) {
        ratio = (value - minValue) / (maxValue - minValue);
    }
    // Spans at the edge of the double range overflow to inf and yield NaN.
    if (!std::isfinite(ratio)) {
        ratio = 0.0;
    }
    ratio = std::min(std::max(ratio, 0.0), kMaxNormalized);
    return static_cast<int>(ratio * gridSize);
}

} // namespace

HealthBucket healthBucket(std::optional<double> current, std::optional<double> maximum)
{
    if (!current.has_value() || !maximum.has_value() || *maximum == 0.0) {
        return HealthBucket::Unknown;
    }
    const double ratio = *current / *maximum;
    if (ratio > 0.80) {
        return HealthBucket::Full;
    }
    if (ratio > 0.30) {
        return HealthBucket::Damaged;
    }
    return HealthBucket::Critical;
}

ArmorBucket armorBucket(std::optional<double> armor)
{
    if (!armor.has_value()) {
        return ArmorBucket::Unknown;
    }
    if (*armor <= 0.0) {
        return ArmorBucket::None;
    }
    if (*armor <= 25.0) {
        return ArmorBucket::Light;
    }
    return ArmorBucket::Heavy;
}

std::optional<MapBounds> computeBounds(const std::vector<Coordinate> &coordinates)
{
    if (coordinates.empty()) {
        return std::nullopt;
    }

    MapBounds bounds{coordinates.front().x, coordinates.front().x,
                     coordinates.front().y, coordinates.front().y};
    for (const auto &coordinate : coordinates) {
        bounds.minX = std::min(bounds.minX, coordinate.x);
        bounds.maxX = std::max(bounds.maxX, coordinate.x);
        bounds.minY = std::min(bounds.minY, coordinate.y);
        bounds.maxY = std::max(bounds.maxY, coordinate.y);
    }

    if (std::abs(bounds.maxX - bounds.minX) < 1e-6) {
        bounds.maxX = bounds.minX + 1.0;
    }
    if (std::abs(bounds.maxY - bounds.minY) < 1e-6) {
        bounds.maxY = bounds.minY + 1.0;
    }
    return bounds;
}

Position regionLabels(std::optional<double> x,
                      std::optional<double> y,
                      const std::optional<MapBounds> &bounds,
                      int gridSize)
{
    Position position;
    position.x = x;
    position.y = y;
    if (!x.has_value() || !y.has_value() || !bounds.has_value()) {
        return position;
    }

    const int column = binIndex(*x, bounds->minX, bounds->maxX, gridSize);
    const int row = binIndex(*y, bounds->minY, bounds->maxY, gridSize);

    position.region = "R" + std::to_string(row + 1) + "C" + std::to_string(column + 1);
    position.xBand = "B" + std::to_string(column + 1);
    position.yBand = "B" + std::to_string(row + 1);

    const double midX = (bounds->minX + bounds->maxX) / 2.0;
    const double midY = (bounds->minY + bounds->maxY) / 2.0;
    const bool east = *x >= midX;
    const bool north = *y >= midY;
    if (north) {
        position.quadrant = east ? "NE" : "NW";
    } else {
        position.quadrant = east ? "SE" : "SW";
    }
    return position;
}

} // namespace matchwatch
