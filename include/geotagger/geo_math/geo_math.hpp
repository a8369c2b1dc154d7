#pragma once

#include <geotagger/types/position.hpp>

namespace geotagger
{

constexpr double EARTH_RADIUS_METERS = 6371000.0;

// haversine great-circle distance, elevation is ignored
double distance(const Position &a, const Position &b);

double distance(double latitude1, double longitude1, double latitude2, double longitude2);

} // namespace geotagger
