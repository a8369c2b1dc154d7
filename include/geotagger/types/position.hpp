#pragma once

#include <geotagger/types/timestamp.hpp>

#include <optional>

namespace geotagger
{

struct Position
{
    double latitude = 0;
    double longitude = 0;
    std::optional<double> elevation;

    bool operator==(const Position &other) const
    {
        return latitude == other.latitude && longitude == other.longitude && elevation == other.elevation;
    }
    bool operator!=(const Position &other) const
    {
        return !(*this == other);
    }
};

struct TimestampedPoint
{
    Position position;
    Timestamp timestamp;

    bool operator==(const TimestampedPoint &other) const
    {
        return timestamp == other.timestamp && position == other.position;
    }
};

} // namespace geotagger
