#include <geotagger/correlate/correlate.hpp>

#include <geotagger/geo_math/geo_math.hpp>

#include <eigen3/Eigen/Core>
#include <spdlog/spdlog.h>

#include <cmath>

namespace geotagger
{

std::optional<Resolved> locate(const Timestamp &ts, const Track &track, const CorrelationOptions &options)
{
    const Bracket b = track.bracket(ts);
    const TimestampedPoint &prev = b.prev;
    const TimestampedPoint &next = b.next;

    // spacing of the bracketing track points, not of the result and the query
    const double distance_m = b.is_boundary ? 0.0 : distance(prev.position, next.position);

    Position position;
    double delta = 0;
    switch (options.policy)
    {
    case CorrelationPolicy::NEAREST: {
        const double to_prev = secondsBetween(prev.timestamp, ts);
        const double to_next = secondsBetween(ts, next.timestamp);
        const TimestampedPoint &chosen = std::abs(to_prev) <= std::abs(to_next) ? prev : next;
        position = chosen.position;
        delta = std::abs(secondsBetween(chosen.timestamp, ts));
        break;
    }
    case CorrelationPolicy::NEXT:
        position = next.position;
        delta = secondsBetween(ts, next.timestamp);
        break;
    case CorrelationPolicy::PREV:
        position = prev.position;
        delta = secondsBetween(prev.timestamp, ts);
        break;
    case CorrelationPolicy::AVERAGE:
        if (b.is_boundary)
        {
            position = prev.position;
        }
        else
        {
            const double w = secondsBetween(prev.timestamp, ts) / secondsBetween(prev.timestamp, next.timestamp);
            const Eigen::Vector2d from(prev.position.latitude, prev.position.longitude);
            const Eigen::Vector2d to(next.position.latitude, next.position.longitude);
            const Eigen::Vector2d interpolated = from + w * (to - from);
            position.latitude = interpolated.x();
            position.longitude = interpolated.y();
            if (prev.position.elevation.has_value() && next.position.elevation.has_value())
            {
                position.elevation = *prev.position.elevation + w * (*next.position.elevation - *prev.position.elevation);
            }
        }
        delta = secondsBetween(prev.timestamp, next.timestamp);
        break;
    }

    const bool distance_ok = distance_m <= options.max_distance_meters;
    const bool delta_ok = delta <= options.max_delta_seconds;

    // clang-format off
    const bool valid = (options.satisfy != SatisfyMode::ALL && (distance_ok || delta_ok)) ||
                       (distance_ok && delta_ok);
    // clang-format on

    if (!valid)
    {
        spdlog::debug("No match at {}: distance {:.1f}m delta {:.1f}s", toIsoString(ts), distance_m, delta);
        return std::nullopt;
    }

    return Resolved{position, distance_m, delta};
}

std::string toString(CorrelationPolicy policy)
{
    switch (policy)
    {
    case CorrelationPolicy::NEAREST:
        return "nearest";
    case CorrelationPolicy::NEXT:
        return "next";
    case CorrelationPolicy::PREV:
        return "prev";
    case CorrelationPolicy::AVERAGE:
        return "average";
    }
    return "Error";
}

std::string toString(SatisfyMode mode)
{
    switch (mode)
    {
    case SatisfyMode::ANY:
        return "any";
    case SatisfyMode::ALL:
        return "all";
    }
    return "Error";
}

std::optional<CorrelationPolicy> parsePolicy(const std::string &name)
{
    for (auto policy :
         {CorrelationPolicy::NEAREST, CorrelationPolicy::NEXT, CorrelationPolicy::PREV, CorrelationPolicy::AVERAGE})
    {
        if (toString(policy) == name)
        {
            return policy;
        }
    }
    return std::nullopt;
}

std::optional<SatisfyMode> parseSatisfyMode(const std::string &name)
{
    for (auto mode : {SatisfyMode::ANY, SatisfyMode::ALL})
    {
        if (toString(mode) == name)
        {
            return mode;
        }
    }
    return std::nullopt;
}

} // namespace geotagger
