#pragma once

#include <geotagger/track/track.hpp>

#include <optional>
#include <string>

namespace geotagger
{

enum class CorrelationPolicy
{
    NEAREST,
    NEXT,
    PREV,
    AVERAGE
};

enum class SatisfyMode
{
    ANY,
    ALL
};

struct CorrelationOptions
{
    CorrelationPolicy policy = CorrelationPolicy::AVERAGE;
    double max_delta_seconds = 60;
    double max_distance_meters = 100;
    SatisfyMode satisfy = SatisfyMode::ALL;
};

struct Resolved
{
    Position position;
    double distance_meters;
    double delta_seconds;
};

// std::nullopt means the thresholds were not satisfied. Throws EmptyTrackError on an empty track.
std::optional<Resolved> locate(const Timestamp &ts, const Track &track, const CorrelationOptions &options);

std::string toString(CorrelationPolicy policy);
std::string toString(SatisfyMode mode);
std::optional<CorrelationPolicy> parsePolicy(const std::string &name);
std::optional<SatisfyMode> parseSatisfyMode(const std::string &name);

} // namespace geotagger
