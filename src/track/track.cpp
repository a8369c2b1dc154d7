#include <geotagger/track/track.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <tuple>

namespace
{
using namespace geotagger;

auto sortKey(const TimestampedPoint &p)
{
    // absent elevation sorts before any present one
    const double elevation = p.position.elevation.value_or(-std::numeric_limits<double>::infinity());
    return std::make_tuple(p.timestamp, p.position.latitude, p.position.longitude, p.position.elevation.has_value(),
                           elevation);
}
} // namespace

namespace geotagger
{

Track Track::build(std::vector<TimestampedPoint> points)
{
    const size_t raw_size = points.size();

    std::stable_sort(points.begin(), points.end(), [](const TimestampedPoint &a, const TimestampedPoint &b) {
        return sortKey(a) < sortKey(b);
    });
    points.erase(std::unique(points.begin(), points.end()), points.end());

    if (points.size() != raw_size)
    {
        spdlog::debug("Removed {} duplicate track points", raw_size - points.size());
    }

    return Track(std::move(points));
}

Bracket Track::bracket(const Timestamp &ts) const
{
    if (_points.empty())
    {
        throw EmptyTrackError();
    }

    auto after = std::upper_bound(_points.begin(), _points.end(), ts,
                                  [](const Timestamp &t, const TimestampedPoint &p) { return t < p.timestamp; });

    if (after == _points.begin())
    {
        return Bracket{_points.front(), _points.front(), true};
    }
    if (after == _points.end())
    {
        return Bracket{_points.back(), _points.back(), true};
    }
    return Bracket{*(after - 1), *after, false};
}

const TimestampedPoint &Track::front() const
{
    if (_points.empty())
    {
        throw EmptyTrackError();
    }
    return _points.front();
}

const TimestampedPoint &Track::back() const
{
    if (_points.empty())
    {
        throw EmptyTrackError();
    }
    return _points.back();
}

double Track::timeSpan() const
{
    if (_points.empty())
    {
        return 0;
    }
    return secondsBetween(_points.front().timestamp, _points.back().timestamp);
}

} // namespace geotagger
