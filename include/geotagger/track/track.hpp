#pragma once

#include <geotagger/types/position.hpp>

#include <stdexcept>
#include <vector>

namespace geotagger
{

class EmptyTrackError : public std::runtime_error
{
  public:
    EmptyTrackError() : std::runtime_error("track contains no points")
    {
    }
};

struct Bracket
{
    const TimestampedPoint &prev;
    const TimestampedPoint &next;
    bool is_boundary;
};

class Track
{
  public:
    using const_iterator = std::vector<TimestampedPoint>::const_iterator;

    Track() = default;

    // sorts by time and removes exact duplicates, zero points is allowed
    static Track build(std::vector<TimestampedPoint> points);

    // throws EmptyTrackError on an empty track
    Bracket bracket(const Timestamp &ts) const;

    const TimestampedPoint &front() const;
    const TimestampedPoint &back() const;

    size_t size() const
    {
        return _points.size();
    }
    bool empty() const
    {
        return _points.empty();
    }

    const_iterator begin() const
    {
        return _points.cbegin();
    }
    const_iterator end() const
    {
        return _points.cend();
    }

    // seconds between first and last point
    double timeSpan() const;

  private:
    explicit Track(std::vector<TimestampedPoint> points) : _points(std::move(points))
    {
    }

    std::vector<TimestampedPoint> _points;
};

} // namespace geotagger
