#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace geotagger
{

// Paces outbound calls to at most `requests_per_hour` on average. Not threadsafe, owned by a single worker.
class RateLimiter
{
  public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;
    using NowFunction = std::function<TimePoint()>;
    using SleepFunction = std::function<void(Duration)>;

    // slowest supported pace, one request a year
    static constexpr double MIN_REQUESTS_PER_HOUR = 1.0 / (365 * 24);

    // requests_per_hour <= 0 disables throttling, non-finite rates or positive ones below
    // MIN_REQUESTS_PER_HOUR throw std::invalid_argument
    explicit RateLimiter(double requests_per_hour);
    RateLimiter(double requests_per_hour, NowFunction now, SleepFunction sleep);

    // blocks until the next call is allowed, then records it as issued
    void acquire();

    bool enabled() const
    {
        return _interval.count() > 0;
    }

    Duration interval() const
    {
        return _interval;
    }

  private:
    Duration _interval;
    NowFunction _now;
    SleepFunction _sleep;
    std::optional<TimePoint> _last_call;
};

} // namespace geotagger
