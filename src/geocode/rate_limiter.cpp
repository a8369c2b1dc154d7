#include <geotagger/geocode/rate_limiter.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>

namespace
{
geotagger::RateLimiter::Duration intervalFor(double requests_per_hour)
{
    if (!std::isfinite(requests_per_hour))
    {
        throw std::invalid_argument("throttle rate must be finite");
    }
    if (requests_per_hour <= 0)
    {
        return geotagger::RateLimiter::Duration::zero();
    }
    if (requests_per_hour < geotagger::RateLimiter::MIN_REQUESTS_PER_HOUR)
    {
        throw std::invalid_argument("throttle rate " + std::to_string(requests_per_hour) +
                                    " is below one request a year");
    }
    return std::chrono::duration_cast<geotagger::RateLimiter::Duration>(
        std::chrono::duration<double>(3600.0 / requests_per_hour));
}
} // namespace

namespace geotagger
{

RateLimiter::RateLimiter(double requests_per_hour)
    : RateLimiter(
          requests_per_hour, [] { return std::chrono::steady_clock::now(); },
          [](Duration d) { std::this_thread::sleep_for(d); })
{
}

RateLimiter::RateLimiter(double requests_per_hour, NowFunction now, SleepFunction sleep)
    : _interval(intervalFor(requests_per_hour)), _now(std::move(now)), _sleep(std::move(sleep))
{
}

void RateLimiter::acquire()
{
    if (!enabled())
    {
        return;
    }

    if (_last_call.has_value())
    {
        const TimePoint allowed = *_last_call + _interval;
        TimePoint now = _now();
        while (now < allowed)
        {
            const Duration wait = allowed - now;
            spdlog::debug("Throttling lookup for {:.2f}s", std::chrono::duration<double>(wait).count());
            _sleep(wait);
            now = _now();
        }
    }
    _last_call = _now();
}

} // namespace geotagger
