#pragma once

#include <geotagger/geocode/country_fields.hpp>
#include <geotagger/geocode/place_lookup.hpp>
#include <geotagger/geocode/rate_limiter.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace geotagger
{

struct PlaceInfo
{
    std::string country_code;
    std::string country_name;
    std::string city;
    std::string province;
    std::string timezone;
};

struct ResolverOptions
{
    // requests per hour, 0 for unthrottled
    double throttle_rate = 0;
    CountryFieldTable fields = CountryFieldTable::standard();
};

// Caches reverse geocoding results for the life of the run. Single threaded, owned by the geocode stage.
class LocationResolver
{
  public:
    LocationResolver(std::shared_ptr<PlaceLookup> lookup, ResolverOptions options);
    LocationResolver(std::shared_ptr<PlaceLookup> lookup, ResolverOptions options, RateLimiter limiter);

    PlaceInfo resolve(const Position &position);

    size_t outboundCalls() const
    {
        return _outbound_calls;
    }
    size_t cacheSize() const
    {
        return _locations.size();
    }

  private:
    std::shared_ptr<PlaceLookup> _lookup;
    CountryFieldTable _fields;
    RateLimiter _limiter;

    std::map<std::pair<double, double>, std::pair<LocationRecord, std::string>> _locations;
    std::map<std::string, std::string> _country_names;
    size_t _outbound_calls = 0;
};

} // namespace geotagger
