#include <geotagger/geocode/location_resolver.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace
{
std::string field(const geotagger::LocationRecord &record, const std::string &name)
{
    auto iter = record.locality.find(name);
    return iter == record.locality.end() ? std::string() : iter->second;
}
} // namespace

namespace geotagger
{

LocationResolver::LocationResolver(std::shared_ptr<PlaceLookup> lookup, ResolverOptions options)
    : LocationResolver(lookup, options, RateLimiter(options.throttle_rate))
{
}

LocationResolver::LocationResolver(std::shared_ptr<PlaceLookup> lookup, ResolverOptions options,
                                   RateLimiter limiter)
    : _lookup(std::move(lookup)), _fields(std::move(options.fields)), _limiter(std::move(limiter))
{
    if (_lookup == nullptr)
    {
        throw std::invalid_argument("LocationResolver requires a place lookup");
    }
}

PlaceInfo LocationResolver::resolve(const Position &position)
{
    const auto key = std::make_pair(position.latitude, position.longitude);

    auto iter = _locations.find(key);
    if (iter == _locations.end())
    {
        _limiter.acquire();
        _outbound_calls++;
        LocationRecord record = _lookup->location(position.latitude, position.longitude);
        std::string timezone = _lookup->timezone(position);
        spdlog::debug("Looked up {},{} -> country {}", position.latitude, position.longitude, record.country_code);
        iter = _locations.emplace(key, std::make_pair(std::move(record), std::move(timezone))).first;
    }
    const LocationRecord &record = iter->second.first;

    auto country_iter = _country_names.find(record.country_code);
    if (country_iter == _country_names.end())
    {
        std::string name = _lookup->countryName(record.country_code);
        country_iter = _country_names.emplace(record.country_code, std::move(name)).first;
    }

    PlaceInfo info;
    info.country_code = record.country_code;
    info.country_name = country_iter->second;
    info.timezone = iter->second.second;

    const LocalityFields &fields = _fields.lookup(info.country_name);
    info.city = field(record, fields.city);
    info.province = field(record, fields.province);
    return info;
}

} // namespace geotagger
