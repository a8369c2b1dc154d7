#pragma once

#include <geotagger/types/position.hpp>

#include <map>
#include <string>

namespace geotagger
{

struct LocationRecord
{
    std::string country_code;

    // address components keyed by field name, e.g. "city", "state", "county"
    std::map<std::string, std::string> locality;
};

// Reverse geocoding service. Implementations throw std::runtime_error on service faults.
class PlaceLookup
{
  public:
    virtual ~PlaceLookup() = default;

    virtual LocationRecord location(double latitude, double longitude) = 0;
    virtual std::string countryName(const std::string &country_code) = 0;
    virtual std::string timezone(const Position &position) = 0;
};

} // namespace geotagger
