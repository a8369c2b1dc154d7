#pragma once

#include <geotagger/geocode/place_lookup.hpp>

#include <jk/KDTree.h>

#include <map>
#include <string>
#include <vector>

namespace geotagger
{

struct GazetteerPlace
{
    double latitude = 0;
    double longitude = 0;
    std::string timezone;
    LocationRecord record;
};

/*
 * Offline reverse geocoder: the nearest known place by great-circle distance.
 * Places are indexed by their unit vector on the sphere, chord length orders the same as arc length.
 * JSON layout:
 * {"version": 1,
 *  "places": [{"latitude": .., "longitude": .., "country_code": "..", "timezone": "..", "locality": {..}}],
 *  "countries": {"ZA": "South Africa"}}
 */
class GazetteerPlaceLookup final : public PlaceLookup
{
  public:
    GazetteerPlaceLookup() = default;

    bool load(const std::string &path);
    bool parse(const std::string &json);

    void addPlace(GazetteerPlace place);
    void addCountry(const std::string &code, const std::string &name);

    size_t size() const
    {
        return _places.size();
    }

    // location and timezone throw std::runtime_error on an empty gazetteer
    LocationRecord location(double latitude, double longitude) override;
    std::string countryName(const std::string &country_code) override;
    std::string timezone(const Position &position) override;

  private:
    const GazetteerPlace &nearest(double latitude, double longitude) const;

    std::vector<GazetteerPlace> _places;
    jk::tree::KDTree<size_t, 3> _placeLocations;
    std::map<std::string, std::string> _countries;
};

} // namespace geotagger
