#include <geotagger/io/gazetteer.hpp>

#include <spdlog/spdlog.h>

#define RAPIDJSON_HAS_STDSTRING 1
#include <rapidjson/document.h>

#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
std::array<double, 3> toUnitVector(double latitude, double longitude)
{
    const double deg = std::acos(-1.0) / 180;
    const double lat = latitude * deg, lon = longitude * deg;
    return {std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat)};
}
} // namespace

namespace geotagger
{

bool GazetteerPlaceLookup::load(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::warn("Gazetteer not found at: {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool GazetteerPlaceLookup::parse(const std::string &json)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
    {
        spdlog::error("Failed to parse gazetteer JSON: error at offset {}", doc.GetErrorOffset());
        return false;
    }

    if (!doc.IsObject() || !doc.HasMember("version") || !doc["version"].IsInt() || !doc.HasMember("places") ||
        !doc["places"].IsArray())
    {
        spdlog::error("Gazetteer has invalid structure");
        return false;
    }

    int version = doc["version"].GetInt();
    if (version != 1)
    {
        spdlog::error("Unsupported gazetteer version: {}", version);
        return false;
    }

    for (const auto &p : doc["places"].GetArray())
    {
        if (!p.IsObject() || !p.HasMember("latitude") || !p.HasMember("longitude") || !p["latitude"].IsNumber() ||
            !p["longitude"].IsNumber())
        {
            spdlog::warn("Skipping gazetteer place without coordinates");
            continue;
        }

        GazetteerPlace place;
        place.latitude = p["latitude"].GetDouble();
        place.longitude = p["longitude"].GetDouble();
        if (p.HasMember("country_code") && p["country_code"].IsString())
            place.record.country_code = p["country_code"].GetString();
        if (p.HasMember("timezone") && p["timezone"].IsString())
            place.timezone = p["timezone"].GetString();

        if (p.HasMember("locality") && p["locality"].IsObject())
        {
            for (auto iter = p["locality"].MemberBegin(); iter != p["locality"].MemberEnd(); ++iter)
            {
                if (iter->value.IsString())
                {
                    place.record.locality[iter->name.GetString()] = iter->value.GetString();
                }
            }
        }
        _placeLocations.addPoint(toUnitVector(place.latitude, place.longitude), _places.size(), false);
        _places.push_back(std::move(place));
    }
    _placeLocations.splitOutstanding();

    if (doc.HasMember("countries") && doc["countries"].IsObject())
    {
        for (auto iter = doc["countries"].MemberBegin(); iter != doc["countries"].MemberEnd(); ++iter)
        {
            if (iter->value.IsString())
            {
                _countries[iter->name.GetString()] = iter->value.GetString();
            }
        }
    }

    spdlog::info("Loaded gazetteer with {} places and {} countries", _places.size(), _countries.size());
    return true;
}

void GazetteerPlaceLookup::addPlace(GazetteerPlace place)
{
    _placeLocations.addPoint(toUnitVector(place.latitude, place.longitude), _places.size());
    _places.push_back(std::move(place));
}

void GazetteerPlaceLookup::addCountry(const std::string &code, const std::string &name)
{
    _countries[code] = name;
}

const GazetteerPlace &GazetteerPlaceLookup::nearest(double latitude, double longitude) const
{
    if (_places.empty())
    {
        throw std::runtime_error("gazetteer has no places");
    }

    auto found = _placeLocations.search(toUnitVector(latitude, longitude));
    return _places[found.payload];
}

LocationRecord GazetteerPlaceLookup::location(double latitude, double longitude)
{
    return nearest(latitude, longitude).record;
}

std::string GazetteerPlaceLookup::countryName(const std::string &country_code)
{
    auto iter = _countries.find(country_code);
    if (iter == _countries.end())
    {
        // unknown codes are shown as-is
        spdlog::debug("No country name for code {}", country_code);
        return country_code;
    }
    return iter->second;
}

std::string GazetteerPlaceLookup::timezone(const Position &position)
{
    return nearest(position.latitude, position.longitude).timezone;
}

} // namespace geotagger
