#pragma once

#include <geotagger/geocode/country_fields.hpp>

#include <string>

namespace geotagger
{

// {"default": {"city": "city", "province": "state"}, "overrides": {"United Kingdom": {"city": .., "province": ..}}}
// Entries present in the file replace those in `table`, the rest are kept.
bool parseCountryFieldTable(const std::string &json, CountryFieldTable &table);
bool loadCountryFieldTable(const std::string &path, CountryFieldTable &table);

} // namespace geotagger
