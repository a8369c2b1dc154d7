#include <geotagger/geocode/country_fields.hpp>

namespace geotagger
{

CountryFieldTable::CountryFieldTable() : _default{"city", "state"}
{
}

CountryFieldTable::CountryFieldTable(LocalityFields default_fields) : _default(std::move(default_fields))
{
}

CountryFieldTable CountryFieldTable::standard()
{
    CountryFieldTable table;
    table.setOverride("United Kingdom", {"city", "county"});
    table.setOverride("Ireland", {"city", "county"});
    table.setOverride("France", {"city", "region"});
    table.setOverride("Italy", {"city", "region"});
    table.setOverride("Spain", {"city", "province"});
    table.setOverride("Netherlands", {"town", "province"});
    table.setOverride("Japan", {"city", "province"});
    return table;
}

void CountryFieldTable::setDefault(LocalityFields fields)
{
    _default = std::move(fields);
}

void CountryFieldTable::setOverride(const std::string &country_name, LocalityFields fields)
{
    _overrides[country_name] = std::move(fields);
}

const LocalityFields &CountryFieldTable::lookup(const std::string &country_name) const
{
    auto iter = _overrides.find(country_name);
    if (iter != _overrides.end())
    {
        return iter->second;
    }
    return _default;
}

} // namespace geotagger
