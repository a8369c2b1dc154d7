#pragma once

#include <map>
#include <string>

namespace geotagger
{

// which locality fields carry the city and province equivalents
struct LocalityFields
{
    std::string city;
    std::string province;

    bool operator==(const LocalityFields &other) const
    {
        return city == other.city && province == other.province;
    }
};

class CountryFieldTable
{
  public:
    CountryFieldTable();
    explicit CountryFieldTable(LocalityFields default_fields);

    // built-in defaults with overrides for countries whose address model differs
    static CountryFieldTable standard();

    void setDefault(LocalityFields fields);
    void setOverride(const std::string &country_name, LocalityFields fields);

    // override for the country if there is one, otherwise the default
    const LocalityFields &lookup(const std::string &country_name) const;

    const LocalityFields &defaultFields() const
    {
        return _default;
    }
    size_t overrideCount() const
    {
        return _overrides.size();
    }

  private:
    LocalityFields _default;
    std::map<std::string, LocalityFields> _overrides;
};

} // namespace geotagger
