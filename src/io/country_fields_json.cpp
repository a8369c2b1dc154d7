#include <geotagger/io/country_fields_json.hpp>

#include <spdlog/spdlog.h>

#define RAPIDJSON_HAS_STDSTRING 1
#include <rapidjson/document.h>

#include <fstream>
#include <optional>
#include <sstream>

namespace
{
std::optional<geotagger::LocalityFields> readFields(const rapidjson::Value &json)
{
    if (!json.IsObject() || !json.HasMember("city") || !json.HasMember("province") || !json["city"].IsString() ||
        !json["province"].IsString())
    {
        return std::nullopt;
    }
    return geotagger::LocalityFields{json["city"].GetString(), json["province"].GetString()};
}
} // namespace

namespace geotagger
{

bool parseCountryFieldTable(const std::string &json, CountryFieldTable &table)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
    {
        spdlog::error("Failed to parse country field JSON: error at offset {}", doc.GetErrorOffset());
        return false;
    }
    if (!doc.IsObject())
    {
        spdlog::error("Country field table has invalid structure");
        return false;
    }

    CountryFieldTable result = table;
    if (doc.HasMember("default"))
    {
        auto fields = readFields(doc["default"]);
        if (!fields.has_value())
        {
            spdlog::error("Country field table default needs city and province");
            return false;
        }
        result.setDefault(*fields);
    }

    if (doc.HasMember("overrides"))
    {
        if (!doc["overrides"].IsObject())
        {
            spdlog::error("Country field table overrides must be an object");
            return false;
        }
        for (auto iter = doc["overrides"].MemberBegin(); iter != doc["overrides"].MemberEnd(); ++iter)
        {
            auto fields = readFields(iter->value);
            if (!fields.has_value())
            {
                spdlog::error("Country field override for {} needs city and province", iter->name.GetString());
                return false;
            }
            result.setOverride(iter->name.GetString(), *fields);
        }
    }

    table = std::move(result);
    return true;
}

bool loadCountryFieldTable(const std::string &path, CountryFieldTable &table)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::warn("Country field table not found at: {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseCountryFieldTable(buffer.str(), table))
    {
        return false;
    }
    spdlog::info("Loaded country field table with {} overrides", table.overrideCount());
    return true;
}

} // namespace geotagger
