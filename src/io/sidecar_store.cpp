#include <geotagger/io/sidecar_store.hpp>

#include <spdlog/spdlog.h>

#define RAPIDJSON_HAS_STDSTRING 1
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void writeValue(Writer &writer, const geotagger::MetadataValue &value)
{
    writer.StartObject();
    std::visit(overloaded{[&](const std::string &text) {
                              writer.Key("type");
                              writer.String("text");
                              writer.Key("value");
                              writer.String(text);
                          },
                          [&](int64_t integer) {
                              writer.Key("type");
                              writer.String("integer");
                              writer.Key("value");
                              writer.Int64(integer);
                          },
                          [&](const geotagger::RationalList &list) {
                              writer.Key("type");
                              writer.String("rationals");
                              writer.Key("value");
                              writer.StartArray();
                              for (const auto &r : list)
                              {
                                  writer.StartArray();
                                  writer.Int64(r.numerator);
                                  writer.Int64(r.denominator);
                                  writer.EndArray();
                              }
                              writer.EndArray();
                          },
                          [&](const geotagger::Timestamp &ts) {
                              writer.Key("type");
                              writer.String("timestamp");
                              writer.Key("value");
                              writer.String(geotagger::toIsoString(ts));
                          }},
               value);
    writer.EndObject();
}

std::optional<geotagger::MetadataValue> readValue(const rapidjson::Value &json)
{
    if (!json.IsObject() || !json.HasMember("type") || !json["type"].IsString() || !json.HasMember("value"))
    {
        return std::nullopt;
    }
    const std::string type = json["type"].GetString();
    const auto &value = json["value"];

    if (type == "text" && value.IsString())
    {
        return geotagger::MetadataValue(std::string(value.GetString()));
    }
    if (type == "integer" && value.IsInt64())
    {
        return geotagger::MetadataValue(value.GetInt64());
    }
    if (type == "rationals" && value.IsArray())
    {
        geotagger::RationalList list;
        for (const auto &r : value.GetArray())
        {
            if (!r.IsArray() || r.Size() != 2 || !r[0].IsInt64() || !r[1].IsInt64())
            {
                return std::nullopt;
            }
            list.push_back({r[0].GetInt64(), r[1].GetInt64()});
        }
        return geotagger::MetadataValue(std::move(list));
    }
    if (type == "timestamp" && value.IsString())
    {
        auto ts = geotagger::parseTimestamp(value.GetString());
        if (ts.has_value())
        {
            return geotagger::MetadataValue(*ts);
        }
    }
    return std::nullopt;
}
} // namespace

namespace geotagger
{

bool toJson(const TagMap &tags, std::string &json)
{
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    writer.SetFormatOptions(rapidjson::PrettyFormatOptions::kFormatSingleLineArray);

    writer.StartObject();
    writer.Key("version");
    writer.Int(1);
    writer.Key("tags");
    writer.StartObject();
    for (const auto &kv : tags)
    {
        writer.Key(kv.first);
        writeValue(writer, kv.second);
    }
    writer.EndObject();
    writer.EndObject();

    if (!writer.IsComplete())
    {
        return false;
    }
    json = buffer.GetString();
    return true;
}

bool fromJson(const std::string &json, TagMap &tags)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
    {
        spdlog::error("Failed to parse sidecar JSON: error at offset {}", doc.GetErrorOffset());
        return false;
    }
    if (!doc.IsObject() || !doc.HasMember("version") || !doc.HasMember("tags") || !doc["tags"].IsObject())
    {
        spdlog::error("Sidecar has invalid structure");
        return false;
    }
    if (!doc["version"].IsInt() || doc["version"].GetInt() != 1)
    {
        spdlog::error("Unsupported sidecar version");
        return false;
    }

    TagMap result;
    for (auto iter = doc["tags"].MemberBegin(); iter != doc["tags"].MemberEnd(); ++iter)
    {
        std::optional<MetadataValue> value = readValue(iter->value);
        if (!value.has_value())
        {
            spdlog::error("Sidecar tag {} is malformed", iter->name.GetString());
            return false;
        }
        result.emplace(iter->name.GetString(), std::move(*value));
    }
    tags = std::move(result);
    return true;
}

SidecarMetadataStore::SidecarMetadataStore(std::string suffix) : _suffix(std::move(suffix))
{
}

std::string SidecarMetadataStore::sidecarPath(const std::string &identity) const
{
    return identity + _suffix;
}

std::optional<TagMap> SidecarMetadataStore::read(const std::string &identity)
{
    const std::string path = sidecarPath(identity);
    std::ifstream file(path);
    if (!file.is_open())
    {
        if (std::filesystem::exists(identity))
        {
            return TagMap{};
        }
        spdlog::warn("Neither {} nor its sidecar exist", identity);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    TagMap tags;
    if (!fromJson(buffer.str(), tags))
    {
        spdlog::warn("Sidecar {} is unreadable", path);
        return std::nullopt;
    }
    return tags;
}

bool SidecarMetadataStore::write(const std::string &identity, const TagMap &tags)
{
    std::string json;
    if (!toJson(tags, json))
    {
        return false;
    }

    // write beside the target, then rename over it
    const std::string path = sidecarPath(identity);
    const std::string temp_path = path + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary);
        if (!out.is_open())
        {
            spdlog::error("Unable to create {}", temp_path);
            return false;
        }
        out << json;
        if (!out)
        {
            spdlog::error("Unable to write {}", temp_path);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec)
    {
        spdlog::error("Unable to replace {}: {}", path, ec.message());
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

} // namespace geotagger
