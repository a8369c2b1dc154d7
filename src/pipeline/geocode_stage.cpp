#include <geotagger/pipeline/geocode_stage.hpp>

#include <geotagger/metadata/gps_tags.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace
{
void setIfPresent(geotagger::WorkItem &item, const char *tag, const std::string &value)
{
    if (!value.empty())
    {
        item.set(tag, value);
    }
}
} // namespace

namespace geotagger
{

GeocodeStage::GeocodeStage(std::unique_ptr<LocationResolver> resolver, bool overwrite, size_t queue_capacity)
    : PipelineStage("geocode", queue_capacity), _resolver(std::move(resolver)), _overwrite(overwrite)
{
    if (_resolver == nullptr)
    {
        throw std::invalid_argument("GeocodeStage requires a resolver");
    }
}

std::optional<WorkItem> GeocodeStage::transform(WorkItem item)
{
    std::optional<Position> position = currentPosition(item);
    if (!position.has_value())
    {
        spdlog::debug("[{}] {} has no position to look up", name(), item.identity());
        return item;
    }

    if (!_overwrite && item.contains(tags::CITY) && item.contains(tags::PROVINCE_STATE) &&
        item.contains(tags::COUNTRY_NAME))
    {
        return item;
    }

    PlaceInfo info = _resolver->resolve(*position);

    setIfPresent(item, tags::CITY, info.city);
    setIfPresent(item, tags::PROVINCE_STATE, info.province);
    setIfPresent(item, tags::COUNTRY_NAME, info.country_name);
    setIfPresent(item, tags::COUNTRY_CODE, info.country_code);
    setIfPresent(item, tags::TIME_ZONE, info.timezone);

    spdlog::debug("[{}] {} is in {}, {}, {}", name(), item.identity(), info.city, info.province, info.country_name);
    return item;
}

} // namespace geotagger
