#include <geotagger/pipeline/augment_stage.hpp>

#include <geotagger/metadata/gps_tags.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

namespace geotagger
{

void augment(WorkItem &item, const AugmentationRow &row)
{
    if (row.latitude.has_value() || row.longitude.has_value() || row.elevation.has_value())
    {
        std::optional<Position> existing = currentPosition(item);
        if (!existing.has_value() && !(row.latitude.has_value() && row.longitude.has_value()))
        {
            spdlog::warn("Partial position for {} and no position to merge into, keeping only its place names",
                         item.identity());
        }
        else
        {
            Position merged = existing.value_or(Position{});
            if (row.latitude.has_value())
                merged.latitude = *row.latitude;
            if (row.longitude.has_value())
                merged.longitude = *row.longitude;
            if (row.elevation.has_value())
                merged.elevation = *row.elevation;

            // written so that NaN fails too
            if (!(merged.latitude >= -90 && merged.latitude <= 90) ||
                !(merged.longitude >= -180 && merged.longitude <= 180) ||
                (merged.elevation.has_value() && !std::isfinite(*merged.elevation)))
            {
                throw std::runtime_error("augmented position out of range");
            }

            if (!existing.has_value() || merged != *existing)
            {
                item.position = merged;
                writePosition(item, merged);
            }
        }
    }

    if (row.city.has_value())
        item.set(tags::CITY, *row.city);
    if (row.province.has_value())
        item.set(tags::PROVINCE_STATE, *row.province);
    if (row.country.has_value())
        item.set(tags::COUNTRY_NAME, *row.country);
}

AugmentStage::AugmentStage(AugmentationTable table, size_t queue_capacity)
    : PipelineStage("augment", queue_capacity), _table(std::move(table))
{
    spdlog::info("Augmenting from {} prior rows", _table.size());
}

std::optional<WorkItem> AugmentStage::transform(WorkItem item)
{
    auto iter = _table.find(item.identity());
    if (iter != _table.end())
    {
        augment(item, iter->second);
        spdlog::debug("[{}] merged prior row into {}", name(), item.identity());
    }
    return item;
}

} // namespace geotagger
