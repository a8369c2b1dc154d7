#include <geotagger/pipeline/correlate_stage.hpp>

#include <geotagger/metadata/gps_tags.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace geotagger
{

CorrelateStage::CorrelateStage(std::shared_ptr<const Track> track, CorrelateStageOptions options,
                               size_t queue_capacity)
    : PipelineStage("correlate", queue_capacity), _track(std::move(track)), _options(options)
{
    if (_track == nullptr)
    {
        throw std::invalid_argument("CorrelateStage requires a track");
    }
    if (_track->empty())
    {
        spdlog::warn("Track is empty, photos will pass through without correlation");
    }
    spdlog::info("Correlating with policy {} satisfy {} max delta {}s max distance {}m",
                 toString(_options.correlation.policy), toString(_options.correlation.satisfy),
                 _options.correlation.max_delta_seconds, _options.correlation.max_distance_meters);
}

std::optional<WorkItem> CorrelateStage::transform(WorkItem item)
{
    if (!_options.overwrite && currentPosition(item).has_value())
    {
        spdlog::debug("[{}] {} already has a position", name(), item.identity());
        return item;
    }
    if (_track->empty())
    {
        return item;
    }

    Timestamp ts = item.getAs<Timestamp>(tags::DATE_TIME_ORIGINAL);
    ts += std::chrono::duration_cast<Timestamp::duration>(std::chrono::duration<double>(_options.time_offset_seconds));

    std::optional<Resolved> resolved = locate(ts, *_track, _options.correlation);
    if (!resolved.has_value())
    {
        spdlog::info("[{}] no track match for {} at {}", name(), item.identity(), toIsoString(ts));
        return item;
    }

    spdlog::debug("[{}] {} -> {},{} (distance {:.1f}m, delta {:.1f}s)", name(), item.identity(),
                  resolved->position.latitude, resolved->position.longitude, resolved->distance_meters,
                  resolved->delta_seconds);

    item.position = resolved->position;
    writePosition(item, resolved->position);
    return item;
}

} // namespace geotagger
