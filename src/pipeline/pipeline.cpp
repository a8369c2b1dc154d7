#include <geotagger/pipeline/pipeline.hpp>

#include <geotagger/pipeline/geocode_stage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace geotagger
{

Pipeline::Pipeline(PipelineOptions options) : _start(std::chrono::steady_clock::now())
{
    const size_t capacity = options.queue_capacity;

    if (options.augmentation.has_value())
    {
        _stages.emplace_back(new AugmentStage(std::move(*options.augmentation), capacity));
    }

    if (options.track != nullptr)
    {
        if (options.track->empty())
        {
            spdlog::warn("Track has no points, skipping correlation for this run");
        }
        else
        {
            _stages.emplace_back(new CorrelateStage(options.track, options.correlation, capacity));
        }
    }

    if (options.place_lookup != nullptr)
    {
        auto resolver = std::make_unique<LocationResolver>(options.place_lookup, options.resolver);
        _stages.emplace_back(new GeocodeStage(std::move(resolver), options.overwrite_places, capacity));
    }

    _stages.emplace_back(new WriteStage(options.store, options.results, capacity));

    for (size_t i = 0; i + 1 < _stages.size(); i++)
    {
        _stages[i]->connect(*_stages[i + 1]);
    }

    std::string names;
    for (const auto &stage : _stages)
    {
        names += (names.empty() ? "" : " -> ") + stage->name();
        stage->start();
    }
    spdlog::info("Pipeline started: {} (queue capacity {})", names, capacity);
}

Pipeline::~Pipeline()
{
    finish();
}

void Pipeline::submit(WorkItem item)
{
    if (_finished)
    {
        throw std::logic_error("cannot submit " + item.identity() + " to a finished pipeline");
    }
    _stages.front()->input().push(std::move(item));
}

void Pipeline::finish()
{
    if (_finished)
    {
        return;
    }
    _finished = true;

    _stages.front()->input().push(EndOfStream{});

    // the end of stream marker reaches each stage only after every item ahead of it
    for (auto &stage : _stages)
    {
        stage->input().join();
        stage->join();
    }

    _end = std::chrono::steady_clock::now();
    spdlog::info("Pipeline drained in {:.3f}s", elapsedSeconds());
}

std::vector<std::string> Pipeline::stageNames() const
{
    std::vector<std::string> names;
    names.reserve(_stages.size());
    for (const auto &stage : _stages)
    {
        names.push_back(stage->name());
    }
    return names;
}

std::vector<StageSummaryEntry> Pipeline::summary() const
{
    std::vector<StageSummaryEntry> entries;
    entries.reserve(_stages.size());
    for (const auto &stage : _stages)
    {
        entries.push_back({stage->name(), &stage->stats()});
    }
    return entries;
}

double Pipeline::elapsedSeconds() const
{
    const auto end = _finished ? _end : std::chrono::steady_clock::now();
    return std::chrono::duration<double>(end - _start).count();
}

DriveResult drive(Pipeline &pipeline, MetadataStore &store, std::vector<std::string> identities,
                  const std::atomic<bool> &interrupted, const ProgressCallback &progress)
{
    DriveResult result;

    std::sort(identities.begin(), identities.end());
    identities.erase(std::unique(identities.begin(), identities.end()), identities.end());

    for (const auto &identity : identities)
    {
        if (interrupted.load())
        {
            result.interrupted = true;
            spdlog::warn("Interrupted, {} of {} photos submitted, draining", result.submitted, identities.size());
            break;
        }

        std::optional<TagMap> tags = store.read(identity);
        if (!tags.has_value())
        {
            result.unreadable++;
            spdlog::warn("Unable to read metadata for {}, skipping", identity);
            continue;
        }

        pipeline.submit(WorkItem(identity, std::move(*tags)));
        result.submitted++;
        if (progress)
        {
            progress(result.submitted, identities.size());
        }
    }

    pipeline.finish();
    return result;
}

} // namespace geotagger
