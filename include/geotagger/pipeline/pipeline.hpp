#pragma once

#include <geotagger/geocode/location_resolver.hpp>
#include <geotagger/pipeline/augment_stage.hpp>
#include <geotagger/pipeline/correlate_stage.hpp>
#include <geotagger/pipeline/write_stage.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotagger
{

struct PipelineOptions
{
    size_t queue_capacity = 16;

    // augment stage runs when set
    std::optional<AugmentationTable> augmentation;

    // correlate stage runs when set and non-empty
    std::shared_ptr<const Track> track;
    CorrelateStageOptions correlation;

    // geocode stage runs when set
    std::shared_ptr<PlaceLookup> place_lookup;
    ResolverOptions resolver;
    bool overwrite_places = false;

    // writer, always present
    std::shared_ptr<MetadataStore> store;
    std::shared_ptr<ResultSink> results;
};

/*
 * Chain of augment -> correlate -> geocode -> write, containing only the enabled stages.
 * Each stage runs on its own thread from construction until finish().
 */
class Pipeline
{
  public:
    explicit Pipeline(PipelineOptions options);
    ~Pipeline();

    Pipeline(const Pipeline &) = delete;
    Pipeline &operator=(const Pipeline &) = delete;

    // hands the item to the first stage, blocks while its queue is full
    void submit(WorkItem item);

    // ends the stream and waits for every stage to drain, idempotent
    void finish();

    bool finished() const
    {
        return _finished;
    }

    std::vector<std::string> stageNames() const;
    std::vector<StageSummaryEntry> summary() const;
    double elapsedSeconds() const;

  private:
    std::vector<std::unique_ptr<PipelineStage>> _stages;
    std::chrono::steady_clock::time_point _start;
    std::chrono::steady_clock::time_point _end;
    bool _finished = false;
};

struct DriveResult
{
    size_t submitted = 0;
    size_t unreadable = 0;
    bool interrupted = false;
};

using ProgressCallback = std::function<void(size_t submitted, size_t total)>;

// Loads each identity from the store in sorted order and submits it, then finishes the pipeline.
// Submission stops early when `interrupted` becomes true, already queued items still drain.
DriveResult drive(Pipeline &pipeline, MetadataStore &store, std::vector<std::string> identities,
                  const std::atomic<bool> &interrupted, const ProgressCallback &progress = nullptr);

} // namespace geotagger
