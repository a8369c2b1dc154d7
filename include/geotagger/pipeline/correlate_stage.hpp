#pragma once

#include <geotagger/correlate/correlate.hpp>
#include <geotagger/pipeline/pipeline_stage.hpp>

#include <memory>

namespace geotagger
{

struct CorrelateStageOptions
{
    CorrelationOptions correlation;

    // replace positions the item already carries
    bool overwrite = false;

    // added to the capture time to bring a misset camera clock to UTC
    double time_offset_seconds = 0;
};

class CorrelateStage final : public PipelineStage
{
  public:
    CorrelateStage(std::shared_ptr<const Track> track, CorrelateStageOptions options, size_t queue_capacity);
    ~CorrelateStage() override
    {
        join();
    }

  protected:
    std::optional<WorkItem> transform(WorkItem item) override;

  private:
    std::shared_ptr<const Track> _track;
    CorrelateStageOptions _options;
};

} // namespace geotagger
