#pragma once

#include <geotagger/geocode/location_resolver.hpp>
#include <geotagger/pipeline/pipeline_stage.hpp>

#include <memory>

namespace geotagger
{

class GeocodeStage final : public PipelineStage
{
  public:
    // overwrite: replace place names the item already carries
    GeocodeStage(std::unique_ptr<LocationResolver> resolver, bool overwrite, size_t queue_capacity);
    ~GeocodeStage() override
    {
        join();
    }

    const LocationResolver &resolver() const
    {
        return *_resolver;
    }

  protected:
    std::optional<WorkItem> transform(WorkItem item) override;

  private:
    std::unique_ptr<LocationResolver> _resolver;
    bool _overwrite;
};

} // namespace geotagger
