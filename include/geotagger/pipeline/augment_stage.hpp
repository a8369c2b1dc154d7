#pragma once

#include <geotagger/pipeline/pipeline_stage.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace geotagger
{

// values recovered from a previous run's result table, absent fields are left alone
struct AugmentationRow
{
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> elevation;
    std::optional<std::string> city;
    std::optional<std::string> province;
    std::optional<std::string> country;
};

using AugmentationTable = std::unordered_map<std::string, AugmentationRow>;

// merges a row keyed by item identity into the item's metadata
void augment(WorkItem &item, const AugmentationRow &row);

class AugmentStage final : public PipelineStage
{
  public:
    AugmentStage(AugmentationTable table, size_t queue_capacity);
    ~AugmentStage() override
    {
        join();
    }

  protected:
    std::optional<WorkItem> transform(WorkItem item) override;

  private:
    const AugmentationTable _table;
};

} // namespace geotagger
