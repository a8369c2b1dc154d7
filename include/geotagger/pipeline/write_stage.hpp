#pragma once

#include <geotagger/metadata/metadata_store.hpp>
#include <geotagger/pipeline/pipeline_stage.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace geotagger
{

namespace columns
{
constexpr const char *FILE = "File";
constexpr const char *DATE = "Date";
constexpr const char *LATITUDE = "Latitude";
constexpr const char *LONGITUDE = "Longitude";
constexpr const char *ELEVATION = "Elevation";
constexpr const char *CITY = "City";
constexpr const char *PROVINCE_STATE = "ProvinceState";
constexpr const char *COUNTRY_NAME = "CountryName";
} // namespace columns

// File, Date, Latitude, Longitude, Elevation, City, ProvinceState, CountryName
const std::vector<std::string> &resultColumns();

using ResultRow = std::map<std::string, std::string>;

// fills every result column from the item's current state, missing values are empty
ResultRow makeResultRow(const WorkItem &item);

class ResultSink
{
  public:
    virtual ~ResultSink() = default;

    // throws std::runtime_error if the row cannot be recorded
    virtual void record(const ResultRow &row) = 0;
};

// terminal stage: commits modified metadata and records a result row
class WriteStage final : public PipelineStage
{
  public:
    // results may be null when no result table is requested
    WriteStage(std::shared_ptr<MetadataStore> store, std::shared_ptr<ResultSink> results, size_t queue_capacity);
    ~WriteStage() override
    {
        join();
    }

    size_t committed() const
    {
        return _committed;
    }

  protected:
    std::optional<WorkItem> transform(WorkItem item) override;

  private:
    std::shared_ptr<MetadataStore> _store;
    std::shared_ptr<ResultSink> _results;
    std::atomic<size_t> _committed{0};
};

} // namespace geotagger
