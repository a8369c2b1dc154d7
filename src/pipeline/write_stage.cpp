#include <geotagger/pipeline/write_stage.hpp>

#include <geotagger/metadata/gps_tags.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace
{
std::string textTag(const geotagger::WorkItem &item, const char *tag)
{
    if (!item.contains(tag))
    {
        return "";
    }
    const auto *text = std::get_if<std::string>(&item.get(tag));
    return text == nullptr ? std::string() : *text;
}
} // namespace

namespace geotagger
{

const std::vector<std::string> &resultColumns()
{
    static const std::vector<std::string> cols{columns::FILE,      columns::DATE, columns::LATITUDE,
                                               columns::LONGITUDE, columns::ELEVATION, columns::CITY,
                                               columns::PROVINCE_STATE, columns::COUNTRY_NAME};
    return cols;
}

ResultRow makeResultRow(const WorkItem &item)
{
    ResultRow row;
    for (const auto &c : resultColumns())
    {
        row[c] = "";
    }

    row[columns::FILE] = item.identity();

    if (item.contains(tags::DATE_TIME_ORIGINAL))
    {
        const auto *ts = std::get_if<Timestamp>(&item.get(tags::DATE_TIME_ORIGINAL));
        if (ts != nullptr)
        {
            row[columns::DATE] = toIsoString(*ts);
        }
    }

    std::optional<Position> position = currentPosition(item);
    if (position.has_value())
    {
        row[columns::LATITUDE] = fmt::format("{:.7f}", position->latitude);
        row[columns::LONGITUDE] = fmt::format("{:.7f}", position->longitude);
        if (position->elevation.has_value())
        {
            row[columns::ELEVATION] = fmt::format("{:.2f}", *position->elevation);
        }
    }

    row[columns::CITY] = textTag(item, tags::CITY);
    row[columns::PROVINCE_STATE] = textTag(item, tags::PROVINCE_STATE);
    row[columns::COUNTRY_NAME] = textTag(item, tags::COUNTRY_NAME);
    return row;
}

WriteStage::WriteStage(std::shared_ptr<MetadataStore> store, std::shared_ptr<ResultSink> results,
                       size_t queue_capacity)
    : PipelineStage("write", queue_capacity), _store(std::move(store)), _results(std::move(results))
{
    if (_store == nullptr)
    {
        throw std::invalid_argument("WriteStage requires a metadata store");
    }
}

std::optional<WorkItem> WriteStage::transform(WorkItem item)
{
    if (item.isDirty())
    {
        if (!_store->commit(item))
        {
            throw std::runtime_error("metadata commit failed");
        }
        _committed++;
        spdlog::debug("[{}] committed {}", name(), item.identity());
    }

    if (_results != nullptr)
    {
        item.result = makeResultRow(item);
        _results->record(item.result);
    }

    return std::nullopt;
}

} // namespace geotagger
