#pragma once

#include <geotagger/pipeline/augment_stage.hpp>
#include <geotagger/pipeline/write_stage.hpp>
#include <geotagger/types/position.hpp>

#include <fstream>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotagger
{

// quoted fields may contain commas and doubled quotes, embedded newlines are not supported
std::vector<std::string> splitCsvLine(const std::string &line);
std::string quoteCsvField(const std::string &field);

// rows of time,latitude,longitude[,elevation], malformed rows are skipped with a warning
std::vector<TimestampedPoint> readTrackCsv(std::istream &in);
std::optional<std::vector<TimestampedPoint>> loadTrackCsv(const std::string &path);

// header row required, keyed by the File column
std::optional<AugmentationTable> readAugmentationCsv(std::istream &in);
std::optional<AugmentationTable> loadAugmentationCsv(const std::string &path);

class CsvResultSink final : public ResultSink
{
  public:
    // writes the header immediately
    explicit CsvResultSink(std::ostream &out);

    // throws std::runtime_error if the file cannot be created
    static std::shared_ptr<CsvResultSink> open(const std::string &path);

    void record(const ResultRow &row) override;

    size_t rows() const
    {
        return _rows;
    }

  private:
    CsvResultSink(std::unique_ptr<std::ofstream> file);

    std::unique_ptr<std::ofstream> _file;
    std::ostream &_out;
    size_t _rows = 0;
};

} // namespace geotagger
