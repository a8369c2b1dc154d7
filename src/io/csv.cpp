#include <geotagger/io/csv.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <istream>
#include <map>
#include <stdexcept>

namespace
{
std::string trim(const std::string &s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::optional<double> parseDouble(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<geotagger::Timestamp> parseTime(const std::string &text)
{
    auto ts = geotagger::parseTimestamp(text);
    if (ts.has_value())
    {
        return ts;
    }
    // unix seconds, bounded so the microsecond count fits
    auto seconds = parseDouble(text);
    if (seconds.has_value() && std::abs(*seconds) < 1e12)
    {
        return geotagger::fromUnixSeconds(*seconds);
    }
    return std::nullopt;
}

std::optional<std::string> nonEmpty(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    return text;
}
} // namespace

namespace geotagger
{

std::vector<std::string> splitCsvLine(const std::string &line)
{
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); i++)
    {
        const char c = line[i];
        if (quoted)
        {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
            {
                current.push_back('"');
                i++;
            }
            else if (c == '"')
            {
                quoted = false;
            }
            else
            {
                current.push_back(c);
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            fields.push_back(trim(current));
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

std::string quoteCsvField(const std::string &field)
{
    if (field.find_first_of(",\"") == std::string::npos)
    {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field)
    {
        if (c == '"')
        {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::vector<TimestampedPoint> readTrackCsv(std::istream &in)
{
    std::vector<TimestampedPoint> points;
    std::string line;
    size_t line_number = 0;
    size_t skipped = 0;
    bool first_row = true;
    while (std::getline(in, line))
    {
        line_number++;
        if (trim(line).empty() || line[0] == '#')
        {
            continue;
        }

        const bool header_candidate = first_row;
        first_row = false;

        const auto fields = splitCsvLine(line);
        std::optional<Timestamp> ts = fields.size() >= 3 ? parseTime(fields[0]) : std::nullopt;
        std::optional<double> latitude = fields.size() >= 3 ? parseDouble(fields[1]) : std::nullopt;
        std::optional<double> longitude = fields.size() >= 3 ? parseDouble(fields[2]) : std::nullopt;

        if (!ts.has_value() || !latitude.has_value() || !longitude.has_value())
        {
            // a header has no parseable time in the first column
            if (!header_candidate || parseTime(fields[0]).has_value())
            {
                spdlog::warn("Skipping malformed track line {}: {}", line_number, line);
                skipped++;
            }
            continue;
        }
        if (!(std::abs(*latitude) <= 90) || !(std::abs(*longitude) <= 180))
        {
            spdlog::warn("Skipping out of range track line {}: {}", line_number, line);
            skipped++;
            continue;
        }

        TimestampedPoint p;
        p.timestamp = *ts;
        p.position.latitude = *latitude;
        p.position.longitude = *longitude;
        if (fields.size() >= 4)
        {
            p.position.elevation = parseDouble(fields[3]);
        }
        points.push_back(p);
    }

    spdlog::debug("Read {} track points, skipped {}", points.size(), skipped);
    return points;
}

std::optional<std::vector<TimestampedPoint>> loadTrackCsv(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::error("Unable to open track file {}", path);
        return std::nullopt;
    }
    return readTrackCsv(file);
}

std::optional<AugmentationTable> readAugmentationCsv(std::istream &in)
{
    std::string line;
    if (!std::getline(in, line))
    {
        spdlog::error("Augmentation table has no header");
        return std::nullopt;
    }

    std::map<std::string, size_t> index;
    const auto header = splitCsvLine(line);
    for (size_t i = 0; i < header.size(); i++)
    {
        index[header[i]] = i;
    }
    if (index.find(columns::FILE) == index.end())
    {
        spdlog::error("Augmentation table has no {} column", columns::FILE);
        return std::nullopt;
    }

    AugmentationTable table;
    size_t line_number = 1;
    while (std::getline(in, line))
    {
        line_number++;
        if (trim(line).empty())
        {
            continue;
        }
        const auto fields = splitCsvLine(line);
        auto cell = [&](const char *column) -> std::string {
            auto iter = index.find(column);
            if (iter == index.end() || iter->second >= fields.size())
            {
                return "";
            }
            return fields[iter->second];
        };

        const std::string file = cell(columns::FILE);
        if (file.empty())
        {
            spdlog::warn("Skipping augmentation line {} without a file", line_number);
            continue;
        }

        AugmentationRow row;
        row.latitude = parseDouble(cell(columns::LATITUDE));
        row.longitude = parseDouble(cell(columns::LONGITUDE));
        row.elevation = parseDouble(cell(columns::ELEVATION));
        row.city = nonEmpty(cell(columns::CITY));
        row.province = nonEmpty(cell(columns::PROVINCE_STATE));
        row.country = nonEmpty(cell(columns::COUNTRY_NAME));
        table[file] = row;
    }

    return table;
}

std::optional<AugmentationTable> loadAugmentationCsv(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::error("Unable to open augmentation file {}", path);
        return std::nullopt;
    }
    return readAugmentationCsv(file);
}

CsvResultSink::CsvResultSink(std::ostream &out) : _out(out)
{
    const auto &cols = resultColumns();
    for (size_t i = 0; i < cols.size(); i++)
    {
        _out << (i > 0 ? "," : "") << cols[i];
    }
    _out << "\n";
}

CsvResultSink::CsvResultSink(std::unique_ptr<std::ofstream> file) : CsvResultSink(*file)
{
    _file = std::move(file);
}

std::shared_ptr<CsvResultSink> CsvResultSink::open(const std::string &path)
{
    auto file = std::make_unique<std::ofstream>(path, std::ios::binary);
    if (!file->is_open())
    {
        throw std::runtime_error("unable to create result file " + path);
    }
    return std::shared_ptr<CsvResultSink>(new CsvResultSink(std::move(file)));
}

void CsvResultSink::record(const ResultRow &row)
{
    const auto &cols = resultColumns();
    for (size_t i = 0; i < cols.size(); i++)
    {
        auto iter = row.find(cols[i]);
        _out << (i > 0 ? "," : "") << quoteCsvField(iter == row.end() ? std::string() : iter->second);
    }
    _out << "\n";
    _out.flush();
    if (!_out)
    {
        throw std::runtime_error("failed writing result row");
    }
    _rows++;
}

} // namespace geotagger
