#include <geotagger/types/timestamp.hpp>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace geotagger
{

double secondsBetween(const Timestamp &a, const Timestamp &b)
{
    return std::chrono::duration<double>(b - a).count();
}

Timestamp fromUnixSeconds(double seconds)
{
    const auto micros = static_cast<int64_t>(std::llround(seconds * 1e6));
    return Timestamp(std::chrono::microseconds(micros));
}

double toUnixSeconds(const Timestamp &ts)
{
    return ts.time_since_epoch().count() * 1e-6;
}

std::optional<Timestamp> parseTimestamp(const std::string &text)
{
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
    {
        // EXIF style "YYYY:MM:DD HH:MM:SS"
        ss.clear();
        ss.str(text);
        tm = std::tm{};
        ss >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
        if (ss.fail())
        {
            return std::nullopt;
        }
    }

    int64_t micros = 0;
    if (ss.peek() == '.')
    {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek()))
        {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.empty())
        {
            return std::nullopt;
        }
        digits.resize(6, '0');
        micros = std::stoll(digits);
    }

    const int c = ss.peek();
    if (c == 'Z')
    {
        ss.get();
    }
    if (ss.peek() != std::char_traits<char>::eof())
    {
        return std::nullopt;
    }

    const std::time_t seconds = timegm(&tm);
    return Timestamp(std::chrono::seconds(seconds) + std::chrono::microseconds(micros));
}

std::string toIsoString(const Timestamp &ts)
{
    const auto since_epoch = ts.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = since_epoch - seconds;
    if (micros.count() < 0)
    {
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    const std::time_t t = seconds.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (micros.count() != 0)
    {
        out << '.' << std::setw(6) << std::setfill('0') << micros.count();
    }
    out << 'Z';
    return out.str();
}

} // namespace geotagger
