#include <geotagger/metadata/gps_tags.hpp>

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace
{
constexpr int64_t SECONDS_DENOMINATOR = 1000000;
constexpr int64_t ALTITUDE_DENOMINATOR = 1000;

double signedCoordinate(const geotagger::WorkItem &item, const char *value_tag, const char *ref_tag,
                        char negative_ref, double limit)
{
    double value = geotagger::fromDegreesMinutesSeconds(item.getAs<geotagger::RationalList>(value_tag));
    if (item.contains(ref_tag))
    {
        const std::string &ref = item.getAs<std::string>(ref_tag);
        if (!ref.empty() && (ref[0] == negative_ref || ref[0] == std::tolower(negative_ref)))
        {
            value = -value;
        }
    }
    if (!std::isfinite(value) || std::abs(value) > limit)
    {
        throw std::runtime_error(std::string("out of range value in ") + value_tag);
    }
    return value;
}
} // namespace

namespace geotagger
{

RationalList toDegreesMinutesSeconds(double degrees)
{
    degrees = std::abs(degrees);
    int64_t whole = static_cast<int64_t>(std::floor(degrees));
    double remainder = (degrees - whole) * 60;
    int64_t minutes = static_cast<int64_t>(std::floor(remainder));
    int64_t seconds = std::llround((remainder - minutes) * 60 * SECONDS_DENOMINATOR);

    // rounding can carry a full minute
    if (seconds >= 60 * SECONDS_DENOMINATOR)
    {
        seconds -= 60 * SECONDS_DENOMINATOR;
        minutes++;
    }
    if (minutes >= 60)
    {
        minutes -= 60;
        whole++;
    }

    return {{whole, 1}, {minutes, 1}, {seconds, SECONDS_DENOMINATOR}};
}

double fromDegreesMinutesSeconds(const RationalList &dms)
{
    if (dms.empty() || dms.size() > 3)
    {
        throw std::runtime_error("expected 1 to 3 rationals, got " + std::to_string(dms.size()));
    }
    double result = 0;
    double scale = 1;
    for (const Rational &r : dms)
    {
        if (r.denominator == 0)
        {
            throw std::runtime_error("zero denominator in coordinate");
        }
        result += r.toDouble() / scale;
        scale *= 60;
    }
    return result;
}

std::optional<Position> readPosition(const WorkItem &item)
{
    if (!item.contains(tags::GPS_LATITUDE) || !item.contains(tags::GPS_LONGITUDE))
    {
        return std::nullopt;
    }

    Position p;
    p.latitude = signedCoordinate(item, tags::GPS_LATITUDE, tags::GPS_LATITUDE_REF, 'S', 90);
    p.longitude = signedCoordinate(item, tags::GPS_LONGITUDE, tags::GPS_LONGITUDE_REF, 'W', 180);

    if (item.contains(tags::GPS_ALTITUDE))
    {
        const RationalList &altitude = item.getAs<RationalList>(tags::GPS_ALTITUDE);
        if (altitude.size() != 1 || altitude[0].denominator == 0)
        {
            throw std::runtime_error("malformed altitude");
        }
        double elevation = altitude[0].toDouble();
        if (item.contains(tags::GPS_ALTITUDE_REF) && item.getAs<int64_t>(tags::GPS_ALTITUDE_REF) == 1)
        {
            elevation = -elevation;
        }
        p.elevation = elevation;
    }
    return p;
}

void writePosition(WorkItem &item, const Position &position)
{
    item.set(tags::GPS_LATITUDE, toDegreesMinutesSeconds(position.latitude));
    item.set(tags::GPS_LATITUDE_REF, std::string(position.latitude < 0 ? "S" : "N"));
    item.set(tags::GPS_LONGITUDE, toDegreesMinutesSeconds(position.longitude));
    item.set(tags::GPS_LONGITUDE_REF, std::string(position.longitude < 0 ? "W" : "E"));
    item.set(tags::GPS_MAP_DATUM, std::string("WGS-84"));

    if (position.elevation.has_value())
    {
        const double elevation = *position.elevation;
        item.set(tags::GPS_ALTITUDE, RationalList{{std::llround(std::abs(elevation) * ALTITUDE_DENOMINATOR),
                                                   ALTITUDE_DENOMINATOR}});
        item.set(tags::GPS_ALTITUDE_REF, int64_t(elevation < 0 ? 1 : 0));
    }
    else
    {
        item.erase(tags::GPS_ALTITUDE);
        item.erase(tags::GPS_ALTITUDE_REF);
    }
}

std::optional<Position> currentPosition(const WorkItem &item)
{
    if (item.position.has_value())
    {
        return item.position;
    }
    return readPosition(item);
}

} // namespace geotagger
