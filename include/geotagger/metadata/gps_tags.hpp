#pragma once

#include <geotagger/types/work_item.hpp>

#include <optional>

namespace geotagger
{

namespace tags
{
constexpr const char *GPS_LATITUDE = "Exif.GPSInfo.GPSLatitude";
constexpr const char *GPS_LATITUDE_REF = "Exif.GPSInfo.GPSLatitudeRef";
constexpr const char *GPS_LONGITUDE = "Exif.GPSInfo.GPSLongitude";
constexpr const char *GPS_LONGITUDE_REF = "Exif.GPSInfo.GPSLongitudeRef";
constexpr const char *GPS_ALTITUDE = "Exif.GPSInfo.GPSAltitude";
constexpr const char *GPS_ALTITUDE_REF = "Exif.GPSInfo.GPSAltitudeRef";
constexpr const char *GPS_MAP_DATUM = "Exif.GPSInfo.GPSMapDatum";
constexpr const char *DATE_TIME_ORIGINAL = "Exif.Photo.DateTimeOriginal";
constexpr const char *CITY = "Xmp.photoshop.City";
constexpr const char *PROVINCE_STATE = "Xmp.photoshop.State";
constexpr const char *COUNTRY_NAME = "Xmp.photoshop.Country";
constexpr const char *COUNTRY_CODE = "Xmp.iptc.CountryCode";
constexpr const char *TIME_ZONE = "Xmp.geotagger.TimeZone";
} // namespace tags

RationalList toDegreesMinutesSeconds(double degrees);
double fromDegreesMinutesSeconds(const RationalList &dms);

// std::nullopt if no latitude/longitude tags are present, throws std::runtime_error if they are malformed
std::optional<Position> readPosition(const WorkItem &item);

void writePosition(WorkItem &item, const Position &position);

// the resolved position if set, otherwise whatever the tags carry
std::optional<Position> currentPosition(const WorkItem &item);

} // namespace geotagger
