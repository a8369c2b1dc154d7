#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace geotagger
{

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

// seconds from a to b, negative if b is earlier
double secondsBetween(const Timestamp &a, const Timestamp &b);

Timestamp fromUnixSeconds(double seconds);
double toUnixSeconds(const Timestamp &ts);

// ISO-8601 UTC, "YYYY-MM-DDTHH:MM:SS[.ffffff]Z". A missing zone designator is read as UTC.
std::optional<Timestamp> parseTimestamp(const std::string &text);
std::string toIsoString(const Timestamp &ts);

} // namespace geotagger
