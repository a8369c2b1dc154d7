#pragma once

#include <geotagger/types/timestamp.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace geotagger
{

struct Rational
{
    int64_t numerator = 0;
    int64_t denominator = 1;

    double toDouble() const
    {
        return static_cast<double>(numerator) / static_cast<double>(denominator);
    }

    bool operator==(const Rational &other) const
    {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

using RationalList = std::vector<Rational>;

// closed set of shapes a metadata tag can hold
using MetadataValue = std::variant<std::string, int64_t, RationalList, Timestamp>;

std::string describe(const MetadataValue &value);

} // namespace geotagger
