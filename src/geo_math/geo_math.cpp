#include <geotagger/geo_math/geo_math.hpp>

#include <algorithm>
#include <cmath>

namespace
{
double toRadians(double degrees)
{
    return degrees * M_PI / 180.0;
}
} // namespace

namespace geotagger
{

double distance(const Position &a, const Position &b)
{
    return distance(a.latitude, a.longitude, b.latitude, b.longitude);
}

double distance(double latitude1, double longitude1, double latitude2, double longitude2)
{
    const double phi1 = toRadians(latitude1);
    const double phi2 = toRadians(latitude2);
    const double dphi = toRadians(latitude2 - latitude1);
    const double dlambda = toRadians(longitude2 - longitude1);

    const double s_dphi = std::sin(dphi / 2);
    const double s_dlambda = std::sin(dlambda / 2);
    double h = s_dphi * s_dphi + std::cos(phi1) * std::cos(phi2) * s_dlambda * s_dlambda;

    // rounding can push h just past 1 for antipodal points
    h = std::clamp(h, 0.0, 1.0);

    return 2 * EARTH_RADIUS_METERS * std::asin(std::sqrt(h));
}

} // namespace geotagger
