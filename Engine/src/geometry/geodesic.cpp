#include "geometry/geodesic.hpp"
#include <cmath>

namespace geo
{
    static constexpr double k_deg_to_rad = 3.14159265358979323846 / 180.0;

    double central_angle(const LatLon& a, const LatLon& b) noexcept
    {
        const double lat1 = a.lat * k_deg_to_rad;
        const double lat2 = b.lat * k_deg_to_rad;
        const double dlat = lat2 - lat1;
        const double dlon = (b.lon - a.lon) * k_deg_to_rad;

        const double s_lat = std::sin(dlat / 2.0);
        const double s_lon = std::sin(dlon / 2.0);
        double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
        if (h > 1.0) h = 1.0;
        else if (h < 0.0) h = 0.0;
        return 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    }

    double haversine_km(const LatLon& a, const LatLon& b, double radius_km) noexcept
    {
        return radius_km * central_angle(a, b);
    }
}
