#pragma once
#include "export.hpp"

namespace geo
{
    inline constexpr double EARTH_RADIUS_KM = 6371.0;

    struct LatLon
    {
        double lat;  // degrees
        double lon;  // degrees
    };

    // Great-circle distance via the haversine formula, in the unit of radius
    BROADSHEET_API double haversine_km(const LatLon& a, const LatLon& b, double radius_km = EARTH_RADIUS_KM) noexcept;
    BROADSHEET_API double central_angle(const LatLon& a, const LatLon& b) noexcept;
}
