#include "geo/geo_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace waygrid {
namespace geo {

double GeoMath::toRadians(double degrees) {
    return degrees * bg::math::d2r<double>();
}

double GeoMath::distance(const Waypoint& a, const Waypoint& b) {
    const double lat_a = toRadians(a.lat);
    const double lat_b = toRadians(b.lat);
    const double delta_lat = lat_b - lat_a;
    const double delta_lon = toRadians(b.lon) - toRadians(a.lon);

    const double sin_half_lat = std::sin(delta_lat / 2.0);
    const double sin_half_lon = std::sin(delta_lon / 2.0);

    double square_of_chord = sin_half_lat * sin_half_lat +
                             std::cos(lat_b) * std::cos(lat_a) * sin_half_lon * sin_half_lon;

    // Rounding can push the chord slightly past 1 for near-antipodal input
    square_of_chord = std::min(1.0, std::max(0.0, square_of_chord));

    const double angular_distance = 2.0 * std::atan2(std::sqrt(square_of_chord), std::sqrt(1.0 - square_of_chord));
    return angular_distance * kEarthRadiusKm;
}

Waypoint GeoMath::pointAtDistance(const Waypoint& far, const Waypoint& near, double target_km, double total_km) {
    if (total_km == 0.0) {
        return far;
    }

    const double ratio = target_km / total_km;
    return Waypoint(far.road_id, "",
                    far.lat + ratio * (near.lat - far.lat),
                    far.lon + ratio * (near.lon - far.lon));
}

Waypoint GeoMath::pointAtRatio(const Waypoint& start, const Waypoint& end, double distance_km) {
    return pointAtDistance(start, end, distance_km, distance(start, end));
}

double GeoMath::edgeCrossingDistance(const Waypoint& inside, const Waypoint& outside, const Cell& cell) {
    const double lat_leg = outside.lat - inside.lat;
    const double lon_leg = outside.lon - inside.lon;

    // Fraction of each leg needed to reach the edge it points at
    double lat_fraction = std::numeric_limits<double>::infinity();
    if (lat_leg > 0.0) {
        lat_fraction = (cell.maxLat() - inside.lat) / lat_leg;
    } else if (lat_leg < 0.0) {
        lat_fraction = (cell.minLat() - inside.lat) / lat_leg;
    }

    double lon_fraction = std::numeric_limits<double>::infinity();
    if (lon_leg > 0.0) {
        lon_fraction = (cell.maxLon() - inside.lon) / lon_leg;
    } else if (lon_leg < 0.0) {
        lon_fraction = (cell.minLon() - inside.lon) / lon_leg;
    }

    double fraction = std::min(lat_fraction, lon_fraction);
    if (!std::isfinite(fraction)) {
        // Coincident points: no crossing to locate
        return 0.0;
    }
    fraction = std::min(1.0, std::max(0.0, fraction));

    return fraction * distance(inside, outside);
}

double GeoMath::roundDistance(double distance_km) {
    const double scale = std::pow(10.0, kDistancePrecision);
    return std::round(distance_km * scale) / scale;
}

} // namespace geo
} // namespace waygrid
