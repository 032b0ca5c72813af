#ifndef WAYGRID_GEO_MATH_HPP
#define WAYGRID_GEO_MATH_HPP

#include "geo/common.hpp"

namespace waygrid {
namespace geo {

/**
 * Spherical-earth distance and interpolation primitives
 * Coordinates are exchanged in degrees and converted to radians internally.
 */
class GeoMath {
public:
    /**
     * Haversine great-circle distance
     * Differences are taken as plain differences (no longitude wrap across +/-180).
     * @param a First waypoint
     * @param b Second waypoint
     * @return Distance in kilometers
     */
    static double distance(const Waypoint& a, const Waypoint& b);

    /**
     * Point on the degree-space chord from far toward near at fraction target_km / total_km
     * @param far Start of the chord
     * @param near End of the chord
     * @param target_km Distance from far
     * @param total_km Length of the chord
     * @return Interpolated waypoint carrying far's road id and an empty node id (far itself if total_km is 0)
     */
    static Waypoint pointAtDistance(const Waypoint& far, const Waypoint& near, double target_km, double total_km);

    /**
     * Boundary point at distance_km from start toward end, total taken from distance(start, end)
     */
    static Waypoint pointAtRatio(const Waypoint& start, const Waypoint& end, double distance_km);

    /**
     * Short distance from an inside point to the cell edge along the segment toward an outside point
     * The segment is decomposed into its latitude and longitude legs; the edge hit first is the
     * one with the smaller leg fraction, and the chord distance scales by that fraction.
     * @param inside Point inside the cell
     * @param outside Point outside (or on the edge of) the cell
     * @param cell Cell being crossed
     * @return Distance in kilometers from inside to the crossing point
     */
    static double edgeCrossingDistance(const Waypoint& inside, const Waypoint& outside, const Cell& cell);

    /**
     * Round a distance to kDistancePrecision decimal places
     */
    static double roundDistance(double distance_km);

    static double toRadians(double degrees);

private:
    // Disable instantiation
    GeoMath() = delete;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_GEO_MATH_HPP
