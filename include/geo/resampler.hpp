#ifndef WAYGRID_RESAMPLER_HPP
#define WAYGRID_RESAMPLER_HPP

#include "geo/common.hpp"
#include "geo/id_allocator.hpp"
#include "geo/waypoint_source.hpp"

namespace waygrid {
namespace geo {

/**
 * Uniform resampling of roads
 * Synthetic waypoints are inserted so that consecutive points of a road are no
 * more than min_distance_km apart. Original waypoints are never dropped or reordered.
 */
class Resampler {
public:
    /**
     * @param min_distance_km Target spacing in kilometers
     * @param ids Allocator for synthetic node ids
     * @throws InvalidParameterError if min_distance_km is not positive
     */
    Resampler(double min_distance_km, IdAllocator& ids);

    // Disable copy constructor and assignment
    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    /**
     * Resample one road
     * @param road Ordered waypoints of one road
     * @return Road with synthetic points interleaved between their bracketing originals
     * @throws DuplicateCoordinateConflictError if consecutive different nodes share coordinates
     */
    Road resample(const Road& road);

    /**
     * Resample every road of a road-grouped source
     * Malformed rows and conflicting roads are skipped and recorded in the result.
     */
    ResampleResult resampleSource(WaypointSource& source);

    double getMinDistance() const { return min_distance_km_; }

private:
    double min_distance_km_;
    double rounded_limit_;
    IdAllocator& ids_;

    /**
     * Point min_distance_km from current toward end
     * The degree-space step is shortened until its Haversine length rounds to at most the limit.
     */
    Waypoint stepToward(const Waypoint& current, const Waypoint& end, double remaining_km) const;
};

/**
 * Distance filter that keeps only waypoints more than min_distance_km from the last kept one
 * The first and last waypoints of a road are always kept.
 */
class WaypointThinner {
public:
    /**
     * @throws InvalidParameterError if min_distance_km is not positive
     */
    explicit WaypointThinner(double min_distance_km);

    /**
     * @throws DuplicateCoordinateConflictError if consecutive different nodes share coordinates
     */
    Road thin(const Road& road) const;

    ResampleResult thinSource(WaypointSource& source) const;

private:
    double min_distance_km_;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_RESAMPLER_HPP
