#ifndef WAYGRID_ROAD_GROUPER_HPP
#define WAYGRID_ROAD_GROUPER_HPP

#include <functional>
#include <optional>
#include <vector>
#include "geo/common.hpp"
#include "geo/waypoint_source.hpp"

namespace waygrid {
namespace geo {

/**
 * Collects consecutive rows of a WaypointSource into roads
 * Rows that fail to parse are skipped and recorded as MALFORMED_ROW errors.
 */
class RoadGrouper {
public:
    explicit RoadGrouper(WaypointSource& source);

    // Disable copy constructor and assignment
    RoadGrouper(const RoadGrouper&) = delete;
    RoadGrouper& operator=(const RoadGrouper&) = delete;

    /**
     * Read the next road
     * @param road Filled with the road's waypoints in source order
     * @return false once the source is exhausted
     */
    bool nextRoad(Road& road);

    const std::vector<RowError>& getErrors() const { return errors_; }

    /**
     * Drop consecutive repeats of the same node at the same coordinates
     * @throws DuplicateCoordinateConflictError if consecutive different nodes share coordinates
     */
    static Road removeRepeatedNodes(const Road& road);

private:
    WaypointSource& source_;
    std::optional<Waypoint> pending_;   // First waypoint of the following road
    std::vector<RowError> errors_;
};

/**
 * Apply a per-road transformation to every road of a source
 * Roads whose transformation raises DuplicateCoordinateConflictError are left out and recorded.
 * @param source Road-grouped rows
 * @param transform Per-road transformation (resampling, thinning)
 * @return Transformed waypoints with distance from the previous point of the same road
 */
ResampleResult transformRoads(WaypointSource& source, const std::function<Road(const Road&)>& transform);

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_ROAD_GROUPER_HPP
