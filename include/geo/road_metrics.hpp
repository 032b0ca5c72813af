#ifndef WAYGRID_ROAD_METRICS_HPP
#define WAYGRID_ROAD_METRICS_HPP

#include <vector>
#include "geo/common.hpp"
#include "geo/waypoint_source.hpp"

namespace waygrid {
namespace geo {

class RoadMetrics {
public:
    /**
     * Sum of Haversine distances between consecutive waypoints
     * @param road Ordered waypoints
     * @return Length in kilometers (0 for fewer than two waypoints)
     */
    static double length(const Road& road);

    /**
     * One-dimensional midpoint of the road's bounding box: ((max - min) / 2) + min on each axis
     * @param road Non-empty road
     * @return Midpoint carrying the road id
     * @throws std::invalid_argument for an empty road
     */
    static Waypoint midpoint(const Road& road);

    static RoadSummary summarize(const Road& road);

    /**
     * Summaries of every road of a source, in source order
     * @param source Road-grouped rows
     * @param errors Receives malformed-row records
     */
    static std::vector<RoadSummary> summarizeSource(WaypointSource& source, std::vector<RowError>& errors);

private:
    // Disable instantiation
    RoadMetrics() = delete;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_ROAD_METRICS_HPP
