#include "geo/road_grouper.hpp"
#include "geo/geo_math.hpp"

namespace waygrid {
namespace geo {

RoadGrouper::RoadGrouper(WaypointSource& source) : source_(source) {}

bool RoadGrouper::nextRoad(Road& road) {
    road.clear();

    if (pending_) {
        road.push_back(*pending_);
        pending_.reset();
    }

    while (auto row = source_.next()) {
        Waypoint waypoint;
        std::string error;
        if (!parseWaypointRow(*row, waypoint, error)) {
            errors_.emplace_back(ErrorKind::MALFORMED_ROW, row->row_number, row->road_id, row->node_id, error);
            continue;
        }

        if (!road.empty() && waypoint.road_id != road.front().road_id) {
            pending_ = waypoint;
            return true;
        }
        road.push_back(waypoint);
    }

    return !road.empty();
}

Road RoadGrouper::removeRepeatedNodes(const Road& road) {
    Road result;
    result.reserve(road.size());

    for (const auto& waypoint : road) {
        if (!result.empty() && result.back().sameCoordinates(waypoint)) {
            if (result.back().node_id != waypoint.node_id) {
                throw DuplicateCoordinateConflictError(waypoint.road_id, result.back().node_id, waypoint.node_id);
            }
            continue;
        }
        result.push_back(waypoint);
    }

    return result;
}

ResampleResult transformRoads(WaypointSource& source, const std::function<Road(const Road&)>& transform) {
    ResampleResult result;
    RoadGrouper grouper(source);
    Road road;

    while (grouper.nextRoad(road)) {
        Road transformed;
        try {
            transformed = transform(road);
        } catch (const DuplicateCoordinateConflictError& e) {
            result.errors.emplace_back(ErrorKind::DUPLICATE_COORDINATE_CONFLICT, 0, e.road_id, "", e.what());
            continue;
        }

        for (size_t i = 0; i < transformed.size(); ++i) {
            double distance_from_last = i == 0 ? 0.0 : GeoMath::distance(transformed[i - 1], transformed[i]);
            result.waypoints.emplace_back(transformed[i], distance_from_last);
        }
        result.road_count++;
    }

    // Malformed rows come first in the report, road conflicts after
    const auto& row_errors = grouper.getErrors();
    result.errors.insert(result.errors.begin(), row_errors.begin(), row_errors.end());

    return result;
}

} // namespace geo
} // namespace waygrid
