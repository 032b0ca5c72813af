#include "geo/road_metrics.hpp"
#include "geo/geo_math.hpp"
#include "geo/road_grouper.hpp"
#include <algorithm>
#include <stdexcept>

namespace waygrid {
namespace geo {

double RoadMetrics::length(const Road& road) {
    double total_km = 0.0;
    for (size_t i = 1; i < road.size(); ++i) {
        total_km += GeoMath::distance(road[i - 1], road[i]);
    }
    return total_km;
}

Waypoint RoadMetrics::midpoint(const Road& road) {
    if (road.empty()) {
        throw std::invalid_argument("Cannot compute the midpoint of an empty road");
    }

    auto lat_range = std::minmax_element(road.begin(), road.end(),
        [](const Waypoint& a, const Waypoint& b) { return a.lat < b.lat; });
    auto lon_range = std::minmax_element(road.begin(), road.end(),
        [](const Waypoint& a, const Waypoint& b) { return a.lon < b.lon; });

    double min_lat = lat_range.first->lat;
    double max_lat = lat_range.second->lat;
    double min_lon = lon_range.first->lon;
    double max_lon = lon_range.second->lon;

    return Waypoint(road.front().road_id, "",
                    ((max_lat - min_lat) / 2.0) + min_lat,
                    ((max_lon - min_lon) / 2.0) + min_lon);
}

RoadSummary RoadMetrics::summarize(const Road& road) {
    Waypoint mid = midpoint(road);
    return RoadSummary(mid.road_id, road.size(), length(road), mid.lat, mid.lon);
}

std::vector<RoadSummary> RoadMetrics::summarizeSource(WaypointSource& source, std::vector<RowError>& errors) {
    std::vector<RoadSummary> summaries;
    RoadGrouper grouper(source);
    Road road;

    while (grouper.nextRoad(road)) {
        summaries.push_back(summarize(road));
    }

    const auto& row_errors = grouper.getErrors();
    errors.insert(errors.end(), row_errors.begin(), row_errors.end());
    return summaries;
}

} // namespace geo
} // namespace waygrid
