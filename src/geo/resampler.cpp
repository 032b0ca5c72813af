#include "geo/resampler.hpp"
#include "geo/geo_math.hpp"
#include "geo/road_grouper.hpp"
#include <cmath>
#include <sstream>

namespace waygrid {
namespace geo {

namespace {

// Upper bound on step-length corrections for one synthetic point
constexpr int kMaxStepCorrections = 8;

void validateMinDistance(double min_distance_km) {
    if (!(min_distance_km > 0.0) || !std::isfinite(min_distance_km)) {
        std::ostringstream oss;
        oss << "Minimum distance must be a positive number of kilometers, got " << min_distance_km;
        throw InvalidParameterError(oss.str());
    }
}

} // namespace

Resampler::Resampler(double min_distance_km, IdAllocator& ids)
    : min_distance_km_(min_distance_km), rounded_limit_(0.0), ids_(ids) {
    validateMinDistance(min_distance_km);
    rounded_limit_ = GeoMath::roundDistance(min_distance_km);
    if (rounded_limit_ <= 0.0) {
        throw InvalidParameterError("Minimum distance rounds to zero at the comparison precision");
    }
}

Waypoint Resampler::stepToward(const Waypoint& current, const Waypoint& end, double remaining_km) const {
    double target_km = min_distance_km_;
    Waypoint next = GeoMath::pointAtDistance(current, end, target_km, remaining_km);

    for (int i = 0; i < kMaxStepCorrections; ++i) {
        double step_km = GeoMath::distance(current, next);
        if (step_km == 0.0 || GeoMath::roundDistance(step_km) <= rounded_limit_) {
            break;
        }
        target_km *= min_distance_km_ / step_km;
        next = GeoMath::pointAtDistance(current, end, target_km, remaining_km);
    }

    next.road_id = end.road_id;
    return next;
}

Road Resampler::resample(const Road& input) {
    Road road = RoadGrouper::removeRepeatedNodes(input);
    if (road.size() < 2) {
        return road;
    }

    Road output;
    output.reserve(road.size());
    output.push_back(road.front());

    Waypoint current = road.front();
    for (size_t i = 1; i < road.size(); ++i) {
        const Waypoint& end = road[i];
        double remaining_km = GeoMath::distance(current, end);

        while (GeoMath::roundDistance(remaining_km) > rounded_limit_) {
            Waypoint next = stepToward(current, end, remaining_km);
            double next_remaining_km = GeoMath::distance(next, end);
            if (!(next_remaining_km < remaining_km)) {
                // No progress along the chord
                break;
            }

            next.node_id = ids_.nextNodeId();
            output.push_back(next);
            current = next;
            remaining_km = next_remaining_km;
        }

        output.push_back(end);
        current = end;
    }

    return output;
}

ResampleResult Resampler::resampleSource(WaypointSource& source) {
    const uint64_t first_id = ids_.peek();

    ResampleResult result = transformRoads(source, [this](const Road& road) {
        return resample(road);
    });
    result.generated_count = static_cast<size_t>(ids_.peek() - first_id);
    return result;
}

WaypointThinner::WaypointThinner(double min_distance_km) : min_distance_km_(min_distance_km) {
    validateMinDistance(min_distance_km);
}

Road WaypointThinner::thin(const Road& input) const {
    Road road = RoadGrouper::removeRepeatedNodes(input);
    if (road.size() <= 2) {
        return road;
    }

    const double limit = GeoMath::roundDistance(min_distance_km_);

    Road output;
    output.push_back(road.front());
    for (size_t i = 1; i + 1 < road.size(); ++i) {
        if (GeoMath::roundDistance(GeoMath::distance(output.back(), road[i])) > limit) {
            output.push_back(road[i]);
        }
    }
    output.push_back(road.back());

    return output;
}

ResampleResult WaypointThinner::thinSource(WaypointSource& source) const {
    ResampleResult result = transformRoads(source, [this](const Road& road) {
        return thin(road);
    });
    return result;
}

} // namespace geo
} // namespace waygrid
