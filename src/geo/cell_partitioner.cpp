#include "geo/cell_partitioner.hpp"
#include "geo/cell_classifier.hpp"
#include "geo/geo_math.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace waygrid {
namespace geo {

CellPartitioner::CellPartitioner(const Cell& cell, size_t cell_id, BoundaryMode mode, IdAllocator& ids)
    : cell_(cell), cell_label_(cell.label(cell_id)), mode_(mode), ids_(ids),
      previous_inside_(false), segment_count_(0), road_length_km_(0.0), road_conflict_(false),
      total_length_km_(0.0) {}

void CellPartitioner::reset() {
    road_id_.reset();
    previous_point_.reset();
    previous_inside_ = false;
    road_points_.clear();
    segment_count_ = 0;
    road_length_km_ = 0.0;
    road_conflict_ = false;
    total_length_km_ = 0.0;
    errors_.clear();
}

void CellPartitioner::startRoad(const std::string& road_id) {
    road_id_ = road_id;
    previous_point_.reset();
    previous_inside_ = false;
    road_points_.clear();
    segment_count_ = 0;
    road_length_km_ = 0.0;
    road_conflict_ = false;
}

Waypoint CellPartitioner::crossingPoint(const Waypoint& inside, const Waypoint& outside) {
    double short_distance_km = GeoMath::edgeCrossingDistance(inside, outside, cell_);
    Waypoint boundary = GeoMath::pointAtRatio(inside, outside, short_distance_km);
    boundary.road_id = inside.road_id;
    boundary.node_id = ids_.nextBoundaryNodeId();
    return boundary;
}

std::vector<CellRow> CellPartitioner::push(const RawWaypointRow& row) {
    Waypoint point;
    std::string error;
    if (!parseWaypointRow(row, point, error)) {
        errors_.emplace_back(ErrorKind::MALFORMED_ROW, row.row_number, row.road_id, row.node_id, error);
        return {};
    }

    std::vector<CellRow> completed;
    if (!road_id_ || *road_id_ != point.road_id) {
        completed = flushRoad();
        startRoad(point.road_id);
    }

    if (road_conflict_) {
        return completed;
    }

    if (previous_point_) {
        // Duplicate-node guard
        if (previous_point_->node_id == point.node_id) {
            return completed;
        }
        if (previous_point_->sameCoordinates(point)) {
            DuplicateCoordinateConflictError conflict(point.road_id, previous_point_->node_id, point.node_id);
            errors_.emplace_back(ErrorKind::DUPLICATE_COORDINATE_CONFLICT, row.row_number, point.road_id,
                                 point.node_id, conflict.what());
            road_conflict_ = true;
            road_points_.clear();
            road_length_km_ = 0.0;
            return completed;
        }
    }

    const bool inside = CellClassifier::inCell(point, cell_);

    if (inside) {
        if (!previous_point_ || !previous_inside_) {
            // Start of an in-cell run
            segment_count_++;
            if (previous_point_ && mode_ == BoundaryMode::INTERPOLATE) {
                Waypoint entry = crossingPoint(point, *previous_point_);
                road_length_km_ += GeoMath::distance(entry, point);
                road_points_.emplace_back(entry, segment_count_ - 1);
            }
        } else {
            road_length_km_ += GeoMath::distance(*previous_point_, point);
        }
        road_points_.emplace_back(point, segment_count_ - 1);
    } else if (previous_point_ && previous_inside_ && mode_ == BoundaryMode::INTERPOLATE) {
        // Crossing out of the cell: close the run on the edge
        Waypoint exit = crossingPoint(*previous_point_, point);
        road_length_km_ += GeoMath::distance(*previous_point_, exit);
        road_points_.emplace_back(exit, segment_count_ - 1);
    }

    previous_point_ = point;
    previous_inside_ = inside;
    return completed;
}

std::vector<CellRow> CellPartitioner::finish() {
    std::vector<CellRow> completed = flushRoad();
    road_id_.reset();
    previous_point_.reset();
    previous_inside_ = false;
    return completed;
}

std::vector<CellRow> CellPartitioner::flushRoad() {
    std::vector<CellRow> rows;
    if (road_conflict_ || road_points_.empty()) {
        road_points_.clear();
        return rows;
    }

    const bool tag_segments = segment_count_ > 1;
    rows.reserve(road_points_.size());
    for (const auto& pending : road_points_) {
        std::string node_id = pending.point.node_id;
        if (tag_segments) {
            node_id += "_segment_" + std::to_string(pending.segment_index);
        }
        rows.emplace_back(cell_label_, pending.point.road_id, node_id, pending.point.lat, pending.point.lon);
    }

    total_length_km_ += road_length_km_;
    road_points_.clear();
    road_length_km_ = 0.0;
    return rows;
}

CellPartitionStream::CellPartitionStream(WaypointSource& source, const Cell& cell, size_t cell_id,
                                         BoundaryMode mode, IdAllocator& ids)
    : source_(source), partitioner_(cell, cell_id, mode, ids), finished_(false) {}

std::optional<CellRow> CellPartitionStream::next() {
    while (ready_.empty() && !finished_) {
        std::vector<CellRow> rows;
        if (auto row = source_.next()) {
            rows = partitioner_.push(*row);
        } else {
            rows = partitioner_.finish();
            finished_ = true;
        }
        std::move(rows.begin(), rows.end(), std::back_inserter(ready_));
    }

    if (ready_.empty()) {
        return std::nullopt;
    }

    CellRow row = std::move(ready_.front());
    ready_.pop_front();
    return row;
}

void CellPartitionStream::restart() {
    source_.reset();
    partitioner_.reset();
    ready_.clear();
    finished_ = false;
}

PartitionResult partition(WaypointSource& source, const Cell& cell, size_t cell_id, BoundaryMode mode, IdAllocator& ids) {
    CellPartitionStream stream(source, cell, cell_id, mode, ids);

    PartitionResult result(stream.getPartitioner().getCellLabel());
    while (auto row = stream.next()) {
        result.rows.push_back(*row);
    }

    result.total = stream.getPartitioner().getTotal();
    result.errors = stream.getPartitioner().getErrors();
    return result;
}

BoundaryMode parseBoundaryMode(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

    if (lowered == "drop") {
        return BoundaryMode::DROP;
    }
    if (lowered == "interpolate") {
        return BoundaryMode::INTERPOLATE;
    }
    throw InvalidParameterError("Unknown boundary mode '" + name + "' (expected 'drop' or 'interpolate')");
}

std::string boundaryModeName(BoundaryMode mode) {
    return mode == BoundaryMode::INTERPOLATE ? "interpolate" : "drop";
}

} // namespace geo
} // namespace waygrid
