#ifndef WAYGRID_CELL_PARTITIONER_HPP
#define WAYGRID_CELL_PARTITIONER_HPP

#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "geo/common.hpp"
#include "geo/id_allocator.hpp"
#include "geo/waypoint_source.hpp"

namespace waygrid {
namespace geo {

/**
 * Single-pass clipping of road-grouped waypoint rows against one cell
 *
 * Rows are pushed in source order. The in-cell rows of a road are held until the
 * road ends, because a road that enters the cell more than once has every emitted
 * node id suffixed with "_segment_<k>" (k counted from 0), which is only known once
 * the whole road has been seen. Output order equals input order.
 *
 * Only hops between consecutive in-cell points of the same road count toward the
 * cell's total length. In INTERPOLATE mode the hop between a crossing point on the
 * cell edge and its in-cell neighbor counts as well.
 */
class CellPartitioner {
public:
    /**
     * @param cell Cell to clip against
     * @param cell_id Position of the cell in the caller's cell list
     * @param mode Boundary-crossing behavior
     * @param ids Allocator for boundary point ids
     */
    CellPartitioner(const Cell& cell, size_t cell_id, BoundaryMode mode, IdAllocator& ids);

    // Disable copy constructor and assignment
    CellPartitioner(const CellPartitioner&) = delete;
    CellPartitioner& operator=(const CellPartitioner&) = delete;

    /**
     * Consume one row
     * Malformed rows are recorded and skipped without touching the walk state.
     * @param row Raw input row
     * @return Rows of the previous road if this row starts a new road, otherwise empty
     */
    std::vector<CellRow> push(const RawWaypointRow& row);

    /**
     * Flush the road in progress
     * @return Remaining rows
     */
    std::vector<CellRow> finish();

    /**
     * Clear all state, including the accumulated length and errors
     */
    void reset();

    const std::string& getCellLabel() const { return cell_label_; }
    double getTotalLengthKm() const { return total_length_km_; }
    CellTotal getTotal() const { return CellTotal(cell_label_, total_length_km_); }
    const std::vector<RowError>& getErrors() const { return errors_; }
    BoundaryMode getBoundaryMode() const { return mode_; }

private:
    // In-cell point waiting for its road to end
    struct PendingPoint {
        Waypoint point;
        size_t segment_index;

        PendingPoint(const Waypoint& wp, size_t segment) : point(wp), segment_index(segment) {}
    };

    Cell cell_;
    std::string cell_label_;
    BoundaryMode mode_;
    IdAllocator& ids_;

    // Walk state for the road in progress
    std::optional<std::string> road_id_;
    std::optional<Waypoint> previous_point_;
    bool previous_inside_;
    std::vector<PendingPoint> road_points_;
    size_t segment_count_;
    double road_length_km_;
    bool road_conflict_;

    double total_length_km_;
    std::vector<RowError> errors_;

    void startRoad(const std::string& road_id);

    std::vector<CellRow> flushRoad();

    /**
     * Interpolated point on the cell edge between an inside and an outside point
     */
    Waypoint crossingPoint(const Waypoint& inside, const Waypoint& outside);
};

/**
 * Lazy sequence of one cell's output rows over a WaypointSource
 * Rows are produced as the source is read, so memory stays bounded by one road.
 * The caller may stop calling next() at any time to abandon the pass.
 */
class CellPartitionStream {
public:
    CellPartitionStream(WaypointSource& source, const Cell& cell, size_t cell_id, BoundaryMode mode, IdAllocator& ids);

    // Disable copy constructor and assignment
    CellPartitionStream(const CellPartitionStream&) = delete;
    CellPartitionStream& operator=(const CellPartitionStream&) = delete;

    /**
     * Next output row
     * @return Row, or nullopt once the source is exhausted
     */
    std::optional<CellRow> next();

    /**
     * Rewind the source and start the pass over
     * Boundary points of the new pass receive fresh ids.
     */
    void restart();

    bool isFinished() const { return finished_ && ready_.empty(); }

    // Length and errors accumulated so far; complete once isFinished()
    const CellPartitioner& getPartitioner() const { return partitioner_; }

private:
    WaypointSource& source_;
    CellPartitioner partitioner_;
    std::deque<CellRow> ready_;
    bool finished_;
};

/**
 * Partition a whole source against one cell and collect the output
 */
PartitionResult partition(WaypointSource& source, const Cell& cell, size_t cell_id, BoundaryMode mode, IdAllocator& ids);

/**
 * Parse a boundary mode name ("drop" or "interpolate")
 * @throws InvalidParameterError for any other name
 */
BoundaryMode parseBoundaryMode(const std::string& name);

std::string boundaryModeName(BoundaryMode mode);

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_CELL_PARTITIONER_HPP
