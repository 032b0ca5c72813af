#ifndef WAYGRID_COMMON_HPP
#define WAYGRID_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>

namespace waygrid {
namespace geo {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// Planar lon/lat geometry types (x = longitude, y = latitude, degrees)
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using Box = bg::model::box<Point>;

// Mean Earth radius in kilometers
constexpr double kEarthRadiusKm = 6371.0;

// Decimal places used when comparing distances against a spacing threshold
constexpr int kDistancePrecision = 6;

// Boundary-crossing behavior of the cell partitioner
enum class BoundaryMode {
    DROP,           // Outside points next to a crossing are dropped
    INTERPOLATE     // An interpolated point on the cell edge is emitted at each crossing
};

// Error kinds recorded next to streamed output
enum class ErrorKind {
    MALFORMED_ROW,                  // Unparseable coordinates or missing fields
    DUPLICATE_COORDINATE_CONFLICT   // Two node ids report identical coordinates on one road
};

/**
 * Raised for bad cell bounds or a non-positive resampling distance
 */
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * Raised when two different node ids on the same road share coordinates
 */
class DuplicateCoordinateConflictError : public std::runtime_error {
public:
    DuplicateCoordinateConflictError(const std::string& road, const std::string& first_node, const std::string& second_node)
        : std::runtime_error("Duplicate lat and lon for different nodes " + first_node + " and " + second_node +
                             " on road " + road),
          road_id(road) {}

    std::string road_id;
};

// Waypoint on a road, coordinates in degrees
struct Waypoint {
    std::string road_id;
    std::string node_id;
    double lat;
    double lon;

    Waypoint() : lat(0.0), lon(0.0) {}

    Waypoint(const std::string& road, const std::string& node, double latitude, double longitude)
        : road_id(road), node_id(node), lat(latitude), lon(longitude) {}

    bool sameCoordinates(const Waypoint& other) const {
        return lat == other.lat && lon == other.lon;
    }

    Point toPoint() const { return Point(lon, lat); }
};

// Ordered waypoints of one road
using Road = std::vector<Waypoint>;

// Unparsed input row as delivered by the ingestion layer
struct RawWaypointRow {
    std::string road_id;
    std::string node_id;
    std::string lat;
    std::string lon;
    size_t row_number;      // Position in the source, used in error records

    RawWaypointRow() : row_number(0) {}

    RawWaypointRow(const std::string& road, const std::string& node, const std::string& latitude,
                   const std::string& longitude, size_t row = 0)
        : road_id(road), node_id(node), lat(latitude), lon(longitude), row_number(row) {}
};

// Error recorded for a skipped row or a withheld road
struct RowError {
    ErrorKind kind;
    size_t row_number;
    std::string road_id;
    std::string node_id;
    std::string message;

    RowError(ErrorKind error_kind, size_t row, const std::string& road, const std::string& node, const std::string& msg)
        : kind(error_kind), row_number(row), road_id(road), node_id(node), message(msg) {}
};

/**
 * Axis-aligned geographic cell (degrees)
 * The cell text is the "s,w,n,e" string the cell was described with.
 */
class Cell {
public:
    /**
     * Create a cell from its bounds
     * @throws InvalidParameterError if min >= max on either axis
     */
    Cell(double min_lat, double min_lon, double max_lat, double max_lon);

    /**
     * Parse a cell from "south,west,north,east"
     * @throws InvalidParameterError if the string is not four numbers or the bounds are malformed
     */
    static Cell fromString(const std::string& text);

    double minLat() const { return bg::get<bg::min_corner, 1>(box_); }
    double minLon() const { return bg::get<bg::min_corner, 0>(box_); }
    double maxLat() const { return bg::get<bg::max_corner, 1>(box_); }
    double maxLon() const { return bg::get<bg::max_corner, 0>(box_); }

    const Box& box() const { return box_; }

    // "s,w,n,e" text of the cell
    const std::string& text() const { return text_; }

    // "<text>_<cell_id>"
    std::string label(size_t cell_id) const;

private:
    Box box_;
    std::string text_;
};

// Output row of the cell partitioner
struct CellRow {
    std::string cell_label;
    std::string road_id;
    std::string node_id;    // May carry a "_segment_<k>" suffix
    double lat;
    double lon;

    CellRow(const std::string& label, const std::string& road, const std::string& node, double latitude, double longitude)
        : cell_label(label), road_id(road), node_id(node), lat(latitude), lon(longitude) {}
};

// Aggregate in-cell road length for one cell
struct CellTotal {
    std::string cell_label;
    double total_length_km;

    CellTotal(const std::string& label, double length)
        : cell_label(label), total_length_km(length) {}
};

// Materialized partition of one cell
struct PartitionResult {
    std::vector<CellRow> rows;
    CellTotal total;
    std::vector<RowError> errors;

    explicit PartitionResult(const std::string& label) : total(label, 0.0) {}
};

// Resampled or thinned waypoint with the distance from the previous point of its road
struct ResampledWaypoint {
    Waypoint waypoint;
    double distance_from_last_km;

    ResampledWaypoint(const Waypoint& wp, double distance)
        : waypoint(wp), distance_from_last_km(distance) {}
};

// Result of resampling a whole road-grouped table
struct ResampleResult {
    std::vector<ResampledWaypoint> waypoints;
    std::vector<RowError> errors;
    size_t road_count;
    size_t generated_count;

    ResampleResult() : road_count(0), generated_count(0) {}
};

// Per-road length and midpoint
struct RoadSummary {
    std::string road_id;
    size_t waypoint_count;
    double length_km;
    double mid_lat;
    double mid_lon;

    RoadSummary(const std::string& road, size_t count, double length, double midpoint_lat, double midpoint_lon)
        : road_id(road), waypoint_count(count), length_km(length), mid_lat(midpoint_lat), mid_lon(midpoint_lon) {}
};

/**
 * Parse a raw row into a waypoint
 * @param row Raw row
 * @param waypoint Parsed waypoint (set on success)
 * @param error Reason for failure (set on failure)
 * @return true if the row has ids and both coordinates parse as finite numbers
 */
bool parseWaypointRow(const RawWaypointRow& row, Waypoint& waypoint, std::string& error);

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_COMMON_HPP
