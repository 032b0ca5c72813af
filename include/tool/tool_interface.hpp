#ifndef WAYGRID_TOOL_INTERFACE_HPP
#define WAYGRID_TOOL_INTERFACE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"
#include "io/waypoint_reader.hpp"
#include "io/writer_cell_partition.hpp"
#include "io/writer_resample.hpp"

namespace tool_interface {

// Parameters of the resample and thin tools
struct ResampleToolConfig {
    double min_distance_km;
    bool thin;                      // Drop close waypoints instead of inserting new ones
    uint64_t first_generated_id;

    ResampleToolConfig() : min_distance_km(0.0), thin(false), first_generated_id(0) {}
};

// Parameters of the cell partition tool
struct CellPartitionToolConfig {
    std::vector<waygrid::geo::Cell> cells;          // Position in the list is the cell id
    waygrid::geo::BoundaryMode boundary_mode;
    std::optional<double> min_distance_km;          // Resample before partitioning when set
    uint64_t first_generated_id;

    CellPartitionToolConfig() : first_generated_id(0) {}
};

waygrid::io::WaypointReaderConfig parseWaypointReaderConfig(const nlohmann::json& config_json);

waygrid::io::ResampleWriterConfig parseResampleWriterConfig(const nlohmann::json& config_json);

waygrid::io::CellPartitionWriterConfig parseCellPartitionWriterConfig(const nlohmann::json& config_json);

/**
 * @throws waygrid::geo::InvalidParameterError for a missing or non-positive min_distance_km
 */
ResampleToolConfig parseResampleToolConfig(const nlohmann::json& config_json);

/**
 * Accepts "cells" as an array of "s,w,n,e" strings or "cells_str" as one string with cells separated by ';'
 * "boundary_mode" ("drop" or "interpolate") has no default and must be given
 * @throws waygrid::geo::InvalidParameterError for malformed cells, no cells, or a missing or unknown boundary mode
 */
CellPartitionToolConfig parseCellPartitionToolConfig(const nlohmann::json& config_json);

/**
 * Split "s,w,n,e;s,w,n,e;..." into cells
 * @throws waygrid::geo::InvalidParameterError for a malformed or empty cell (a single trailing ';' is allowed)
 */
std::vector<waygrid::geo::Cell> parseCellList(const std::string& cells_str);

/**
 * Resample Tool
 * Resamples (or thins) every road of the input table
 * @param writer_config_json JSON string for writer configuration (output_file_path)
 * @param reader_config_json JSON string for waypoint reader configuration
 * @param resample_config_json JSON string for resample configuration (min_distance_km, thin, first_generated_id)
 * @return Result message (success or error)
 */
std::string processResampleTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json,
    const std::string& resample_config_json
);

/**
 * Cell Partition Tool
 * Partitions the input table against every requested cell
 * @param writer_config_json JSON string for writer configuration (rows_output_file_path, totals_output_file_path)
 * @param reader_config_json JSON string for waypoint reader configuration
 * @param partition_config_json JSON string for partition configuration (cells or cells_str, boundary_mode, min_distance_km, first_generated_id)
 * @return Result message (success or error)
 */
std::string processCellPartitionTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json,
    const std::string& partition_config_json
);

/**
 * Road Summary Tool
 * Writes per-road length and midpoint as GeoJSON
 * @param writer_config_json JSON string for writer configuration (output_file_path)
 * @param reader_config_json JSON string for waypoint reader configuration
 * @return Result message (success or error)
 */
std::string processRoadSummaryTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json
);

} // namespace tool_interface

#endif // WAYGRID_TOOL_INTERFACE_HPP
