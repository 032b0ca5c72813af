#include "tool/tool_interface.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include "geo/cell_partitioner.hpp"
#include "geo/id_allocator.hpp"
#include "geo/resampler.hpp"
#include "geo/road_metrics.hpp"
#include "geo/waypoint_source.hpp"
#include "io/geojson_writer.hpp"

using namespace waygrid;

namespace tool_interface {

namespace {

std::string formatCoordinate(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

// Resampled waypoints as raw rows so that a second pass can read them like any other table
std::vector<geo::RawWaypointRow> toRawRows(const std::vector<geo::ResampledWaypoint>& waypoints) {
    std::vector<geo::RawWaypointRow> rows;
    rows.reserve(waypoints.size());
    for (size_t i = 0; i < waypoints.size(); ++i) {
        const geo::Waypoint& wp = waypoints[i].waypoint;
        rows.emplace_back(wp.road_id, wp.node_id, formatCoordinate(wp.lat), formatCoordinate(wp.lon), i + 1);
    }
    return rows;
}

void logRowErrors(const std::vector<geo::RowError>& errors, const std::string& context) {
    for (const auto& error : errors) {
        if (error.kind == geo::ErrorKind::MALFORMED_ROW) {
            std::cerr << "Warning: Skipping row " << error.row_number << context << ": " << error.message << std::endl;
        } else {
            std::cerr << "Warning: Leaving out road " << error.road_id << context << ": " << error.message << std::endl;
        }
    }
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

// Helper function to parse WaypointReaderConfig from JSON
io::WaypointReaderConfig parseWaypointReaderConfig(const nlohmann::json& config_json) {
    io::WaypointReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"].get<std::string>();
    }
    if (config_json.contains("road_id_field")) {
        config.road_id_field = config_json["road_id_field"].get<std::string>();
    }
    if (config_json.contains("node_id_field")) {
        config.node_id_field = config_json["node_id_field"].get<std::string>();
    }
    if (config_json.contains("lat_field")) {
        config.lat_field = config_json["lat_field"].get<std::string>();
    }
    if (config_json.contains("lon_field")) {
        config.lon_field = config_json["lon_field"].get<std::string>();
    }
    if (config_json.contains("layer_index")) {
        config.layer_index = config_json["layer_index"].get<int>();
    }

    return config;
}

// Helper function to parse ResampleWriterConfig from JSON
io::ResampleWriterConfig parseResampleWriterConfig(const nlohmann::json& config_json) {
    io::ResampleWriterConfig config;

    if (config_json.contains("output_file_path")) {
        config.output_file_path = config_json["output_file_path"].get<std::string>();
    }

    return config;
}

// Helper function to parse CellPartitionWriterConfig from JSON
io::CellPartitionWriterConfig parseCellPartitionWriterConfig(const nlohmann::json& config_json) {
    io::CellPartitionWriterConfig config;

    if (config_json.contains("rows_output_file_path")) {
        config.rows_output_file_path = config_json["rows_output_file_path"].get<std::string>();
    }
    if (config_json.contains("totals_output_file_path")) {
        config.totals_output_file_path = config_json["totals_output_file_path"].get<std::string>();
    }

    return config;
}

ResampleToolConfig parseResampleToolConfig(const nlohmann::json& config_json) {
    ResampleToolConfig config;

    if (!config_json.contains("min_distance_km")) {
        throw geo::InvalidParameterError("min_distance_km is required");
    }
    config.min_distance_km = config_json["min_distance_km"].get<double>();
    if (!(config.min_distance_km > 0.0)) {
        throw geo::InvalidParameterError("min_distance_km must be positive");
    }

    config.thin = config_json.value("thin", false);
    config.first_generated_id = config_json.value("first_generated_id", static_cast<uint64_t>(0));

    return config;
}

std::vector<geo::Cell> parseCellList(const std::string& cells_str) {
    std::vector<geo::Cell> cells;
    std::stringstream ss(cells_str);
    std::string item;

    // A trailing ';' is tolerated; an empty entry anywhere else would shift the cell ids after it
    while (std::getline(ss, item, ';')) {
        item = trim(item);
        if (item.empty()) {
            if (ss.eof()) {
                break;
            }
            throw geo::InvalidParameterError("Empty cell at position " + std::to_string(cells.size()) +
                                             " in cell list '" + cells_str + "'");
        }
        cells.push_back(geo::Cell::fromString(item));
    }

    return cells;
}

CellPartitionToolConfig parseCellPartitionToolConfig(const nlohmann::json& config_json) {
    CellPartitionToolConfig config;

    if (config_json.contains("cells")) {
        for (const auto& cell_json : config_json["cells"]) {
            config.cells.push_back(geo::Cell::fromString(cell_json.get<std::string>()));
        }
    }
    if (config_json.contains("cells_str")) {
        std::vector<geo::Cell> listed = parseCellList(config_json["cells_str"].get<std::string>());
        config.cells.insert(config.cells.end(), listed.begin(), listed.end());
    }
    if (config.cells.empty()) {
        throw geo::InvalidParameterError("At least one cell is required");
    }

    if (!config_json.contains("boundary_mode")) {
        throw geo::InvalidParameterError("boundary_mode is required");
    }
    config.boundary_mode = geo::parseBoundaryMode(config_json["boundary_mode"].get<std::string>());

    if (config_json.contains("min_distance_km")) {
        double min_distance_km = config_json["min_distance_km"].get<double>();
        if (!(min_distance_km > 0.0)) {
            throw geo::InvalidParameterError("min_distance_km must be positive");
        }
        config.min_distance_km = min_distance_km;
    }

    config.first_generated_id = config_json.value("first_generated_id", static_cast<uint64_t>(0));

    return config;
}

// Resample Tool
std::string processResampleTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json,
    const std::string& resample_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json reader_config = nlohmann::json::parse(reader_config_json);
        nlohmann::json resample_config = nlohmann::json::parse(resample_config_json);

        io::WaypointReaderConfig reader_cfg = parseWaypointReaderConfig(reader_config);
        io::ResampleWriterConfig writer_cfg = parseResampleWriterConfig(writer_config);
        ResampleToolConfig resample_cfg = parseResampleToolConfig(resample_config);

        io::WaypointReader reader(reader_cfg);
        if (!reader.open()) {
            return "Error: Failed to read waypoints: " + reader.getLastError();
        }

        geo::ResampleResult result;
        if (resample_cfg.thin) {
            geo::WaypointThinner thinner(resample_cfg.min_distance_km);
            result = thinner.thinSource(reader);
            std::cout << "Thinned " << result.road_count << " roads at " << resample_cfg.min_distance_km
                      << " km, kept " << result.waypoints.size() << " waypoints" << std::endl;
        } else {
            geo::IdAllocator ids(resample_cfg.first_generated_id);
            geo::Resampler resampler(resample_cfg.min_distance_km, ids);
            result = resampler.resampleSource(reader);
            std::cout << "Resampled " << result.road_count << " roads at " << resample_cfg.min_distance_km
                      << " km, generated " << result.generated_count << " waypoints" << std::endl;
        }
        logRowErrors(result.errors, "");

        if (result.waypoints.empty()) {
            return "Error: No waypoints left after " + std::string(resample_cfg.thin ? "thinning" : "resampling");
        }

        io::ResampleWriter writer;
        if (!writer.writeResampleResults(writer_cfg, result.waypoints)) {
            return "Error: Failed to write resampled waypoints: " + writer.getLastError();
        }

        return "Success: " + std::string(resample_cfg.thin ? "Thinning" : "Resampling") + " completed with " +
               std::to_string(result.waypoints.size()) + " waypoints on " + std::to_string(result.road_count) +
               " roads (" + std::to_string(result.errors.size()) + " rows or roads skipped)";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Cell Partition Tool
std::string processCellPartitionTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json,
    const std::string& partition_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json reader_config = nlohmann::json::parse(reader_config_json);
        nlohmann::json partition_config = nlohmann::json::parse(partition_config_json);

        io::WaypointReaderConfig reader_cfg = parseWaypointReaderConfig(reader_config);
        io::CellPartitionWriterConfig writer_cfg = parseCellPartitionWriterConfig(writer_config);
        CellPartitionToolConfig partition_cfg = parseCellPartitionToolConfig(partition_config);

        io::WaypointReader reader(reader_cfg);
        if (!reader.open()) {
            return "Error: Failed to read waypoints: " + reader.getLastError();
        }

        // One allocator for the whole run keeps resampling and boundary ids distinct
        geo::IdAllocator ids(partition_cfg.first_generated_id);
        size_t skipped = 0;

        geo::WaypointSource* source = &reader;
        std::unique_ptr<geo::VectorWaypointSource> resampled_source;
        if (partition_cfg.min_distance_km) {
            geo::Resampler resampler(*partition_cfg.min_distance_km, ids);
            geo::ResampleResult resampled = resampler.resampleSource(reader);
            std::cout << "Resampled " << resampled.road_count << " roads at " << *partition_cfg.min_distance_km
                      << " km, generated " << resampled.generated_count << " waypoints" << std::endl;
            logRowErrors(resampled.errors, "");
            skipped += resampled.errors.size();
            resampled_source = std::make_unique<geo::VectorWaypointSource>(toRawRows(resampled.waypoints));
            source = resampled_source.get();
        }

        io::CellPartitionWriter writer;
        if (!writer.open(writer_cfg)) {
            return "Error: Failed to create cell partition output: " + writer.getLastError();
        }

        std::vector<geo::CellTotal> totals;
        for (size_t cell_id = 0; cell_id < partition_cfg.cells.size(); ++cell_id) {
            source->reset();
            geo::CellPartitionStream stream(*source, partition_cfg.cells[cell_id], cell_id,
                                            partition_cfg.boundary_mode, ids);

            while (auto row = stream.next()) {
                if (!writer.writeRow(*row)) {
                    return "Error: Failed to write cell rows: " + writer.getLastError();
                }
            }

            const geo::CellPartitioner& partitioner = stream.getPartitioner();
            totals.push_back(partitioner.getTotal());
            skipped += partitioner.getErrors().size();
            logRowErrors(partitioner.getErrors(), " for cell " + partitioner.getCellLabel());

            std::cout << "Cell " << partitioner.getCellLabel() << ": " << partitioner.getTotalLengthKm()
                      << " km of road" << std::endl;
        }

        size_t rows_written = writer.getRowsWritten();
        writer.close();

        if (!writer.writeTotals(totals)) {
            return "Error: Failed to write cell totals: " + writer.getLastError();
        }

        return "Success: Cell partition completed with " + std::to_string(rows_written) + " rows across " +
               std::to_string(totals.size()) + " cells (" + std::to_string(skipped) + " rows or roads skipped)";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

// Road Summary Tool
std::string processRoadSummaryTool(
    const std::string& writer_config_json,
    const std::string& reader_config_json) {

    try {
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json reader_config = nlohmann::json::parse(reader_config_json);

        io::WaypointReaderConfig reader_cfg = parseWaypointReaderConfig(reader_config);
        std::string output_file_path = writer_config.value("output_file_path", std::string());
        if (output_file_path.empty()) {
            return "Error: output_file_path is required";
        }

        io::WaypointReader reader(reader_cfg);
        if (!reader.open()) {
            return "Error: Failed to read waypoints: " + reader.getLastError();
        }

        std::vector<geo::RowError> errors;
        std::vector<geo::RoadSummary> summaries = geo::RoadMetrics::summarizeSource(reader, errors);
        logRowErrors(errors, "");
        std::cout << "Summarized " << summaries.size() << " roads" << std::endl;

        if (summaries.empty()) {
            return "Error: No roads found in input";
        }

        io::GeospatialDataset dataset = io::GeoJSONWriter::roadSummariesToDataset(summaries);
        if (!io::GeoJSONWriter::writeToFile(dataset, output_file_path)) {
            return "Error: Failed to write road summaries: " + io::GeoJSONWriter::getLastError();
        }

        return "Success: Road summary completed with " + std::to_string(summaries.size()) + " roads (" +
               std::to_string(errors.size()) + " rows skipped)";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace tool_interface
