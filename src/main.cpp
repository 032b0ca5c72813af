#include <iostream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "tool/tool_interface.hpp"

using namespace tool_interface;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --input-file <path> --output-file <path> --mode <mode> [options]\n"
              << "\nRequired arguments:\n"
              << "  --input-file <path>          Path to the waypoint table (CSV or any OGR vector format)\n"
              << "  --mode <mode>                Operation mode: 'resample', 'thin', 'cell-partition', or 'road-summary'\n"
              << "  --output-file <path>         Output file path with extension (required for all modes)\n"
              << "\nOptional arguments:\n"
              << "  --road-id-field <name>       Field name for road ID (default: road_id)\n"
              << "  --node-id-field <name>       Field name for node ID (default: node_id)\n"
              << "  --lat-field <name>           Field name for latitude (default: lat)\n"
              << "  --lon-field <name>           Field name for longitude (default: lon)\n"
              << "  --layer-index <n>            Input layer to read (default: 0)\n"
              << "  --first-generated-id <n>     First number used for generated node ids (default: 0)\n"
              << "\nFor resample and thin modes, additional required arguments:\n"
              << "  --min-distance <km>          Waypoint spacing in kilometers\n"
              << "\nFor cell-partition mode, additional required arguments:\n"
              << "  --cells <cells>              Cells as 's,w,n,e' separated by ';'\n"
              << "\nFor cell-partition mode, additional optional arguments:\n"
              << "  --boundary-mode <mode>       'drop' or 'interpolate' (required for cell-partition)\n"
              << "  --min-distance <km>          Resample roads at this spacing before partitioning\n"
              << "  --totals-file <path>         Output file for per-cell lengths (default: <output>_totals.<ext>)\n"
              << "\nExamples:\n"
              << "  " << programName << " --input-file waypoints.csv --mode resample --output-file resampled.csv --min-distance 0.2\n"
              << "  " << programName << " --input-file waypoints.csv --mode cell-partition --output-file cells.csv --cells \"40.0,-75.2,40.1,-75.1;40.1,-75.2,40.2,-75.1\" --boundary-mode interpolate\n"
              << "  " << programName << " --input-file waypoints.csv --mode road-summary --output-file roads.geojson\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "WayGrid - Road Waypoint Resampling and Cell Partitioning Tool\n"
              << "=============================================================\n\n"
              << "WayGrid reads road waypoint tables (one row per waypoint, rows of a road contiguous and in order).\n\n"
              << "MODES:\n\n"
              << "1. RESAMPLE MODE (--mode resample)\n"
              << "   Inserts generated waypoints so that consecutive points of a road are at most --min-distance km apart.\n"
              << "   Original waypoints are kept. Output adds dist_last, the distance from the previous point of the road.\n\n"
              << "   Example:\n"
              << "     " << programName << " --input-file waypoints.csv --mode resample --output-file resampled.csv --min-distance 0.2\n\n"
              << "2. THIN MODE (--mode thin)\n"
              << "   Keeps only waypoints more than --min-distance km from the last kept one.\n"
              << "   The first and last waypoints of every road are kept.\n\n"
              << "   Example:\n"
              << "     " << programName << " --input-file waypoints.csv --mode thin --output-file thinned.csv --min-distance 0.05\n\n"
              << "3. CELL PARTITION MODE (--mode cell-partition)\n"
              << "   Clips every road against each cell and writes the in-cell waypoints labelled '<s,w,n,e>_<cell index>'.\n"
              << "   A road entering a cell more than once gets node ids suffixed with '_segment_<k>'.\n"
              << "   Per-cell in-cell road length is written to the totals file.\n\n"
              << "   Required Arguments:\n"
              << "     --cells <cells>             Cells as 's,w,n,e' separated by ';'\n\n"
              << "   Optional Arguments:\n"
              << "     --boundary-mode <mode>      'drop' or 'interpolate' to add points on the cell edge (required)\n"
              << "     --min-distance <km>         Resample roads before partitioning\n"
              << "     --totals-file <path>        Output file for per-cell lengths\n\n"
              << "   Example:\n"
              << "     " << programName << " --input-file waypoints.csv --mode cell-partition --output-file cells.csv --cells \"40.0,-75.2,40.1,-75.1\" --boundary-mode drop\n\n"
              << "4. ROAD SUMMARY MODE (--mode road-summary)\n"
              << "   Writes one GeoJSON point per road at the middle of its extent, with waypoint count and length.\n\n"
              << "   Example:\n"
              << "     " << programName << " --input-file waypoints.csv --mode road-summary --output-file roads.geojson\n\n"
              << "INPUT DATASET RECOMMENDATIONS:\n\n"
              << "  - Coordinates are WGS84 latitude and longitude in degrees\n"
              << "  - Point geometry is used when the latitude and longitude fields are absent\n"
              << "  - Rows that fail to parse are skipped and reported\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Values may start with '-' (negative coordinates), so only "--" marks the next option
            std::string next = i + 1 < argc ? argv[i + 1] : "";
            if (i + 1 < argc && next.substr(0, 2) != "--") {
                args[key] = next;
                i++; // Skip the value in next iteration
            } else {
                // This is a flag argument - set it to "true"
                args[key] = "true";
            }
        } else if (arg == "-h") {
            args["h"] = "true";
        } else if (arg == "-v") {
            args["v"] = "true";
        }
    }

    return args;
}

// "<dir>/<stem>_totals<ext>" next to the rows output
std::string defaultTotalsPath(const std::string& output_file) {
    std::filesystem::path path(output_file);
    std::filesystem::path totals = path.parent_path() / (path.stem().string() + "_totals" + path.extension().string());
    return totals.string();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "WayGrid v1.0.0\n";
            std::cout << "Road Waypoint Resampling and Cell Partitioning Tool\n";
            return 0;
        }

        // Check for required arguments
        if (args.count("input-file") == 0) {
            std::cerr << "Error: --input-file is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("output-file") == 0) {
            std::cerr << "Error: --output-file is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("mode") == 0) {
            std::cerr << "Error: --mode is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string mode = args.at("mode");

        if ((mode == "resample" || mode == "thin") && args.count("min-distance") == 0) {
            std::cerr << "Error: --min-distance is required for " << mode << " mode" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (mode == "cell-partition" && args.count("cells") == 0) {
            std::cerr << "Error: --cells is required for cell-partition mode" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (mode == "cell-partition" && args.count("boundary-mode") == 0) {
            std::cerr << "Error: --boundary-mode is required for cell-partition mode" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        // Convert arguments to JSON configurations
        nlohmann::json writer_config = nlohmann::json::object();
        if (mode == "cell-partition") {
            std::string output_file = args.at("output-file");
            writer_config["rows_output_file_path"] = output_file;
            writer_config["totals_output_file_path"] =
                args.count("totals-file") ? args.at("totals-file") : defaultTotalsPath(output_file);
        } else {
            writer_config["output_file_path"] = args.at("output-file");
        }

        nlohmann::json reader_config = nlohmann::json::object();
        reader_config["file_path"] = args.at("input-file");
        if (args.count("road-id-field")) reader_config["road_id_field"] = args.at("road-id-field");
        if (args.count("node-id-field")) reader_config["node_id_field"] = args.at("node-id-field");
        if (args.count("lat-field")) reader_config["lat_field"] = args.at("lat-field");
        if (args.count("lon-field")) reader_config["lon_field"] = args.at("lon-field");
        if (args.count("layer-index")) reader_config["layer_index"] = std::stoi(args.at("layer-index"));

        std::string result;

        if (mode == "resample" || mode == "thin") {
            nlohmann::json resample_config = nlohmann::json::object();
            resample_config["min_distance_km"] = std::stod(args.at("min-distance"));
            resample_config["thin"] = (mode == "thin");
            if (args.count("first-generated-id")) {
                resample_config["first_generated_id"] = std::stoull(args.at("first-generated-id"));
            }

            result = processResampleTool(
                writer_config.dump(),
                reader_config.dump(),
                resample_config.dump()
            );
        } else if (mode == "cell-partition") {
            nlohmann::json partition_config = nlohmann::json::object();
            partition_config["cells_str"] = args.at("cells");
            partition_config["boundary_mode"] = args.at("boundary-mode");
            if (args.count("min-distance")) {
                partition_config["min_distance_km"] = std::stod(args.at("min-distance"));
            }
            if (args.count("first-generated-id")) {
                partition_config["first_generated_id"] = std::stoull(args.at("first-generated-id"));
            }

            result = processCellPartitionTool(
                writer_config.dump(),
                reader_config.dump(),
                partition_config.dump()
            );
        } else if (mode == "road-summary") {
            result = processRoadSummaryTool(
                writer_config.dump(),
                reader_config.dump()
            );
        } else {
            std::cerr << "Error: Unknown mode '" << mode << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
