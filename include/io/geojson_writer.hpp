#ifndef WAYGRID_GEOJSON_WRITER_HPP
#define WAYGRID_GEOJSON_WRITER_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"

namespace waygrid {
namespace io {

// Feature with GeoJSON geometry and properties
struct GeospatialFeature {
    size_t id;
    nlohmann::json geometry;
    nlohmann::json properties;

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// Feature collection with its CRS name
struct GeospatialDataset {
    std::string crs;
    std::vector<GeospatialFeature> features;

    GeospatialDataset(const std::string& crs_name, const std::vector<GeospatialFeature>& feature_list)
        : crs(crs_name), features(feature_list) {}
};

/**
 * GeoJSON writer for converting GeospatialDataset objects to GeoJSON files
 */
class GeoJSONWriter {
public:
    /**
     * Write a GeospatialDataset to a GeoJSON file
     * @param dataset Dataset to write
     * @param filepath Path to the output GeoJSON file
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const GeospatialDataset& dataset, const std::string& filepath);

    /**
     * Convert a GeospatialDataset to a GeoJSON string
     * @param dataset Dataset to convert
     * @return GeoJSON string representation
     */
    static std::string writeToString(const GeospatialDataset& dataset);

    /**
     * Road summaries as midpoint features carrying road_id, waypoint_count and length_km
     * @param summaries Road summaries
     * @return Dataset in EPSG:4326
     */
    static GeospatialDataset roadSummariesToDataset(const std::vector<geo::RoadSummary>& summaries);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    static nlohmann::json featureToGeoJSON(const GeospatialFeature& feature);

    static void setCRS(nlohmann::json& geojson, const std::string& crs);

    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    GeoJSONWriter() = delete;
};

} // namespace io
} // namespace waygrid

#endif // WAYGRID_GEOJSON_WRITER_HPP
