#include "io/geojson_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace waygrid {
namespace io {

std::string GeoJSONWriter::last_error_ = "";

bool GeoJSONWriter::writeToFile(const GeospatialDataset& dataset, const std::string& filepath) {
    try {
        std::string geojson_string = writeToString(dataset);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        file << geojson_string;
        file.close();

        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + filepath + ": " + e.what());
        return false;
    }
}

std::string GeoJSONWriter::writeToString(const GeospatialDataset& dataset) {
    try {
        nlohmann::json geojson;
        geojson["type"] = "FeatureCollection";

        if (!dataset.crs.empty()) {
            setCRS(geojson, dataset.crs);
        }

        nlohmann::json features = nlohmann::json::array();
        for (const auto& feature : dataset.features) {
            features.push_back(featureToGeoJSON(feature));
        }
        geojson["features"] = features;

        return geojson.dump(2);

    } catch (const std::exception& e) {
        setError("Error converting dataset to GeoJSON: " + std::string(e.what()));
        throw std::runtime_error(last_error_);
    }
}

GeospatialDataset GeoJSONWriter::roadSummariesToDataset(const std::vector<geo::RoadSummary>& summaries) {
    std::vector<GeospatialFeature> features;
    features.reserve(summaries.size());

    for (size_t i = 0; i < summaries.size(); ++i) {
        const auto& summary = summaries[i];

        nlohmann::json geometry;
        geometry["type"] = "Point";
        geometry["coordinates"] = {summary.mid_lon, summary.mid_lat};

        nlohmann::json properties;
        properties["road_id"] = summary.road_id;
        properties["waypoint_count"] = summary.waypoint_count;
        properties["length_km"] = summary.length_km;

        features.emplace_back(i, geometry, properties);
    }

    return GeospatialDataset("EPSG:4326", features);
}

void GeoJSONWriter::setCRS(nlohmann::json& geojson, const std::string& crs) {
    nlohmann::json crs_obj;

    // Standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
    crs_obj["type"] = "name";
    crs_obj["properties"]["name"] = crs;

    geojson["crs"] = crs_obj;
}

nlohmann::json GeoJSONWriter::featureToGeoJSON(const GeospatialFeature& feature) {
    nlohmann::json feature_json;
    feature_json["type"] = "Feature";
    feature_json["geometry"] = feature.geometry;

    nlohmann::json properties = feature.properties;
    properties["id"] = feature.id;
    feature_json["properties"] = properties;

    return feature_json;
}

} // namespace io
} // namespace waygrid
