#include "io/writer_resample.hpp"
#include "io/gdal_utils.hpp"
#include <ogr_srs_api.h>
#include <iostream>

namespace waygrid {
namespace io {

bool ResampleWriter::writeFeature(OGRLayerH layer, bool with_geometry, const geo::ResampledWaypoint& resampled) {
    const geo::Waypoint& waypoint = resampled.waypoint;

    OGRFeatureH feature = OGR_F_Create(OGR_L_GetLayerDefn(layer));
    if (!feature) {
        last_error_ = "Failed to create feature";
        return false;
    }

    if (with_geometry) {
        OGRGeometryH point = OGR_G_CreateGeometry(wkbPoint);
        OGR_G_SetPoint_2D(point, 0, waypoint.lon, waypoint.lat);
        OGR_F_SetGeometryDirectly(feature, point);
    }

    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "road_id"), waypoint.road_id.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "node_id"), waypoint.node_id.c_str());
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lat"), waypoint.lat);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lon"), waypoint.lon);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "dist_last"), resampled.distance_from_last_km);

    if (OGR_L_CreateFeature(layer, feature) != OGRERR_NONE) {
        last_error_ = "Failed to create feature in layer";
        OGR_F_Destroy(feature);
        return false;
    }

    OGR_F_Destroy(feature);
    return true;
}

bool ResampleWriter::writeResampleResults(const ResampleWriterConfig& config,
                                          const std::vector<geo::ResampledWaypoint>& waypoints) {
    clearError();

    if (waypoints.empty()) {
        last_error_ = "No waypoints to write";
        return false;
    }

    output_file_path_ = config.output_file_path;
    std::string format;
    GDALDatasetH dataset = GDALUtils::createVectorDataset(output_file_path_, format, last_error_);
    if (!dataset) {
        return false;
    }

    const bool with_geometry = !GDALUtils::isTableFormat(format);
    OGRSpatialReferenceH layer_srs = with_geometry ? GDALUtils::createWGS84SpatialRef() : nullptr;

    OGRLayerH layer = GDALDatasetCreateLayer(dataset, "resampled_waypoints", layer_srs,
                                             with_geometry ? wkbPoint : wkbNone, nullptr);
    if (layer_srs) OSRDestroySpatialReference(layer_srs);
    if (!layer) {
        last_error_ = "Failed to create layer: resampled_waypoints";
        GDALClose(dataset);
        return false;
    }

    bool fields_created = GDALUtils::addField(layer, "road_id", OFTString) &&
                          GDALUtils::addField(layer, "node_id", OFTString) &&
                          GDALUtils::addField(layer, "lat", OFTReal) &&
                          GDALUtils::addField(layer, "lon", OFTReal) &&
                          GDALUtils::addField(layer, "dist_last", OFTReal);
    if (!fields_created) {
        last_error_ = "Failed to create fields in layer: resampled_waypoints";
        GDALClose(dataset);
        return false;
    }

    for (const auto& waypoint : waypoints) {
        if (!writeFeature(layer, with_geometry, waypoint)) {
            GDALClose(dataset);
            return false;
        }
    }

    GDALClose(dataset);

    std::cout << "Successfully wrote " << waypoints.size() << " waypoints to: " << output_file_path_ << std::endl;
    return true;
}

} // namespace io
} // namespace waygrid
