#include "io/writer_cell_partition.hpp"
#include "io/gdal_utils.hpp"
#include <ogr_srs_api.h>
#include <iostream>

namespace waygrid {
namespace io {

CellPartitionWriter::CellPartitionWriter()
    : rows_dataset_(nullptr), rows_layer_(nullptr), rows_with_geometry_(false), rows_written_(0) {}

CellPartitionWriter::~CellPartitionWriter() {
    close();
}

void CellPartitionWriter::close() {
    rows_layer_ = nullptr;
    if (rows_dataset_) {
        GDALClose(rows_dataset_);
        rows_dataset_ = nullptr;
        std::cout << "Successfully wrote " << rows_written_ << " cell rows to: " << rows_output_file_path_ << std::endl;
    }
}

bool CellPartitionWriter::open(const CellPartitionWriterConfig& config) {
    close();
    clearError();
    rows_written_ = 0;

    rows_output_file_path_ = config.rows_output_file_path;
    totals_output_file_path_ = config.totals_output_file_path;

    std::string format;
    rows_dataset_ = GDALUtils::createVectorDataset(rows_output_file_path_, format, last_error_);
    if (!rows_dataset_) {
        return false;
    }

    rows_with_geometry_ = !GDALUtils::isTableFormat(format);
    OGRSpatialReferenceH layer_srs = rows_with_geometry_ ? GDALUtils::createWGS84SpatialRef() : nullptr;

    rows_layer_ = GDALDatasetCreateLayer(rows_dataset_, "cell_waypoints", layer_srs,
                                         rows_with_geometry_ ? wkbPoint : wkbNone, nullptr);
    if (layer_srs) OSRDestroySpatialReference(layer_srs);
    if (!rows_layer_) {
        last_error_ = "Failed to create layer: cell_waypoints";
        GDALClose(rows_dataset_);
        rows_dataset_ = nullptr;
        return false;
    }

    bool fields_created = GDALUtils::addField(rows_layer_, "cell_label", OFTString) &&
                          GDALUtils::addField(rows_layer_, "road_id", OFTString) &&
                          GDALUtils::addField(rows_layer_, "node_id", OFTString) &&
                          GDALUtils::addField(rows_layer_, "lat", OFTReal) &&
                          GDALUtils::addField(rows_layer_, "lon", OFTReal);
    if (!fields_created) {
        last_error_ = "Failed to create fields in layer: cell_waypoints";
        GDALClose(rows_dataset_);
        rows_dataset_ = nullptr;
        rows_layer_ = nullptr;
        return false;
    }

    return true;
}

bool CellPartitionWriter::writeRow(const geo::CellRow& row) {
    if (!rows_layer_) {
        last_error_ = "Cell rows dataset is not open";
        return false;
    }

    OGRFeatureH feature = OGR_F_Create(OGR_L_GetLayerDefn(rows_layer_));
    if (!feature) {
        last_error_ = "Failed to create feature";
        return false;
    }

    if (rows_with_geometry_) {
        OGRGeometryH point = OGR_G_CreateGeometry(wkbPoint);
        OGR_G_SetPoint_2D(point, 0, row.lon, row.lat);
        OGR_F_SetGeometryDirectly(feature, point);
    }

    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "cell_label"), row.cell_label.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "road_id"), row.road_id.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "node_id"), row.node_id.c_str());
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lat"), row.lat);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "lon"), row.lon);

    if (OGR_L_CreateFeature(rows_layer_, feature) != OGRERR_NONE) {
        last_error_ = "Failed to create feature in layer";
        OGR_F_Destroy(feature);
        return false;
    }

    OGR_F_Destroy(feature);
    rows_written_++;
    return true;
}

bool CellPartitionWriter::writeTotals(const std::vector<geo::CellTotal>& totals) {
    std::string format;
    GDALDatasetH dataset = GDALUtils::createVectorDataset(totals_output_file_path_, format, last_error_);
    if (!dataset) {
        return false;
    }

    OGRLayerH layer = GDALDatasetCreateLayer(dataset, "cell_totals", nullptr, wkbNone, nullptr);
    if (!layer) {
        last_error_ = "Failed to create layer: cell_totals";
        GDALClose(dataset);
        return false;
    }

    if (!GDALUtils::addField(layer, "cell_label", OFTString) || !GDALUtils::addField(layer, "length_km", OFTReal)) {
        last_error_ = "Failed to create fields in layer: cell_totals";
        GDALClose(dataset);
        return false;
    }

    for (const auto& total : totals) {
        OGRFeatureH feature = OGR_F_Create(OGR_L_GetLayerDefn(layer));
        OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "cell_label"), total.cell_label.c_str());
        OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "length_km"), total.total_length_km);

        if (OGR_L_CreateFeature(layer, feature) != OGRERR_NONE) {
            last_error_ = "Failed to create feature in layer: cell_totals";
            OGR_F_Destroy(feature);
            GDALClose(dataset);
            return false;
        }
        OGR_F_Destroy(feature);
    }

    GDALClose(dataset);

    std::cout << "Successfully wrote " << totals.size() << " cell totals to: " << totals_output_file_path_ << std::endl;
    return true;
}

} // namespace io
} // namespace waygrid
