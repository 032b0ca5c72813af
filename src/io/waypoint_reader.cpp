#include "io/waypoint_reader.hpp"
#include "io/gdal_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace waygrid {
namespace io {

namespace {

std::string formatCoordinate(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

} // namespace

WaypointReader::WaypointReader(const WaypointReaderConfig& config)
    : config_(config), dataset_(nullptr), layer_(nullptr), road_id_index_(-1), node_id_index_(-1),
      lat_index_(-1), lon_index_(-1), coordinates_from_geometry_(false), row_number_(0) {
    GDALUtils::registerDrivers();
}

WaypointReader::~WaypointReader() {
    close();
}

void WaypointReader::close() {
    layer_ = nullptr;
    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }
}

bool WaypointReader::open() {
    close();
    last_error_.clear();

    // Keep every CSV column as text
    std::string extension = std::filesystem::path(config_.file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    const char* const csv_open_options[] = {"AUTODETECT_TYPE=NO", nullptr};
    const char* const* open_options = extension == ".csv" ? csv_open_options : nullptr;

    dataset_ = GDALOpenEx(config_.file_path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, open_options, nullptr);
    if (!dataset_) {
        last_error_ = "Failed to open waypoint file: " + config_.file_path;
        std::cerr << last_error_ << std::endl;
        return false;
    }

    int layer_count = GDALDatasetGetLayerCount(dataset_);
    if (config_.layer_index < 0 || config_.layer_index >= layer_count) {
        std::ostringstream oss;
        oss << "Layer index " << config_.layer_index << " is out of range. Dataset has " << layer_count << " layers.";
        last_error_ = oss.str();
        std::cerr << "Error: " << last_error_ << std::endl;
        close();
        return false;
    }

    layer_ = GDALDatasetGetLayer(dataset_, config_.layer_index);
    if (!layer_) {
        last_error_ = "No layer found at index " + std::to_string(config_.layer_index) + " in waypoint dataset";
        std::cerr << last_error_ << std::endl;
        close();
        return false;
    }

    std::cout << "Waypoint layer " << config_.layer_index << " name: " << OGR_L_GetName(layer_) << std::endl;

    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer_);
    road_id_index_ = OGR_FD_GetFieldIndex(layer_defn, config_.road_id_field.c_str());
    node_id_index_ = OGR_FD_GetFieldIndex(layer_defn, config_.node_id_field.c_str());
    lat_index_ = OGR_FD_GetFieldIndex(layer_defn, config_.lat_field.c_str());
    lon_index_ = OGR_FD_GetFieldIndex(layer_defn, config_.lon_field.c_str());

    if (road_id_index_ < 0 || node_id_index_ < 0) {
        last_error_ = "Waypoint layer must have road id field '" + config_.road_id_field +
                      "' and node id field '" + config_.node_id_field + "'";
        std::cerr << "Error: " << last_error_ << std::endl;
        close();
        return false;
    }

    coordinates_from_geometry_ = false;
    if (lat_index_ < 0 || lon_index_ < 0) {
        OGRwkbGeometryType geom_type = wkbFlatten(OGR_FD_GetGeomType(layer_defn));
        if (geom_type != wkbPoint) {
            last_error_ = "Waypoint layer has no '" + config_.lat_field + "'/'" + config_.lon_field +
                          "' fields and no point geometry";
            std::cerr << "Error: " << last_error_ << std::endl;
            close();
            return false;
        }
        std::cout << "Warning: Coordinate fields not found. Reading coordinates from point geometry." << std::endl;
        coordinates_from_geometry_ = true;
    }

    std::cout << "Waypoint feature count: " << OGR_L_GetFeatureCount(layer_, 1) << std::endl;

    reset();
    return true;
}

void WaypointReader::reset() {
    row_number_ = 0;
    if (layer_) {
        OGR_L_ResetReading(layer_);
    }
}

std::optional<geo::RawWaypointRow> WaypointReader::next() {
    if (!layer_) {
        return std::nullopt;
    }

    OGRFeatureH feature = OGR_L_GetNextFeature(layer_);
    if (!feature) {
        return std::nullopt;
    }

    geo::RawWaypointRow row;
    row.row_number = ++row_number_;
    row.road_id = getFieldValueAsString(feature, road_id_index_);
    row.node_id = getFieldValueAsString(feature, node_id_index_);

    if (coordinates_from_geometry_) {
        // Missing geometry leaves the coordinates empty; the core records the row as malformed
        OGRGeometryH geom = OGR_F_GetGeometryRef(feature);
        if (geom && wkbFlatten(OGR_G_GetGeometryType(geom)) == wkbPoint && !OGR_G_IsEmpty(geom)) {
            row.lon = formatCoordinate(OGR_G_GetX(geom, 0));
            row.lat = formatCoordinate(OGR_G_GetY(geom, 0));
        }
    } else {
        row.lat = getFieldValueAsString(feature, lat_index_);
        row.lon = getFieldValueAsString(feature, lon_index_);
    }

    OGR_F_Destroy(feature);
    return row;
}

long long WaypointReader::getFeatureCount() const {
    if (!layer_) {
        return -1;
    }
    return static_cast<long long>(OGR_L_GetFeatureCount(layer_, 1));
}

std::string WaypointReader::getFieldValueAsString(OGRFeatureH feature, int field_idx) const {
    if (!feature || field_idx < 0 || !OGR_F_IsFieldSetAndNotNull(feature, field_idx)) {
        return "";
    }

    OGRFieldDefnH field_defn = OGR_F_GetFieldDefnRef(feature, field_idx);
    if (OGR_Fld_GetType(field_defn) == OFTReal) {
        return formatCoordinate(OGR_F_GetFieldAsDouble(feature, field_idx));
    }

    const char* value = OGR_F_GetFieldAsString(feature, field_idx);
    return value ? std::string(value) : std::string();
}

} // namespace io
} // namespace waygrid
