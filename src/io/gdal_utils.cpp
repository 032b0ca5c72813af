#include "io/gdal_utils.hpp"
#include <gdal_priv.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace waygrid {
namespace io {

namespace {

// Output extensions and the GDAL driver each one maps to
const std::unordered_map<std::string, std::string>& extensionFormats() {
    static const std::unordered_map<std::string, std::string> formats = {
        {".csv", "CSV"},
        {".geojson", "GeoJSON"},
        {".json", "GeoJSON"},
        {".geojsonseq", "GeoJSONSeq"},
        {".gpkg", "GPKG"},
        {".shp", "ESRI Shapefile"},
        {".fgb", "FlatGeobuf"},
        {".sqlite", "SQLite"},
        {".gml", "GML"},
        {".kml", "KML"}
    };
    return formats;
}

} // namespace

void GDALUtils::registerDrivers() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    registerDrivers();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' is not available. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    // Check if the driver supports creation
    const char* creation_support = driver->GetMetadataItem(GDAL_DCAP_CREATE);
    if (!creation_support || strcmp(creation_support, "YES") != 0) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' does not support creation. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    return true;
}

std::string GDALUtils::determineFormatAndModifyPath(std::string& file_path) {
    std::filesystem::path path(file_path);
    std::string extension = path.extension().string();

    // Convert to lowercase for case-insensitive comparison
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    const auto& formats = extensionFormats();
    auto it = formats.find(extension);
    if (it != formats.end() && (it->second == "GeoJSON" || isDriverAvailable(it->second))) {
        return it->second;
    }

    // Unknown extension or missing driver
    std::string new_path = path.replace_extension(".geojson").string();
    std::cout << "WARNING: Changing output file extension from '" << extension
              << "' to '.geojson' due to format fallback." << std::endl;
    std::cout << "New output file: " << new_path << std::endl;
    file_path = new_path;

    return "GeoJSON";
}

bool GDALUtils::isTableFormat(const std::string& format) {
    return format == "CSV";
}

GDALDatasetH GDALUtils::createVectorDataset(std::string& file_path, std::string& format, std::string& error) {
    registerDrivers();

    format = determineFormatAndModifyPath(file_path);

    GDALDriverH driver = GDALGetDriverByName(format.c_str());
    if (!driver) {
        error = "Failed to get GDAL driver for format: " + format;
        return nullptr;
    }

    // Drivers such as CSV refuse to create over an existing file
    std::error_code ec;
    if (std::filesystem::exists(file_path, ec)) {
        if (GDALDeleteDataset(driver, file_path.c_str()) != CE_None) {
            std::filesystem::remove(file_path, ec);
        }
    }

    GDALDatasetH dataset = GDALCreate(driver, file_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        error = "Failed to create GDAL dataset: " + file_path;
        return nullptr;
    }

    return dataset;
}

OGRSpatialReferenceH GDALUtils::createWGS84SpatialRef() {
    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    OSRImportFromEPSG(srs, 4326);
    OSRSetAxisMappingStrategy(srs, OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

bool GDALUtils::addField(OGRLayerH layer, const char* name, OGRFieldType type) {
    OGRFieldDefnH field = OGR_Fld_Create(name, type);
    OGRErr err = OGR_L_CreateField(layer, field, 1);
    OGR_Fld_Destroy(field);
    return err == OGRERR_NONE;
}

} // namespace io
} // namespace waygrid
