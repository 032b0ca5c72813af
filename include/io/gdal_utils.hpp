#ifndef WAYGRID_GDAL_UTILS_HPP
#define WAYGRID_GDAL_UTILS_HPP

#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>

namespace waygrid {
namespace io {

/**
 * GDAL utility functions for format detection and dataset setup
 */
class GDALUtils {
public:
    /**
     * Register all GDAL drivers (once per process)
     */
    static void registerDrivers();

    /**
     * Check if a specific GDAL driver is available and supports creation
     * @param driver_name GDAL driver name
     * @return true if driver is available and supports creation, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Determine GDAL output format and modify file path if driver is not available
     * @param file_path File path with extension (will be modified if format fallback occurs)
     * @return GDAL format string
     */
    static std::string determineFormatAndModifyPath(std::string& file_path);

    /**
     * Whether the format stores attribute tables only (coordinates go in lat/lon fields)
     */
    static bool isTableFormat(const std::string& format);

    /**
     * Create a GDAL dataset for writing, removing any existing file at the path first
     * @param file_path Output path (may be changed by format fallback)
     * @param format Receives the GDAL format used
     * @param error Receives the failure reason
     * @return Dataset handle or nullptr (caller closes the handle)
     */
    static GDALDatasetH createVectorDataset(std::string& file_path, std::string& format, std::string& error);

    /**
     * New EPSG:4326 spatial reference in traditional lon/lat axis order (caller destroys)
     */
    static OGRSpatialReferenceH createWGS84SpatialRef();

    /**
     * Add a field to a layer
     * @return true if the field was created
     */
    static bool addField(OGRLayerH layer, const char* name, OGRFieldType type);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace waygrid

#endif // WAYGRID_GDAL_UTILS_HPP
