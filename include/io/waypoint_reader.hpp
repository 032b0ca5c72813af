#ifndef WAYGRID_WAYPOINT_READER_HPP
#define WAYGRID_WAYPOINT_READER_HPP

#include <optional>
#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include "geo/common.hpp"
#include "geo/waypoint_source.hpp"

namespace waygrid {
namespace io {

// Waypoint reader configuration
struct WaypointReaderConfig {
    std::string file_path;          // Input file path (CSV or any OGR vector format)
    std::string road_id_field;      // Field name for road ID
    std::string node_id_field;      // Field name for waypoint (node) ID
    std::string lat_field;          // Field name for latitude (point geometry used if absent)
    std::string lon_field;          // Field name for longitude (point geometry used if absent)
    int layer_index;                // Layer to read (default: 0)

    WaypointReaderConfig()
        : road_id_field("road_id"), node_id_field("node_id"), lat_field("lat"), lon_field("lon"), layer_index(0) {}
};

/**
 * Streams waypoint rows from a GDAL vector dataset
 * Every value is delivered as text; parsing and validation happen in the core so that
 * a bad row is recorded there instead of aborting the read.
 */
class WaypointReader : public geo::WaypointSource {
public:
    explicit WaypointReader(const WaypointReaderConfig& config);
    ~WaypointReader() override;

    // Disable copy constructor and assignment
    WaypointReader(const WaypointReader&) = delete;
    WaypointReader& operator=(const WaypointReader&) = delete;

    /**
     * Open the dataset and resolve the configured fields
     * @return true if successful, false otherwise
     */
    bool open();

    std::optional<geo::RawWaypointRow> next() override;
    void reset() override;

    /**
     * Get the number of features in the layer
     * @return Feature count, or -1 if the dataset is not open
     */
    long long getFeatureCount() const;

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

private:
    WaypointReaderConfig config_;
    GDALDatasetH dataset_;
    OGRLayerH layer_;
    int road_id_index_;
    int node_id_index_;
    int lat_index_;
    int lon_index_;
    bool coordinates_from_geometry_;
    size_t row_number_;
    std::string last_error_;

    void close();

    std::string getFieldValueAsString(OGRFeatureH feature, int field_idx) const;
};

} // namespace io
} // namespace waygrid

#endif // WAYGRID_WAYPOINT_READER_HPP
