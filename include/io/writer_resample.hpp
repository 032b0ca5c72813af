#ifndef WAYGRID_WRITER_RESAMPLE_HPP
#define WAYGRID_WRITER_RESAMPLE_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "geo/common.hpp"

namespace waygrid {
namespace io {

/**
 * Configuration for resampled waypoint output writer
 */
struct ResampleWriterConfig {
    std::string output_file_path;     // Output file path, format taken from the extension

    ResampleWriterConfig() = default;
};

/**
 * Writes resampled (or thinned) waypoints as rows of road_id, node_id, lat, lon
 * plus the distance from the previous point of the same road
 */
class ResampleWriter {
public:
    ResampleWriter() = default;
    ~ResampleWriter() = default;

    // Disable copy constructor and assignment
    ResampleWriter(const ResampleWriter&) = delete;
    ResampleWriter& operator=(const ResampleWriter&) = delete;

    /**
     * Write resampled waypoints to output file
     * @param config Writer configuration
     * @param waypoints Waypoints in road order
     * @return true if successful, false otherwise
     */
    bool writeResampleResults(const ResampleWriterConfig& config, const std::vector<geo::ResampledWaypoint>& waypoints);

    /**
     * Path actually written (may differ from the configured path after format fallback)
     */
    const std::string& getOutputFilePath() const { return output_file_path_; }

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

    /**
     * Clear the last error message
     */
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    std::string output_file_path_;

    bool writeFeature(OGRLayerH layer, bool with_geometry, const geo::ResampledWaypoint& waypoint);
};

} // namespace io
} // namespace waygrid

#endif // WAYGRID_WRITER_RESAMPLE_HPP
