#ifndef WAYGRID_WRITER_CELL_PARTITION_HPP
#define WAYGRID_WRITER_CELL_PARTITION_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "geo/common.hpp"

namespace waygrid {
namespace io {

/**
 * Configuration for cell partition output writer
 */
struct CellPartitionWriterConfig {
    std::string rows_output_file_path;     // Output file for cell rows
    std::string totals_output_file_path;   // Output file for per-cell length totals

    CellPartitionWriterConfig() = default;
};

/**
 * Cell partition output writer
 * Rows are appended one at a time while the partition streams; the totals table is
 * written once every cell has been processed.
 */
class CellPartitionWriter {
public:
    CellPartitionWriter();
    ~CellPartitionWriter();

    // Disable copy constructor and assignment
    CellPartitionWriter(const CellPartitionWriter&) = delete;
    CellPartitionWriter& operator=(const CellPartitionWriter&) = delete;

    /**
     * Create the rows dataset and its layer
     * @param config Writer configuration
     * @return true if successful, false otherwise
     */
    bool open(const CellPartitionWriterConfig& config);

    /**
     * Append one cell row
     * @return true if successful, false otherwise
     */
    bool writeRow(const geo::CellRow& row);

    /**
     * Write the per-cell totals table
     * @return true if successful, false otherwise
     */
    bool writeTotals(const std::vector<geo::CellTotal>& totals);

    /**
     * Close the rows dataset (also done by the destructor)
     */
    void close();

    size_t getRowsWritten() const { return rows_written_; }
    const std::string& getRowsOutputFilePath() const { return rows_output_file_path_; }
    const std::string& getTotalsOutputFilePath() const { return totals_output_file_path_; }

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
    GDALDatasetH rows_dataset_;
    OGRLayerH rows_layer_;
    bool rows_with_geometry_;
    size_t rows_written_;
    std::string rows_output_file_path_;
    std::string totals_output_file_path_;
};

} // namespace io
} // namespace waygrid

#endif // WAYGRID_WRITER_CELL_PARTITION_HPP
