#ifndef WAYGRID_CELL_CLASSIFIER_HPP
#define WAYGRID_CELL_CLASSIFIER_HPP

#include "geo/common.hpp"

namespace waygrid {
namespace geo {

class CellClassifier {
public:
    /**
     * Strict-interior test: min_lat < lat < max_lat and min_lon < lon < max_lon
     * A point exactly on an edge is not in the cell.
     */
    static bool inCell(const Waypoint& point, const Cell& cell);

private:
    // Disable instantiation
    CellClassifier() = delete;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_CELL_CLASSIFIER_HPP
