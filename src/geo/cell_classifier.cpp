#include "geo/cell_classifier.hpp"

namespace waygrid {
namespace geo {

bool CellClassifier::inCell(const Waypoint& point, const Cell& cell) {
    // bg::within excludes the box border
    return bg::within(point.toPoint(), cell.box());
}

} // namespace geo
} // namespace waygrid
