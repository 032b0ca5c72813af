#include "geo/waypoint_source.hpp"
#include <utility>

namespace waygrid {
namespace geo {

VectorWaypointSource::VectorWaypointSource(std::vector<RawWaypointRow> rows)
    : rows_(std::move(rows)), position_(0) {
    // Rows built by hand may not carry positions
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].row_number == 0) {
            rows_[i].row_number = i + 1;
        }
    }
}

std::optional<RawWaypointRow> VectorWaypointSource::next() {
    if (position_ >= rows_.size()) {
        return std::nullopt;
    }
    return rows_[position_++];
}

} // namespace geo
} // namespace waygrid
