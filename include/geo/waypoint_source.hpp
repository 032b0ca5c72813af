#ifndef WAYGRID_WAYPOINT_SOURCE_HPP
#define WAYGRID_WAYPOINT_SOURCE_HPP

#include <optional>
#include <vector>
#include "geo/common.hpp"

namespace waygrid {
namespace geo {

/**
 * Road-grouped stream of raw waypoint rows
 * All rows of one road are contiguous; the core never re-sorts.
 */
class WaypointSource {
public:
    virtual ~WaypointSource() = default;

    /**
     * Next row of the table
     * @return Row, or nullopt once the table is exhausted
     */
    virtual std::optional<RawWaypointRow> next() = 0;

    /**
     * Rewind to the first row
     */
    virtual void reset() = 0;
};

/**
 * Source over rows already held in memory
 */
class VectorWaypointSource : public WaypointSource {
public:
    explicit VectorWaypointSource(std::vector<RawWaypointRow> rows);

    std::optional<RawWaypointRow> next() override;
    void reset() override { position_ = 0; }

private:
    std::vector<RawWaypointRow> rows_;
    size_t position_;
};

} // namespace geo
} // namespace waygrid

#endif // WAYGRID_WAYPOINT_SOURCE_HPP
