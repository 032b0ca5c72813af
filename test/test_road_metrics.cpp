#include "geo/geo_math.hpp"
#include "geo/road_metrics.hpp"
#include "geo/waypoint_source.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace
{

using waygrid::geo::ErrorKind;
using waygrid::geo::GeoMath;
using waygrid::geo::RawWaypointRow;
using waygrid::geo::Road;
using waygrid::geo::RoadMetrics;
using waygrid::geo::RoadSummary;
using waygrid::geo::RowError;
using waygrid::geo::VectorWaypointSource;
using waygrid::geo::Waypoint;

}  // namespace

TEST(RoadMetricsTest, LengthSumsConsecutiveHops)
{
  Road road = {
    Waypoint("W1", "N1", 0.0, 0.0),
    Waypoint("W1", "N2", 0.0, 0.02),
    Waypoint("W1", "N3", 0.0, 0.04),
  };
  const double hop = GeoMath::distance(road[0], road[1]);
  EXPECT_NEAR(RoadMetrics::length(road), 2.0 * hop, 1e-9);
}

TEST(RoadMetricsTest, LengthOfShortRoadIsZero)
{
  EXPECT_DOUBLE_EQ(RoadMetrics::length(Road()), 0.0);
  EXPECT_DOUBLE_EQ(RoadMetrics::length({Waypoint("R", "A", 1.0, 1.0)}), 0.0);
}

TEST(RoadMetricsTest, MidpointIsCenterOfExtent)
{
  Road road = {
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "B", 1.0, 2.0),
    Waypoint("R", "C", 0.5, 4.0),
  };

  Waypoint mid = RoadMetrics::midpoint(road);
  EXPECT_EQ(mid.road_id, "R");
  EXPECT_DOUBLE_EQ(mid.lat, 0.5);
  EXPECT_DOUBLE_EQ(mid.lon, 2.0);
}

TEST(RoadMetricsTest, MidpointOfEmptyRoadThrows)
{
  EXPECT_THROW(RoadMetrics::midpoint(Road()), std::invalid_argument);
}

TEST(RoadMetricsTest, SummarizeSourceReportsEachRoad)
{
  VectorWaypointSource source({
    RawWaypointRow("R1", "A", "40.0", "-75.0"),
    RawWaypointRow("R1", "B", "40.1", "-75.0"),
    RawWaypointRow("R2", "C", "bad", "-75.0"),
    RawWaypointRow("R2", "D", "41.0", "-74.0"),
  });
  std::vector<RowError> errors;

  std::vector<RoadSummary> summaries = RoadMetrics::summarizeSource(source, errors);

  ASSERT_EQ(summaries.size(), 2u);
  EXPECT_EQ(summaries[0].road_id, "R1");
  EXPECT_EQ(summaries[0].waypoint_count, 2u);
  EXPECT_NEAR(summaries[0].mid_lat, 40.05, 1e-12);
  EXPECT_NEAR(summaries[0].length_km, 11.1195, 1e-3);
  EXPECT_EQ(summaries[1].road_id, "R2");
  EXPECT_EQ(summaries[1].waypoint_count, 1u);
  EXPECT_DOUBLE_EQ(summaries[1].length_km, 0.0);

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].kind, ErrorKind::MALFORMED_ROW);
  EXPECT_EQ(errors[0].row_number, 3u);
}
