#include "geo/geo_math.hpp"
#include "geo/id_allocator.hpp"
#include "geo/resampler.hpp"
#include "geo/road_grouper.hpp"
#include "geo/waypoint_source.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

using waygrid::geo::DuplicateCoordinateConflictError;
using waygrid::geo::ErrorKind;
using waygrid::geo::GeoMath;
using waygrid::geo::IdAllocator;
using waygrid::geo::InvalidParameterError;
using waygrid::geo::RawWaypointRow;
using waygrid::geo::Resampler;
using waygrid::geo::ResampleResult;
using waygrid::geo::Road;
using waygrid::geo::VectorWaypointSource;
using waygrid::geo::Waypoint;
using waygrid::geo::WaypointThinner;

// Three equator points 0.02 degrees (about 2.224 km) apart
Road makeW1()
{
  return {
    Waypoint("W1", "N1", 0.0, 0.0),
    Waypoint("W1", "N2", 0.0, 0.02),
    Waypoint("W1", "N3", 0.0, 0.04),
  };
}

void expectSpacingWithin(const Road & road, double limit_km)
{
  for (size_t i = 1; i < road.size(); ++i) {
    EXPECT_LE(GeoMath::roundDistance(GeoMath::distance(road[i - 1], road[i])), limit_km)
      << "gap " << i << " of road " << road[i].road_id;
  }
}

size_t countOriginals(const Road & road, const Road & originals)
{
  size_t count = 0;
  for (const auto & wp : road) {
    for (const auto & original : originals) {
      if (wp.node_id == original.node_id) {
        count++;
      }
    }
  }
  return count;
}

}  // namespace

TEST(ResamplerTest, W1AtOneKilometerInsertsTwoPointsPerGap)
{
  IdAllocator ids;
  Resampler resampler(1.0, ids);
  Road input = makeW1();

  Road output = resampler.resample(input);

  ASSERT_EQ(output.size(), 7u);
  EXPECT_EQ(output.front().node_id, "N1");
  EXPECT_EQ(output[3].node_id, "N2");
  EXPECT_EQ(output.back().node_id, "N3");
  EXPECT_DOUBLE_EQ(output.back().lon, 0.04);
  expectSpacingWithin(output, 1.0);
}

TEST(ResamplerTest, W1AtOnePointTwoKilometersInsertsOnePointPerGap)
{
  IdAllocator ids;
  Resampler resampler(1.2, ids);

  Road output = resampler.resample(makeW1());

  ASSERT_EQ(output.size(), 5u);
  EXPECT_EQ(output[0].node_id, "N1");
  EXPECT_EQ(output[2].node_id, "N2");
  EXPECT_EQ(output[4].node_id, "N3");
  expectSpacingWithin(output, 1.2);
}

TEST(ResamplerTest, SyntheticPointsCarryRoadAndGeneratedIds)
{
  IdAllocator ids(100);
  Resampler resampler(1.2, ids);

  Road output = resampler.resample(makeW1());

  ASSERT_EQ(output.size(), 5u);
  EXPECT_EQ(output[1].node_id, "Generated Node 100");
  EXPECT_EQ(output[3].node_id, "Generated Node 101");
  EXPECT_EQ(output[1].road_id, "W1");
  EXPECT_EQ(ids.peek(), 102u);
}

TEST(ResamplerTest, SyntheticPointsLieBetweenTheirOriginals)
{
  IdAllocator ids;
  Resampler resampler(0.5, ids);

  Road output = resampler.resample(makeW1());

  for (size_t i = 1; i < output.size(); ++i) {
    EXPECT_GT(output[i].lon, output[i - 1].lon);
    EXPECT_DOUBLE_EQ(output[i].lat, 0.0);
  }
}

TEST(ResamplerTest, KeepsEveryOriginalInOrder)
{
  Road input = {
    Waypoint("R", "A", 40.000, -75.000),
    Waypoint("R", "B", 40.010, -75.005),
    Waypoint("R", "C", 40.011, -75.004),
    Waypoint("R", "D", 40.030, -75.030),
  };
  IdAllocator ids;
  Resampler resampler(0.3, ids);

  Road output = resampler.resample(input);

  EXPECT_EQ(countOriginals(output, input), input.size());
  std::vector<std::string> order;
  for (const auto & wp : output) {
    if (wp.node_id.rfind("Generated", 0) != 0) {
      order.push_back(wp.node_id);
    }
  }
  EXPECT_EQ(order, (std::vector<std::string>{"A", "B", "C", "D"}));
  expectSpacingWithin(output, 0.3);
}

TEST(ResamplerTest, ResamplingIsIdempotent)
{
  Road input = {
    Waypoint("R", "A", 40.000, -75.000),
    Waypoint("R", "B", 40.013, -75.021),
    Waypoint("R", "C", 40.040, -75.022),
  };
  IdAllocator ids;
  Resampler resampler(0.25, ids);

  Road once = resampler.resample(input);
  const uint64_t ids_after_first = ids.peek();
  Road twice = resampler.resample(once);

  ASSERT_EQ(twice.size(), once.size());
  for (size_t i = 0; i < once.size(); ++i) {
    EXPECT_EQ(twice[i].node_id, once[i].node_id);
    EXPECT_DOUBLE_EQ(twice[i].lat, once[i].lat);
    EXPECT_DOUBLE_EQ(twice[i].lon, once[i].lon);
  }
  EXPECT_EQ(ids.peek(), ids_after_first);
}

TEST(ResamplerTest, ShortGapsAreLeftAlone)
{
  Road input = {
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "B", 0.0, 0.001),
  };
  IdAllocator ids;
  Resampler resampler(1.0, ids);

  Road output = resampler.resample(input);
  EXPECT_EQ(output.size(), 2u);
  EXPECT_EQ(ids.peek(), 0u);
}

TEST(ResamplerTest, SinglePointRoadPassesThrough)
{
  IdAllocator ids;
  Resampler resampler(1.0, ids);

  Road output = resampler.resample({Waypoint("R", "A", 1.0, 2.0)});
  ASSERT_EQ(output.size(), 1u);
  EXPECT_EQ(output[0].node_id, "A");
}

TEST(ResamplerTest, EmptyRoadPassesThrough)
{
  IdAllocator ids;
  Resampler resampler(1.0, ids);
  EXPECT_TRUE(resampler.resample(Road()).empty());
}

TEST(ResamplerTest, RepeatedNodeIsSkipped)
{
  Road input = {
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "B", 0.0, 0.001),
  };
  IdAllocator ids;
  Resampler resampler(1.0, ids);

  Road output = resampler.resample(input);
  ASSERT_EQ(output.size(), 2u);
  EXPECT_EQ(output[0].node_id, "A");
  EXPECT_EQ(output[1].node_id, "B");
}

TEST(ResamplerTest, DifferentNodesAtSameCoordinatesThrow)
{
  Road input = {
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "B", 0.0, 0.0),
  };
  IdAllocator ids;
  Resampler resampler(1.0, ids);

  EXPECT_THROW(resampler.resample(input), DuplicateCoordinateConflictError);
}

TEST(ResamplerTest, NonPositiveDistanceIsRejected)
{
  IdAllocator ids;
  EXPECT_THROW(Resampler(0.0, ids), InvalidParameterError);
  EXPECT_THROW(Resampler(-1.0, ids), InvalidParameterError);
  EXPECT_THROW(Resampler(1e-9, ids), InvalidParameterError);
}

TEST(ResamplerTest, ResampleSourceGroupsRoadsAndReportsBadRows)
{
  VectorWaypointSource source({
    RawWaypointRow("W1", "N1", "0", "0"),
    RawWaypointRow("W1", "N2", "0", "0.02"),
    RawWaypointRow("W2", "M1", "north", "0"),
    RawWaypointRow("W2", "M2", "1", "1"),
    RawWaypointRow("W2", "M3", "1", "1.001"),
  });
  IdAllocator ids;
  Resampler resampler(1.2, ids);

  ::testing::internal::CaptureStdout();
  ::testing::internal::CaptureStderr();
  ResampleResult result = resampler.resampleSource(source);
  const std::string out = ::testing::internal::GetCapturedStdout();
  const std::string err = ::testing::internal::GetCapturedStderr();

  // Errors go back to the caller, nothing is printed
  EXPECT_TRUE(out.empty()) << out;
  EXPECT_TRUE(err.empty()) << err;
  EXPECT_EQ(result.road_count, 2u);
  EXPECT_EQ(result.generated_count, 1u);
  ASSERT_EQ(result.waypoints.size(), 5u);
  EXPECT_EQ(result.waypoints[0].waypoint.node_id, "N1");
  EXPECT_DOUBLE_EQ(result.waypoints[0].distance_from_last_km, 0.0);
  EXPECT_GT(result.waypoints[1].distance_from_last_km, 0.0);
  EXPECT_EQ(result.waypoints[3].waypoint.node_id, "M2");
  EXPECT_DOUBLE_EQ(result.waypoints[3].distance_from_last_km, 0.0);

  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0].kind, ErrorKind::MALFORMED_ROW);
  EXPECT_EQ(result.errors[0].row_number, 3u);
  EXPECT_EQ(result.errors[0].node_id, "M1");
}

TEST(ResamplerTest, ResampleSourceLeavesOutConflictingRoad)
{
  VectorWaypointSource source({
    RawWaypointRow("BAD", "A", "0", "0"),
    RawWaypointRow("BAD", "B", "0", "0"),
    RawWaypointRow("GOOD", "C", "0", "1"),
    RawWaypointRow("GOOD", "D", "0", "1.001"),
  });
  IdAllocator ids;
  Resampler resampler(1.0, ids);

  ResampleResult result = resampler.resampleSource(source);

  EXPECT_EQ(result.road_count, 1u);
  ASSERT_EQ(result.waypoints.size(), 2u);
  EXPECT_EQ(result.waypoints[0].waypoint.road_id, "GOOD");
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0].kind, ErrorKind::DUPLICATE_COORDINATE_CONFLICT);
  EXPECT_EQ(result.errors[0].road_id, "BAD");
}

TEST(RoadGrouperTest, SplitsOnRoadChange)
{
  VectorWaypointSource source({
    RawWaypointRow("R1", "A", "0", "0"),
    RawWaypointRow("R1", "B", "0", "1"),
    RawWaypointRow("R2", "C", "1", "1"),
    RawWaypointRow("R3", "D", "2", "2"),
    RawWaypointRow("R3", "E", "2", "3"),
  });
  waygrid::geo::RoadGrouper grouper(source);
  Road road;

  ASSERT_TRUE(grouper.nextRoad(road));
  EXPECT_EQ(road.size(), 2u);
  ASSERT_TRUE(grouper.nextRoad(road));
  ASSERT_EQ(road.size(), 1u);
  EXPECT_EQ(road[0].node_id, "C");
  ASSERT_TRUE(grouper.nextRoad(road));
  EXPECT_EQ(road.size(), 2u);
  EXPECT_FALSE(grouper.nextRoad(road));
  EXPECT_TRUE(grouper.getErrors().empty());
}

TEST(WaypointThinnerTest, KeepsPointsBeyondLimitAndBothEnds)
{
  Road input;
  for (int i = 0; i <= 10; ++i) {
    input.emplace_back("R", "N" + std::to_string(i), 0.0, 0.001 * i);
  }
  WaypointThinner thinner(0.3);

  Road output = thinner.thin(input);

  std::vector<std::string> kept;
  for (const auto & wp : output) {
    kept.push_back(wp.node_id);
  }
  EXPECT_EQ(kept, (std::vector<std::string>{"N0", "N3", "N6", "N9", "N10"}));
}

TEST(WaypointThinnerTest, ShortRoadIsUnchanged)
{
  Road input = {
    Waypoint("R", "A", 0.0, 0.0),
    Waypoint("R", "B", 0.0, 0.0001),
  };
  WaypointThinner thinner(1.0);
  EXPECT_EQ(thinner.thin(input).size(), 2u);
}

TEST(WaypointThinnerTest, RejectsNonPositiveDistance)
{
  EXPECT_THROW(WaypointThinner(0.0), InvalidParameterError);
}
