#include "tool/tool_interface.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

namespace
{

using waygrid::geo::BoundaryMode;
using waygrid::geo::InvalidParameterError;

bool isError(const std::string & result)
{
  return result.rfind("Error", 0) == 0;
}

}  // namespace

TEST(ToolInterfaceTest, ReaderConfigDefaultsAndOverrides)
{
  auto defaults = tool_interface::parseWaypointReaderConfig(nlohmann::json::object());
  EXPECT_EQ(defaults.road_id_field, "road_id");
  EXPECT_EQ(defaults.node_id_field, "node_id");
  EXPECT_EQ(defaults.lat_field, "lat");
  EXPECT_EQ(defaults.lon_field, "lon");
  EXPECT_EQ(defaults.layer_index, 0);

  nlohmann::json config = {
    {"file_path", "ways.csv"}, {"road_id_field", "way"}, {"lat_field", "latitude"}, {"layer_index", 2}};
  auto parsed = tool_interface::parseWaypointReaderConfig(config);
  EXPECT_EQ(parsed.file_path, "ways.csv");
  EXPECT_EQ(parsed.road_id_field, "way");
  EXPECT_EQ(parsed.node_id_field, "node_id");
  EXPECT_EQ(parsed.lat_field, "latitude");
  EXPECT_EQ(parsed.layer_index, 2);
}

TEST(ToolInterfaceTest, CellPartitionWriterConfig)
{
  nlohmann::json config = {
    {"rows_output_file_path", "cells.csv"}, {"totals_output_file_path", "cells_totals.csv"}};
  auto parsed = tool_interface::parseCellPartitionWriterConfig(config);
  EXPECT_EQ(parsed.rows_output_file_path, "cells.csv");
  EXPECT_EQ(parsed.totals_output_file_path, "cells_totals.csv");
}

TEST(ToolInterfaceTest, ResampleConfigRequiresPositiveDistance)
{
  EXPECT_THROW(tool_interface::parseResampleToolConfig(nlohmann::json::object()), InvalidParameterError);
  EXPECT_THROW(
    tool_interface::parseResampleToolConfig({{"min_distance_km", -0.5}}), InvalidParameterError);

  auto parsed = tool_interface::parseResampleToolConfig(
    {{"min_distance_km", 0.2}, {"thin", true}, {"first_generated_id", 50}});
  EXPECT_DOUBLE_EQ(parsed.min_distance_km, 0.2);
  EXPECT_TRUE(parsed.thin);
  EXPECT_EQ(parsed.first_generated_id, 50u);
}

TEST(ToolInterfaceTest, CellListSplitsOnSemicolons)
{
  auto cells = tool_interface::parseCellList("0,0,1,1; -34.0,150.5,-33.5,151.0 ;");
  ASSERT_EQ(cells.size(), 2u);
  EXPECT_EQ(cells[0].label(0), "0,0,1,1_0");
  EXPECT_EQ(cells[1].label(1), "-34.0,150.5,-33.5,151.0_1");
  EXPECT_DOUBLE_EQ(cells[1].minLat(), -34.0);
}

TEST(ToolInterfaceTest, CellListRejectsMalformedCell)
{
  EXPECT_THROW(tool_interface::parseCellList("0,0,1,1;1,1,0,0"), InvalidParameterError);
}

TEST(ToolInterfaceTest, CellListRejectsEmptyEntries)
{
  EXPECT_THROW(tool_interface::parseCellList("0,0,1,1;;1,1,2,2"), InvalidParameterError);
  EXPECT_THROW(tool_interface::parseCellList(";0,0,1,1"), InvalidParameterError);
  EXPECT_THROW(tool_interface::parseCellList("0,0,1,1; ;1,1,2,2"), InvalidParameterError);
  EXPECT_THROW(tool_interface::parseCellList("0,0,1,1,;1,1,2,2"), InvalidParameterError);

  auto cells = tool_interface::parseCellList("0,0,1,1;1,1,2,2;");
  ASSERT_EQ(cells.size(), 2u);
  EXPECT_EQ(cells[1].label(1), "1,1,2,2_1");
}

TEST(ToolInterfaceTest, PartitionConfigAcceptsArrayAndString)
{
  nlohmann::json config = {
    {"cells", nlohmann::json::array({"0,0,1,1"})},
    {"cells_str", "1,1,2,2;2,2,3,3"},
    {"boundary_mode", "interpolate"},
    {"min_distance_km", 0.1},
    {"first_generated_id", 10}};

  auto parsed = tool_interface::parseCellPartitionToolConfig(config);
  ASSERT_EQ(parsed.cells.size(), 3u);
  EXPECT_EQ(parsed.cells[2].text(), "2,2,3,3");
  EXPECT_EQ(parsed.boundary_mode, BoundaryMode::INTERPOLATE);
  ASSERT_TRUE(parsed.min_distance_km.has_value());
  EXPECT_DOUBLE_EQ(*parsed.min_distance_km, 0.1);
  EXPECT_EQ(parsed.first_generated_id, 10u);
}

TEST(ToolInterfaceTest, PartitionConfigRequiresBoundaryMode)
{
  EXPECT_THROW(
    tool_interface::parseCellPartitionToolConfig({{"cells_str", "0,0,1,1"}}), InvalidParameterError);
  EXPECT_TRUE(isError(tool_interface::processCellPartitionTool(
    R"({"rows_output_file_path": "out.csv"})", R"({"file_path": "in.csv"})", R"({"cells_str": "0,0,1,1"})")));
}

TEST(ToolInterfaceTest, PartitionConfigDefaults)
{
  auto parsed =
    tool_interface::parseCellPartitionToolConfig({{"cells_str", "0,0,1,1"}, {"boundary_mode", "drop"}});
  EXPECT_EQ(parsed.boundary_mode, BoundaryMode::DROP);
  EXPECT_FALSE(parsed.min_distance_km.has_value());
  EXPECT_EQ(parsed.first_generated_id, 0u);
}

TEST(ToolInterfaceTest, PartitionConfigRejectsBadInput)
{
  EXPECT_THROW(
    tool_interface::parseCellPartitionToolConfig(nlohmann::json::object()), InvalidParameterError);
  EXPECT_THROW(
    tool_interface::parseCellPartitionToolConfig({{"cells_str", "0,0,1,1"}, {"boundary_mode", "clip"}}),
    InvalidParameterError);
  EXPECT_THROW(
    tool_interface::parseCellPartitionToolConfig({{"cells_str", "0,0,1,1"}, {"boundary_mode", "drop"}, {"min_distance_km", 0.0}}),
    InvalidParameterError);
}

TEST(ToolInterfaceTest, ToolsReportErrorsAsText)
{
  EXPECT_TRUE(isError(tool_interface::processResampleTool("{", "{}", "{}")));
  EXPECT_TRUE(isError(tool_interface::processResampleTool(
    R"({"output_file_path": "out.csv"})", R"({"file_path": "in.csv"})", R"({"min_distance_km": 0})")));
  EXPECT_TRUE(isError(tool_interface::processCellPartitionTool(
    R"({"rows_output_file_path": "out.csv"})", R"({"file_path": "in.csv"})", R"({"cells_str": "1,0,0,1", "boundary_mode": "drop"})")));
  EXPECT_TRUE(isError(tool_interface::processRoadSummaryTool("{}", R"({"file_path": "in.csv"})")));
}
