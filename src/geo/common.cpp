#include "geo/common.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace waygrid {
namespace geo {

namespace {

std::string trim(const std::string& value) {
    const size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Strict numeric parse: the whole token must be consumed
bool parseCoordinate(const std::string& text, double& value) {
    std::string token = trim(text);
    if (token.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return std::isfinite(value);
}

} // namespace

Cell::Cell(double min_lat, double min_lon, double max_lat, double max_lon)
    : box_(Point(min_lon, min_lat), Point(max_lon, max_lat)) {
    if (!(min_lat < max_lat) || !(min_lon < max_lon)) {
        std::ostringstream oss;
        oss << "Malformed cell bounds (" << min_lat << ", " << min_lon << ", " << max_lat << ", " << max_lon
            << "): minimum must be less than maximum on both axes";
        throw InvalidParameterError(oss.str());
    }

    std::ostringstream oss;
    oss << std::setprecision(10) << min_lat << ',' << min_lon << ',' << max_lat << ',' << max_lon;
    text_ = oss.str();
}

Cell Cell::fromString(const std::string& text) {
    const std::string trimmed = trim(text);
    if (!trimmed.empty() && trimmed.back() == ',') {
        throw InvalidParameterError("Cell '" + text + "' has a trailing comma");
    }

    std::vector<double> bounds;
    std::stringstream ss(trimmed);
    std::string token;

    while (std::getline(ss, token, ',')) {
        double value = 0.0;
        if (!parseCoordinate(token, value)) {
            throw InvalidParameterError("Invalid cell bound '" + trim(token) + "' in cell '" + text + "'");
        }
        bounds.push_back(value);
    }

    if (bounds.size() != 4) {
        throw InvalidParameterError("Cell '" + text + "' must have four bounds: south,west,north,east");
    }

    Cell cell(bounds[0], bounds[1], bounds[2], bounds[3]);
    cell.text_ = trimmed;
    return cell;
}

std::string Cell::label(size_t cell_id) const {
    return text_ + "_" + std::to_string(cell_id);
}

bool parseWaypointRow(const RawWaypointRow& row, Waypoint& waypoint, std::string& error) {
    if (row.road_id.empty()) {
        error = "Missing road id";
        return false;
    }
    if (row.node_id.empty()) {
        error = "Missing node id";
        return false;
    }

    double lat = 0.0;
    double lon = 0.0;
    if (!parseCoordinate(row.lat, lat)) {
        error = "Unparseable latitude '" + row.lat + "'";
        return false;
    }
    if (!parseCoordinate(row.lon, lon)) {
        error = "Unparseable longitude '" + row.lon + "'";
        return false;
    }

    waypoint = Waypoint(row.road_id, row.node_id, lat, lon);
    return true;
}

} // namespace geo
} // namespace waygrid
