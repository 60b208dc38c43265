#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "line_feature.h"

namespace gapfill {

inline constexpr const char *kOutputCrs = "urn:ogc:def:crs:EPSG::4326";

// Parses a GeoJSON FeatureCollection of LineStrings. Ids come from the feature
// "id" member or properties.id; other geometry types are skipped with a
// warning. The result is sorted by id. Throws std::runtime_error on bad input.
std::vector<LineFeature> parse_line_layer(const nlohmann::json &doc);
std::vector<LineFeature> load_line_layer(const std::string &path);

nlohmann::json line_layer_to_json(const std::vector<LineFeature> &lines);
void save_line_layer(const std::string &path, const std::vector<LineFeature> &lines);

} // namespace gapfill
