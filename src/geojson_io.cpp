#include "geojson_io.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace gapfill {

namespace {

// Scalars become text; numbers keep their shortest round-trip spelling.
std::string scalar_text(const nlohmann::json &v) {
  if (v.is_string()) {
    return v.get<std::string>();
  }
  if (v.is_boolean()) {
    return v.get<bool>() ? "true" : "false";
  }
  if (v.is_number()) {
    return v.dump();
  }
  return std::string();
}

std::string feature_id(const nlohmann::json &feature, std::size_t index) {
  if (feature.contains("id") && !feature.at("id").is_null()) {
    const std::string id = scalar_text(feature.at("id"));
    if (!id.empty()) {
      return id;
    }
  }
  if (feature.contains("properties") && feature.at("properties").is_object()) {
    const auto &props = feature.at("properties");
    if (props.contains("id") && !props.at("id").is_null()) {
      const std::string id = scalar_text(props.at("id"));
      if (!id.empty()) {
        return id;
      }
    }
  }
  throw std::runtime_error("feature #" + std::to_string(index) + " has no id");
}

} // namespace

std::vector<LineFeature> parse_line_layer(const nlohmann::json &doc) {
  if (!doc.is_object() || doc.value("type", "") != "FeatureCollection") {
    throw std::runtime_error("expected a GeoJSON FeatureCollection");
  }
  if (!doc.contains("features") || !doc.at("features").is_array()) {
    throw std::runtime_error("GeoJSON features must be array");
  }

  std::vector<LineFeature> out;
  std::size_t index = 0;
  for (const auto &feature : doc.at("features")) {
    const std::size_t this_index = index++;
    if (!feature.is_object()) {
      throw std::runtime_error("feature #" + std::to_string(this_index) + " is not an object");
    }
    const auto geom = feature.value("geometry", nlohmann::json::object());
    const std::string gtype = geom.is_object() ? geom.value("type", "") : std::string();
    if (gtype != "LineString") {
      std::cerr << "Skipping feature #" << this_index << " with geometry type '" << gtype << "'" << std::endl;
      continue;
    }

    LineFeature ln;
    ln.fid = feature_id(feature, this_index);
    if (feature.contains("properties") && feature.at("properties").is_object()) {
      for (auto it = feature.at("properties").begin(); it != feature.at("properties").end(); ++it) {
        if (it.key() == "id" || it.value().is_null() || it.value().is_structured()) {
          continue;
        }
        ln.attributes[it.key()] = scalar_text(it.value());
      }
    }

    const auto coords = geom.value("coordinates", nlohmann::json::array());
    if (!coords.is_array()) {
      throw std::runtime_error("line " + ln.fid + ": coordinates must be an array");
    }
    for (const auto &c : coords) {
      if (!c.is_array() || c.size() < 2 || !c[0].is_number() || !c[1].is_number()) {
        throw std::runtime_error("line " + ln.fid + ": malformed coordinate " + c.dump());
      }
      ln.pts.push_back(geom_common::Pt{c[0].get<double>(), c[1].get<double>()});
    }
    out.push_back(std::move(ln));
  }

  sort_by_fid(out);
  return out;
}

std::vector<LineFeature> load_line_layer(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  nlohmann::json doc;
  try {
    ifs >> doc;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Failed to parse JSON in " + path + ": " + e.what());
  }
  return parse_line_layer(doc);
}

nlohmann::json line_layer_to_json(const std::vector<LineFeature> &lines) {
  nlohmann::json doc;
  doc["type"] = "FeatureCollection";
  doc["crs"] = {{"type", "name"}, {"properties", {{"name", kOutputCrs}}}};
  doc["features"] = nlohmann::json::array();
  for (const auto &ln : lines) {
    nlohmann::json coords = nlohmann::json::array();
    for (const auto &p : ln.pts) {
      coords.push_back(nlohmann::json::array({p.x, p.y}));
    }
    nlohmann::json props = nlohmann::json::object();
    for (const auto &kv : ln.attributes) {
      props[kv.first] = kv.second;
    }
    props["id"] = ln.fid;

    nlohmann::json f;
    f["type"] = "Feature";
    f["id"] = ln.fid;
    f["properties"] = std::move(props);
    f["geometry"] = {{"type", "LineString"}, {"coordinates", std::move(coords)}};
    doc["features"].push_back(std::move(f));
  }
  return doc;
}

void save_line_layer(const std::string &path, const std::vector<LineFeature> &lines) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  ofs << line_layer_to_json(lines).dump();
  if (!ofs) {
    throw std::runtime_error("Failed to write output file: " + path);
  }
}

} // namespace gapfill
