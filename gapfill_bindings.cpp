#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <utility>
#include <vector>

#include "src/gap_closer.h"

namespace py = pybind11;

namespace {

using geom_common::Pt;

std::string scalar_str(const py::handle &v) {
  if (py::isinstance<py::bool_>(v)) {
    return v.cast<bool>() ? "true" : "false";
  }
  return py::str(v);
}

// GeoJSON-like feature dicts -> line layer. Non-LineString features are skipped;
// malformed LineStrings are kept so close_gaps() reports them.
std::vector<gapfill::LineFeature> extract_lines(const py::list &features) {
  std::vector<gapfill::LineFeature> out;
  out.reserve(features.size());

  for (auto item : features) {
    if (!py::isinstance<py::dict>(item)) {
      throw py::type_error("features must be dicts");
    }
    auto f = item.cast<py::dict>();
    if (!f.contains("geometry") || f["geometry"].is_none()) {
      continue;
    }
    auto geom = f["geometry"].cast<py::dict>();
    if (!geom.contains("type") || std::string(py::str(geom["type"])) != "LineString") {
      continue;
    }

    gapfill::LineFeature ln;
    py::dict props;
    if (f.contains("properties") && py::isinstance<py::dict>(f["properties"])) {
      props = f["properties"].cast<py::dict>();
    }
    if (f.contains("id") && !f["id"].is_none()) {
      ln.fid = scalar_str(f["id"]);
    } else if (props.contains("id") && !props["id"].is_none()) {
      ln.fid = scalar_str(props["id"]);
    }
    for (auto kv : props) {
      const std::string key = py::str(kv.first);
      if (key == "id" || kv.second.is_none()) {
        continue;
      }
      ln.attributes[key] = scalar_str(kv.second);
    }

    if (geom.contains("coordinates")) {
      for (auto xy : geom["coordinates"].cast<py::list>()) {
        auto pair = xy.cast<py::sequence>();
        if (pair.size() < 2) {
          throw py::value_error("line " + ln.fid + ": coordinate needs x and y");
        }
        ln.pts.push_back(Pt{pair[0].cast<double>(), pair[1].cast<double>()});
      }
    }
    out.push_back(std::move(ln));
  }
  return out;
}

py::list pool_ids(const std::vector<gapfill::LineFeature> &lines, const std::vector<std::size_t> &pool) {
  py::list out;
  for (const auto i : pool) {
    out.append(lines[i].fid);
  }
  return out;
}

py::dict close_gaps_cpp(const py::list &features, double angle_threshold, int max_rounds) {
  auto lines = extract_lines(features);
  gapfill::sort_by_fid(lines);

  gapfill::GapCloserConfig config;
  config.angle_threshold = angle_threshold;
  config.max_rounds = max_rounds;

  gapfill::GapCloserResult res;
  {
    py::gil_scoped_release release;
    res = gapfill::close_gaps(lines, config);
  }

  py::list connectors;
  for (const auto &c : res.connectors) {
    py::dict d;
    d["name"] = gapfill::connector_name(c);
    d["source_id"] = c.source_fid;
    d["destination_id"] = c.destination_fid;
    d["angle"] = c.angle;
    d["angle_art"] = c.angle_art;
    d["round"] = c.round;
    py::dict geometry;
    geometry["type"] = "LineString";
    geometry["coordinates"] = py::make_tuple(py::make_tuple(c.from.x, c.from.y), py::make_tuple(c.to.x, c.to.y));
    d["geometry"] = geometry;
    connectors.append(std::move(d));
  }

  py::list rounds;
  for (const auto &r : res.rounds) {
    py::dict d;
    d["round"] = r.round;
    d["queries"] = r.queries;
    d["targets"] = r.targets;
    d["groups"] = r.groups;
    d["accepted"] = r.accepted;
    d["rejected_angle"] = r.rejected_angle;
    d["rejected_connector_angle"] = r.rejected_connector_angle;
    d["rejected_self_loop"] = r.rejected_self_loop;
    d["rejected_degenerate"] = r.rejected_degenerate;
    d["no_successor_left"] = r.no_successor_left;
    d["no_predecessor_left"] = r.no_predecessor_left;
    rounds.append(std::move(d));
  }

  py::dict out;
  out["connectors"] = connectors;
  out["residual_no_successor"] = pool_ids(lines, res.residual.no_successor);
  out["residual_no_predecessor"] = pool_ids(lines, res.residual.no_predecessor);
  out["rounds"] = rounds;
  out["stop_reason"] = gapfill::stop_reason_name(res.stop_reason);
  return out;
}

} // namespace

PYBIND11_MODULE(gapfill_cpp, m) {
  m.doc() = "Close gaps in a line network with angle-checked artificial lines (C++)";

  py::register_exception<gapfill::InputError>(m, "InputError", PyExc_ValueError);

  m.def(
      "close_gaps",
      &close_gaps_cpp,
      py::arg("features"),
      py::arg("angle_threshold") = 5.0,
      py::arg("max_rounds") = 0,
      "Close dangling line ends; returns {connectors, residual_no_successor, residual_no_predecessor, rounds, "
      "stop_reason}.");
}
