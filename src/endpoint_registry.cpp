#include "endpoint_registry.h"

namespace gapfill {

namespace {

const std::vector<std::size_t> kNoLines;

} // namespace

EndpointRegistry::EndpointRegistry(const std::vector<LineFeature> &lines) {
  starts_.reserve(lines.size());
  ends_.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); i++) {
    const auto &ln = lines[i];
    if (ln.pts.size() < 2) {
      continue;
    }
    starts_[geom_common::exact_key(ln.start_point())].push_back(i);
    ends_[geom_common::exact_key(ln.end_point())].push_back(i);
  }
}

bool EndpointRegistry::has_start_at(const geom_common::Pt &p) const {
  return starts_.find(geom_common::exact_key(p)) != starts_.end();
}

bool EndpointRegistry::has_end_at(const geom_common::Pt &p) const {
  return ends_.find(geom_common::exact_key(p)) != ends_.end();
}

const std::vector<std::size_t> &EndpointRegistry::lines_starting_at(const geom_common::Pt &p) const {
  auto it = starts_.find(geom_common::exact_key(p));
  return it == starts_.end() ? kNoLines : it->second;
}

const std::vector<std::size_t> &EndpointRegistry::lines_ending_at(const geom_common::Pt &p) const {
  auto it = ends_.find(geom_common::exact_key(p));
  return it == ends_.end() ? kNoLines : it->second;
}

CandidatePools extract_candidate_pools(const std::vector<LineFeature> &lines) {
  const EndpointRegistry registry(lines);

  CandidatePools pools;
  for (std::size_t i = 0; i < lines.size(); i++) {
    const auto &ln = lines[i];
    // A closed line (end == own start) counts as continued.
    if (!registry.has_start_at(ln.end_point())) {
      pools.no_successor.push_back(i);
    }
    if (!registry.has_end_at(ln.start_point())) {
      pools.no_predecessor.push_back(i);
    }
  }
  return pools;
}

} // namespace gapfill
