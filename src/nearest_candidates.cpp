#include "nearest_candidates.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace gapfill {

NearestCandidateFinder::NearestCandidateFinder(const std::vector<LineFeature> &lines,
                                               const std::vector<std::size_t> &targets)
    : lines_(lines) {
  if (lines.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("line layer too large for the endpoint index");
  }
  std::vector<RTreeEntry> entries;
  entries.reserve(targets.size());
  for (const std::size_t t : targets) {
    const Endpoint ep = endpoint_of(lines_, t, EndpointRole::End);
    entries.push_back(RTreeEntry{ep.point, static_cast<int>(ep.line)});
  }
  index_.bulk_load(std::move(entries));
}

void NearestCandidateFinder::remove_target(std::size_t line) {
  const Endpoint ep = endpoint_of(lines_, line, EndpointRole::End);
  if (!index_.remove(ep.point, static_cast<int>(ep.line))) {
    throw std::runtime_error("line " + lines_[line].fid + " is not an indexed target");
  }
}

std::vector<CandidateRanking> NearestCandidateFinder::rank(const std::vector<std::size_t> &queries,
                                                           std::size_t k) const {
  std::vector<CandidateRanking> out;
  out.reserve(queries.size());
  for (const std::size_t q : queries) {
    const Endpoint ep = endpoint_of(lines_, q, EndpointRole::Start);
    CandidateRanking r;
    r.query = q;
    for (const auto &hit : index_.nearest_k(ep.point, k)) {
      r.targets.push_back(static_cast<std::size_t>(hit.id));
      r.distances.push_back(std::sqrt(hit.dist2));
    }
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace gapfill
