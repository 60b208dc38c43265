#pragma once

#include <cstddef>
#include <vector>

#include "R_tree.h"
#include "endpoint_registry.h"

namespace gapfill {

struct CandidateRanking {
  std::size_t query = 0;             // no-predecessor line
  std::vector<std::size_t> targets;  // no-successor lines, nearest first
  std::vector<double> distances;
};

// Spatial index over the end points of the no-successor pool. Built once per
// run; matched targets are removed between rounds instead of rebuilding.
class NearestCandidateFinder {
public:
  NearestCandidateFinder(const std::vector<LineFeature> &lines, const std::vector<std::size_t> &targets);

  void remove_target(std::size_t line);
  std::size_t target_count() const { return index_.size(); }

  // For every query line's start point, the k nearest target end points.
  // Returns one ranking per query (in query order) with min(k, target_count()) entries.
  std::vector<CandidateRanking> rank(const std::vector<std::size_t> &queries, std::size_t k) const;

private:
  const std::vector<LineFeature> &lines_;
  R_tree index_;
};

} // namespace gapfill
