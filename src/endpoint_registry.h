#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "line_feature.h"

namespace gapfill {

enum class EndpointRole { Start, End };

struct Endpoint {
  geom_common::Pt point;
  std::size_t line = 0;  // index into the line layer
  EndpointRole role = EndpointRole::Start;
};

inline Endpoint endpoint_of(const std::vector<LineFeature> &lines, std::size_t line, EndpointRole role) {
  const auto &ln = lines[line];
  return Endpoint{role == EndpointRole::Start ? ln.start_point() : ln.end_point(), line, role};
}

// Maps exact coordinates to the lines that start/end there.
class EndpointRegistry {
public:
  explicit EndpointRegistry(const std::vector<LineFeature> &lines);

  bool has_start_at(const geom_common::Pt &p) const;
  bool has_end_at(const geom_common::Pt &p) const;

  const std::vector<std::size_t> &lines_starting_at(const geom_common::Pt &p) const;
  const std::vector<std::size_t> &lines_ending_at(const geom_common::Pt &p) const;

private:
  using Index = std::unordered_map<geom_common::PtKey, std::vector<std::size_t>, geom_common::PtKeyHash>;

  Index starts_;
  Index ends_;
};

// Line indices in layer order.
struct CandidatePools {
  std::vector<std::size_t> no_successor;
  std::vector<std::size_t> no_predecessor;
};

// Lines whose end point starts no line, and lines whose start point ends no line.
// The layer must already have passed validate_lines().
CandidatePools extract_candidate_pools(const std::vector<LineFeature> &lines);

} // namespace gapfill
