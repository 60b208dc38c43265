#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "line_feature.h"
#include "nearest_candidates.h"

namespace gapfill {

// Proposed straight segment from a no-successor line's end point to a
// no-predecessor line's start point.
struct ConnectorCandidate {
  std::size_t source = 0;
  std::size_t destination = 0;
  geom_common::Pt from{};
  geom_common::Pt to{};
};

// Candidates keyed by source line (layer order); each group ordered by destination.
using ConnectorGroups = std::map<std::size_t, std::vector<ConnectorCandidate>>;

// One candidate per ranking, built from its nearest (rank 0) target only.
ConnectorGroups synthesize_connectors(const std::vector<LineFeature> &lines,
                                      const std::vector<CandidateRanking> &rankings);

enum class Verdict {
  Accepted,
  AngleExceeded,           // source and destination lines diverge too much
  ConnectorAngleExceeded,  // connector diverges from the destination line
  SelfLoop,
  DegenerateSegment,       // a zero-length segment has no bearing
};

const char *verdict_name(Verdict v);

struct ScoredConnector {
  ConnectorCandidate candidate;
  double angle = 0.0;      // |bearing(source last seg) - bearing(destination first seg)|
  double angle_art = 0.0;  // |bearing(connector) - bearing(destination first seg)|
  Verdict verdict = Verdict::Accepted;
};

// Picks the group member with the smallest |source - destination| bearing
// difference (first wins ties) and judges it against angle_threshold. A
// winning self-connection rejects the group. Bearings are raw atan2 degrees, so pairs straddling
// +-180 read as nearly 360 apart.
ScoredConnector select_connector(const std::vector<LineFeature> &lines,
                                 const std::vector<ConnectorCandidate> &group, double angle_threshold);

struct AngularFilterResult {
  std::vector<ScoredConnector> accepted;
  std::vector<ScoredConnector> rejected;
};

AngularFilterResult filter_connectors(const std::vector<LineFeature> &lines, const ConnectorGroups &groups,
                                      double angle_threshold);

} // namespace gapfill
