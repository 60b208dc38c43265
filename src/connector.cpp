#include "connector.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace gapfill {

using geom_common::Pt;

namespace {

constexpr double kUndefinedAngle = std::numeric_limits<double>::quiet_NaN();

std::optional<double> last_segment_bearing(const LineFeature &ln) {
  const std::size_t n = ln.pts.size();
  return geom_common::bearing_deg(ln.pts[n - 2], ln.pts[n - 1]);
}

std::optional<double> first_segment_bearing(const LineFeature &ln) {
  return geom_common::bearing_deg(ln.pts[0], ln.pts[1]);
}

} // namespace

ConnectorGroups synthesize_connectors(const std::vector<LineFeature> &lines,
                                      const std::vector<CandidateRanking> &rankings) {
  ConnectorGroups groups;
  for (const auto &r : rankings) {
    if (r.targets.empty()) {
      continue;
    }
    const std::size_t source = r.targets.front();
    groups[source].push_back(ConnectorCandidate{
        .source = source,
        .destination = r.query,
        .from = lines[source].end_point(),
        .to = lines[r.query].start_point(),
    });
  }
  for (auto &kv : groups) {
    std::sort(kv.second.begin(), kv.second.end(),
              [](const ConnectorCandidate &a, const ConnectorCandidate &b) { return a.destination < b.destination; });
  }
  return groups;
}

const char *verdict_name(Verdict v) {
  switch (v) {
  case Verdict::Accepted:
    return "accepted";
  case Verdict::AngleExceeded:
    return "angle_exceeded";
  case Verdict::ConnectorAngleExceeded:
    return "connector_angle_exceeded";
  case Verdict::SelfLoop:
    return "self_loop";
  case Verdict::DegenerateSegment:
    return "degenerate_segment";
  }
  return "unknown";
}

ScoredConnector select_connector(const std::vector<LineFeature> &lines,
                                 const std::vector<ConnectorCandidate> &group, double angle_threshold) {
  ScoredConnector best;
  best.angle = kUndefinedAngle;
  best.angle_art = kUndefinedAngle;
  best.verdict = Verdict::DegenerateSegment;
  if (group.empty()) {
    return best;
  }
  best.candidate = group.front();

  bool have_best = false;
  double min_angle = std::numeric_limits<double>::infinity();
  for (const auto &c : group) {
    const auto source_bearing = last_segment_bearing(lines[c.source]);
    const auto dest_bearing = first_segment_bearing(lines[c.destination]);
    if (!source_bearing || !dest_bearing) {
      continue;
    }
    const double angle = std::fabs(*source_bearing - *dest_bearing);
    if (angle < min_angle) {
      min_angle = angle;
      best.candidate = c;
      best.angle = angle;
      const auto art_bearing = geom_common::bearing_deg(c.from, c.to);
      best.angle_art = art_bearing ? std::fabs(*art_bearing - *dest_bearing) : kUndefinedAngle;
      have_best = true;
    }
  }

  // The winner is judged after selection: a self-connection that wins
  // rejects the whole group.
  if (!have_best) {
    best.verdict = Verdict::DegenerateSegment;
  } else if (best.candidate.source == best.candidate.destination) {
    best.verdict = Verdict::SelfLoop;
  } else if (std::isnan(best.angle_art)) {
    best.verdict = Verdict::DegenerateSegment;
  } else if (!(best.angle < angle_threshold)) {
    best.verdict = Verdict::AngleExceeded;
  } else if (!(best.angle_art < angle_threshold)) {
    best.verdict = Verdict::ConnectorAngleExceeded;
  } else {
    best.verdict = Verdict::Accepted;
  }
  return best;
}

AngularFilterResult filter_connectors(const std::vector<LineFeature> &lines, const ConnectorGroups &groups,
                                      double angle_threshold) {
  AngularFilterResult out;
  for (const auto &kv : groups) {
    ScoredConnector sc = select_connector(lines, kv.second, angle_threshold);
    if (sc.verdict == Verdict::Accepted) {
      out.accepted.push_back(sc);
    } else {
      out.rejected.push_back(sc);
    }
  }
  return out;
}

} // namespace gapfill
