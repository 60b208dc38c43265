#include "gap_closer.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_set>
#include <utility>

#include "nearest_candidates.h"

namespace gapfill {

namespace {

void check_config(const GapCloserConfig &config) {
  if (!std::isfinite(config.angle_threshold) || !(config.angle_threshold > 0.0)) {
    throw InputError("angle threshold must be a positive number of degrees, got " +
                     std::to_string(config.angle_threshold));
  }
  if (config.neighbor_count < 1) {
    throw InputError("neighbor count must be at least 1");
  }
  if (config.max_rounds < 0) {
    throw InputError("max rounds must be >= 0, got " + std::to_string(config.max_rounds));
  }
}

void drop_matched(std::vector<std::size_t> &pool, const std::unordered_set<std::size_t> &matched) {
  pool.erase(std::remove_if(pool.begin(), pool.end(), [&](std::size_t i) { return matched.count(i) > 0; }),
             pool.end());
}

void tally(RoundReport &rep, const std::vector<ScoredConnector> &rejected) {
  for (const auto &sc : rejected) {
    switch (sc.verdict) {
    case Verdict::AngleExceeded:
      rep.rejected_angle += 1;
      break;
    case Verdict::ConnectorAngleExceeded:
      rep.rejected_connector_angle += 1;
      break;
    case Verdict::SelfLoop:
      rep.rejected_self_loop += 1;
      break;
    case Verdict::DegenerateSegment:
      rep.rejected_degenerate += 1;
      break;
    case Verdict::Accepted:
      break;
    }
  }
}

} // namespace

const char *stop_reason_name(StopReason r) {
  switch (r) {
  case StopReason::Converged:
    return "converged";
  case StopReason::NoTargets:
    return "no_targets";
  case StopReason::MaxRounds:
    return "max_rounds";
  }
  return "unknown";
}

GapCloserResult close_gaps(const std::vector<LineFeature> &lines, const GapCloserConfig &config) {
  check_config(config);
  validate_lines(lines);

  GapCloserResult result;
  result.initial = extract_candidate_pools(lines);
  CandidatePools pools = result.initial;
  NearestCandidateFinder finder(lines, pools.no_successor);

  std::size_t previous_count = 0;
  for (int round = 1;; round++) {
    RoundReport rep;
    rep.round = round;
    rep.queries = pools.no_predecessor.size();
    rep.targets = finder.target_count();

    // The pools are only read until every query of the round is answered.
    const auto rankings = finder.rank(pools.no_predecessor, config.neighbor_count);
    const auto groups = synthesize_connectors(lines, rankings);
    const auto filtered = filter_connectors(lines, groups, config.angle_threshold);
    rep.groups = groups.size();
    rep.accepted = filtered.accepted.size();
    tally(rep, filtered.rejected);

    std::unordered_set<std::size_t> matched_sources;
    std::unordered_set<std::size_t> matched_destinations;
    for (const auto &sc : filtered.accepted) {
      const auto &c = sc.candidate;
      result.connectors.push_back(AcceptedConnector{
          .source = c.source,
          .destination = c.destination,
          .source_fid = lines[c.source].fid,
          .destination_fid = lines[c.destination].fid,
          .from = c.from,
          .to = c.to,
          .angle = sc.angle,
          .angle_art = sc.angle_art,
          .round = round,
      });
      matched_sources.insert(c.source);
      matched_destinations.insert(c.destination);
      finder.remove_target(c.source);
    }
    drop_matched(pools.no_successor, matched_sources);
    drop_matched(pools.no_predecessor, matched_destinations);

    rep.total_accepted = result.connectors.size();
    rep.no_successor_left = pools.no_successor.size();
    rep.no_predecessor_left = pools.no_predecessor.size();
    result.rounds.push_back(rep);
    if (config.on_round) {
      config.on_round(rep);
    }

    if (rep.targets == 0) {
      result.stop_reason = StopReason::NoTargets;
      break;
    }
    if (result.connectors.size() - previous_count < kMinNewConnectorsPerRound) {
      result.stop_reason = StopReason::Converged;
      break;
    }
    previous_count = result.connectors.size();
    if (config.max_rounds > 0 && round >= config.max_rounds) {
      result.stop_reason = StopReason::MaxRounds;
      break;
    }
  }

  result.residual = std::move(pools);
  return result;
}

std::string connector_name(const AcceptedConnector &c) {
  return "Artificial_" + c.source_fid + "_" + c.destination_fid;
}

std::vector<LineFeature> make_connector_features(const std::vector<LineFeature> &lines,
                                                 const std::vector<AcceptedConnector> &connectors,
                                                 const ConnectorFields &fields) {
  std::set<std::string> schema;
  for (const auto &ln : lines) {
    for (const auto &kv : ln.attributes) {
      schema.insert(kv.first);
    }
  }

  std::vector<LineFeature> out;
  out.reserve(connectors.size());
  for (const auto &c : connectors) {
    LineFeature f;
    f.fid = connector_name(c);
    f.pts = {c.from, c.to};
    for (const auto &key : schema) {
      f.attributes[key] = fields.placeholder;
    }
    f.attributes[fields.name_field] = f.fid;
    f.attributes[fields.length_field] = "0";
    out.push_back(std::move(f));
  }
  return out;
}

} // namespace gapfill
