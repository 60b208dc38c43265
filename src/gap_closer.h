#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "connector.h"
#include "endpoint_registry.h"
#include "line_feature.h"

namespace gapfill {

struct RoundReport {
  int round = 0;
  std::size_t queries = 0;  // no-predecessor lines searched
  std::size_t targets = 0;  // no-successor end points indexed
  std::size_t groups = 0;
  std::size_t accepted = 0;
  std::size_t rejected_angle = 0;
  std::size_t rejected_connector_angle = 0;
  std::size_t rejected_self_loop = 0;
  std::size_t rejected_degenerate = 0;
  std::size_t total_accepted = 0;
  std::size_t no_successor_left = 0;
  std::size_t no_predecessor_left = 0;
};

struct GapCloserConfig {
  double angle_threshold = 5.0;  // degrees, > 0
  std::size_t neighbor_count = 3;
  int max_rounds = 0;  // 0 = until convergence
  std::function<void(const RoundReport &)> on_round;
};

struct AcceptedConnector {
  std::size_t source = 0;
  std::size_t destination = 0;
  std::string source_fid;
  std::string destination_fid;
  geom_common::Pt from{};
  geom_common::Pt to{};
  double angle = 0.0;
  double angle_art = 0.0;
  int round = 0;
};

enum class StopReason { Converged, NoTargets, MaxRounds };

const char *stop_reason_name(StopReason r);

struct GapCloserResult {
  std::vector<AcceptedConnector> connectors;
  CandidatePools initial;
  CandidatePools residual;
  std::vector<RoundReport> rounds;
  StopReason stop_reason = StopReason::Converged;
};

// Rounds stop once a round adds fewer than this many connectors.
inline constexpr std::size_t kMinNewConnectorsPerRound = 5;

// Validates the layer and config, then runs search/synthesis/filter rounds
// until the yield drops below kMinNewConnectorsPerRound. Throws InputError on
// invalid input; nothing is computed in that case.
GapCloserResult close_gaps(const std::vector<LineFeature> &lines, const GapCloserConfig &config);

struct ConnectorFields {
  std::string name_field = "name";
  std::string length_field = "length";
  std::string placeholder = "_";
};

// "Artificial_<source>_<destination>"
std::string connector_name(const AcceptedConnector &c);

// Turns accepted connectors into line features whose attribute keys match the
// layer's: name and length are set, every other key gets the placeholder.
std::vector<LineFeature> make_connector_features(const std::vector<LineFeature> &lines,
                                                 const std::vector<AcceptedConnector> &connectors,
                                                 const ConnectorFields &fields = ConnectorFields{});

} // namespace gapfill
