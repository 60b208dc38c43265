#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>

#include "gap_closer.h"
#include "test_support.h"

using namespace gapfill;
using gapfill::testing::index_of;
using gapfill::testing::make_line;

namespace {

bool contains(const std::vector<std::size_t> &v, std::size_t x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

// Line "1" heads east and ends at the origin. Line "3" continues east just past
// it, then doubles back so that its own end lies next to the start of "1".
std::vector<LineFeature> east_pair(double dest_start_y) {
  return {make_line("1", {{-1, 0}, {0, 0}}),
          make_line("3", {{dest_start_y == 0.0 ? 0.001 : 0.0, dest_start_y},
                          {1, dest_start_y},
                          {1, -1},
                          {-1, -0.1}})};
}

// Five rows 10 units apart. Per row: S bends into the row from below, T turns
// east into a stub ending just short of the origin, D1 and D2 head east from
// just past it. Round 1 joins S->D1, round 2 T->D2, round 3 only proposes
// D1->S, which turns too sharply.
std::vector<LineFeature> staged_network() {
  std::vector<LineFeature> lines;
  for (int r = 0; r < 5; r++) {
    const double y = 10.0 * r;
    lines.push_back(make_line(std::to_string(10 * r + 1), {{-1, y - 0.5}, {-0.5, y}, {0, y}}));
    lines.push_back(make_line(std::to_string(10 * r + 2), {{-1, y - 0.3}, {-1, y + 0.001}, {-0.003, y + 0.001}}));
    lines.push_back(make_line(std::to_string(10 * r + 3), {{0.001, y}, {1, y}}));
    lines.push_back(make_line(std::to_string(10 * r + 4), {{0.002, y + 0.001}, {1.002, y + 0.001}}));
  }
  return lines;
}

// Rows of six eastbound segments separated by half-unit gaps.
std::vector<LineFeature> dashed_rows(int rows) {
  std::vector<LineFeature> lines;
  for (int r = 0; r < rows; r++) {
    for (int k = 0; k < 6; k++) {
      const double x = 1.5 * k;
      const double y = 10.0 * r;
      lines.push_back(make_line(std::to_string(10 * r + k + 1), {{x, y}, {x + 1.0, y}}));
    }
  }
  return lines;
}

} // namespace

TEST(GapCloserTest, JoinsStraightContinuation) {
  const auto lines = east_pair(0.0);
  const auto res = close_gaps(lines, GapCloserConfig{});

  ASSERT_EQ(res.connectors.size(), 1u);
  const auto &c = res.connectors[0];
  EXPECT_EQ(c.source_fid, "1");
  EXPECT_EQ(c.destination_fid, "3");
  EXPECT_EQ(c.from, (geom_common::Pt{0, 0}));
  EXPECT_EQ(c.to, (geom_common::Pt{0.001, 0}));
  EXPECT_DOUBLE_EQ(c.angle, 0.0);
  EXPECT_DOUBLE_EQ(c.angle_art, 0.0);
  EXPECT_EQ(c.round, 1);
  EXPECT_EQ(connector_name(c), "Artificial_1_3");

  EXPECT_EQ(res.residual.no_successor, (std::vector<std::size_t>{1}));
  EXPECT_EQ(res.residual.no_predecessor, (std::vector<std::size_t>{0}));
  ASSERT_EQ(res.rounds.size(), 1u);
  // "3" -> "1" is proposed too but turns back on itself.
  EXPECT_EQ(res.rounds[0].rejected_angle, 1u);
  EXPECT_EQ(res.stop_reason, StopReason::Converged);
}

TEST(GapCloserTest, ShortLineNearestToItselfBlocksItsGroup) {
  // The start of "1" is nearer its own end than any other, so "1" -> "1" joins
  // the group of "1" and wins the 0 degree tie against "1" -> "3".
  std::vector<LineFeature> lines{make_line("1", {{-1, 0}, {0, 0}}), make_line("3", {{0.001, 0}, {1, 0}})};
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  ASSERT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 1u);
  EXPECT_EQ(res.residual.no_successor, (std::vector<std::size_t>{0, 1}));
  EXPECT_EQ(res.residual.no_predecessor, (std::vector<std::size_t>{0, 1}));
}

TEST(GapCloserTest, RejectsSideStep) {
  const auto lines = east_pair(0.001);
  const auto res = close_gaps(lines, GapCloserConfig{});

  EXPECT_TRUE(res.connectors.empty());
  ASSERT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.rounds[0].rejected_connector_angle, 1u);
  EXPECT_EQ(res.rounds[0].rejected_angle, 1u);
  EXPECT_EQ(res.residual.no_successor, (std::vector<std::size_t>{0, 1}));
  EXPECT_EQ(res.residual.no_predecessor, (std::vector<std::size_t>{0, 1}));
}

TEST(GapCloserTest, IsolatedLineIsNeverJoinedToItself) {
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}})};
  const auto res = close_gaps(lines, GapCloserConfig{});

  EXPECT_TRUE(res.connectors.empty());
  ASSERT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 1u);
  EXPECT_EQ(res.stop_reason, StopReason::Converged);
  EXPECT_EQ(res.residual.no_successor, (std::vector<std::size_t>{0}));
  EXPECT_EQ(res.residual.no_predecessor, (std::vector<std::size_t>{0}));
}

TEST(GapCloserTest, SelfLoopRejectedEvenWhenAnglesPass) {
  // The line ends heading east just behind its own eastbound start.
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}, {1, 1}, {-3, 1}, {-3, 0}, {-2, 0}})};
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  ASSERT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 1u);
}

TEST(GapCloserTest, ClosedCycleHasNothingToDo) {
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}}), make_line("2", {{1, 0}, {0, 0}})};
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  EXPECT_TRUE(res.initial.no_successor.empty());
  EXPECT_TRUE(res.initial.no_predecessor.empty());
  EXPECT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.stop_reason, StopReason::NoTargets);
}

TEST(GapCloserTest, EmptyLayer) {
  const auto res = close_gaps({}, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  EXPECT_EQ(res.stop_reason, StopReason::NoTargets);
}

TEST(GapCloserTest, WraparoundBearingsAreRejected) {
  // "1" starts next to the end of "2", so neither line is its own nearest target.
  std::vector<LineFeature> lines{make_line("1", {{-2.001, 1}, {0, 0}, {-1, 0.01}}),
                                 make_line("2", {{-1.001, 0.01}, {-2.001, 0.0}})};
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  EXPECT_EQ(res.rounds[0].rejected_angle, 2u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 0u);
}

TEST(GapCloserTest, RepeatedStartCoordinateIsSkipped) {
  std::vector<LineFeature> lines{make_line("1", {{-1, 0}, {0, 0}}),
                                 make_line("2", {{0.001, 0}, {0.001, 0}, {1, 0}, {1, -1}, {-1, -0.1}})};
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_TRUE(res.connectors.empty());
  EXPECT_EQ(res.rounds[0].rejected_degenerate, 1u);
  EXPECT_EQ(res.rounds[0].rejected_angle, 1u);
}

TEST(GapCloserTest, RunsRoundsUntilYieldDrops) {
  const auto lines = staged_network();
  std::vector<RoundReport> seen;
  GapCloserConfig cfg;
  cfg.on_round = [&](const RoundReport &rep) { seen.push_back(rep); };
  const auto res = close_gaps(lines, cfg);

  EXPECT_EQ(res.connectors.size(), 10u);
  EXPECT_EQ(res.stop_reason, StopReason::Converged);
  ASSERT_EQ(res.rounds.size(), 3u);
  ASSERT_EQ(seen.size(), 3u);

  EXPECT_EQ(res.rounds[0].queries, 20u);
  EXPECT_EQ(res.rounds[0].targets, 20u);
  EXPECT_EQ(res.rounds[0].accepted, 5u);
  EXPECT_EQ(res.rounds[0].rejected_angle, 5u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 0u);
  EXPECT_EQ(res.rounds[1].queries, 15u);
  EXPECT_EQ(res.rounds[1].accepted, 5u);
  EXPECT_EQ(res.rounds[2].queries, 10u);
  EXPECT_EQ(res.rounds[2].accepted, 0u);
  EXPECT_EQ(res.rounds[2].rejected_angle, 5u);
  EXPECT_EQ(seen[2].total_accepted, 10u);
  EXPECT_EQ(seen[1].no_successor_left, 10u);
  EXPECT_EQ(seen[1].no_predecessor_left, 10u);

  for (int r = 0; r < 5; r++) {
    const std::string s = std::to_string(10 * r + 1);
    const std::string t = std::to_string(10 * r + 2);
    const std::string d1 = std::to_string(10 * r + 3);
    const std::string d2 = std::to_string(10 * r + 4);
    const auto round_of = [&](const std::string &src, const std::string &dst) {
      for (const auto &c : res.connectors) {
        if (c.source_fid == src && c.destination_fid == dst) return c.round;
      }
      return 0;
    };
    EXPECT_EQ(round_of(s, d1), 1) << "row " << r;
    EXPECT_EQ(round_of(t, d2), 2) << "row " << r;
  }

  EXPECT_EQ(res.residual.no_successor.size(), 10u);
  EXPECT_EQ(res.residual.no_predecessor.size(), 10u);
  EXPECT_TRUE(contains(res.residual.no_successor, static_cast<std::size_t>(index_of(lines, "3"))));
  EXPECT_TRUE(contains(res.residual.no_predecessor, static_cast<std::size_t>(index_of(lines, "2"))));
}

TEST(GapCloserTest, MaxRoundsCutsTheRunShort) {
  const auto lines = staged_network();
  GapCloserConfig cfg;
  cfg.max_rounds = 1;
  const auto res = close_gaps(lines, cfg);
  EXPECT_EQ(res.connectors.size(), 5u);
  EXPECT_EQ(res.rounds.size(), 1u);
  EXPECT_EQ(res.stop_reason, StopReason::MaxRounds);
}

TEST(GapCloserTest, ConnectorsRespectMatchingInvariants) {
  const auto lines = staged_network();
  const auto res = close_gaps(lines, GapCloserConfig{});

  std::set<std::size_t> sources;
  std::set<std::size_t> destinations;
  for (const auto &c : res.connectors) {
    EXPECT_NE(c.source, c.destination);
    EXPECT_TRUE(sources.insert(c.source).second) << "source reused: " << c.source_fid;
    EXPECT_TRUE(destinations.insert(c.destination).second) << "destination reused: " << c.destination_fid;
    EXPECT_TRUE(contains(res.initial.no_successor, c.source));
    EXPECT_TRUE(contains(res.initial.no_predecessor, c.destination));
    EXPECT_FALSE(contains(res.residual.no_successor, c.source));
    EXPECT_FALSE(contains(res.residual.no_predecessor, c.destination));
    EXPECT_LT(c.angle, 5.0);
    EXPECT_LT(c.angle_art, 5.0);
    EXPECT_EQ(c.from, lines[c.source].end_point());
    EXPECT_EQ(c.to, lines[c.destination].start_point());
  }
}

TEST(GapCloserTest, SameInputGivesSameConnectors) {
  const auto lines = dashed_rows(4);
  const auto a = close_gaps(lines, GapCloserConfig{});
  const auto b = close_gaps(lines, GapCloserConfig{});
  ASSERT_EQ(a.connectors.size(), b.connectors.size());
  for (std::size_t i = 0; i < a.connectors.size(); i++) {
    EXPECT_EQ(a.connectors[i].source, b.connectors[i].source);
    EXPECT_EQ(a.connectors[i].destination, b.connectors[i].destination);
  }
}

TEST(GapCloserTest, DashedRowsLeaveFirstGapOpen) {
  // Each row head is its own nearest target and ties with the next dash, so
  // the first gap of every row stays open; the other four close in round 1.
  const auto lines = dashed_rows(4);
  const auto res = close_gaps(lines, GapCloserConfig{});
  EXPECT_EQ(res.connectors.size(), 16u);
  ASSERT_EQ(res.rounds.size(), 2u);
  EXPECT_EQ(res.rounds[0].accepted, 16u);
  EXPECT_EQ(res.rounds[0].rejected_self_loop, 4u);
  EXPECT_EQ(res.rounds[1].accepted, 0u);
  EXPECT_EQ(res.rounds[1].rejected_self_loop, 4u);
  EXPECT_EQ(res.residual.no_successor.size(), 8u);
  EXPECT_EQ(res.residual.no_predecessor.size(), 8u);
  for (const auto &c : res.connectors) {
    EXPECT_NE(c.source_fid.back(), '1') << c.source_fid;
  }
}

TEST(GapCloserTest, RejectsBadThreshold) {
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}})};
  for (const double t : {0.0, -3.0, std::numeric_limits<double>::quiet_NaN(),
                         std::numeric_limits<double>::infinity()}) {
    GapCloserConfig cfg;
    cfg.angle_threshold = t;
    EXPECT_THROW(close_gaps(lines, cfg), InputError) << t;
  }
}

TEST(GapCloserTest, RejectsBadCounts) {
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}})};
  GapCloserConfig no_neighbors;
  no_neighbors.neighbor_count = 0;
  EXPECT_THROW(close_gaps(lines, no_neighbors), InputError);
  GapCloserConfig negative_rounds;
  negative_rounds.max_rounds = -1;
  EXPECT_THROW(close_gaps(lines, negative_rounds), InputError);
}

TEST(GapCloserTest, MalformedLayerFailsBeforeAnyRound) {
  std::vector<LineFeature> lines{make_line("1", {{0, 0}, {1, 0}}), make_line("2", {{4, 4}})};
  int calls = 0;
  GapCloserConfig cfg;
  cfg.on_round = [&](const RoundReport &) { calls++; };
  EXPECT_THROW(close_gaps(lines, cfg), InputError);
  EXPECT_EQ(calls, 0);
}

TEST(GapCloserTest, ConnectorFeaturesMatchLayerSchema) {
  auto lines = east_pair(0.0);
  lines[0].attributes = {{"name", "Kanaal"}, {"kind", "water"}};
  lines[1].attributes = {{"width", "4"}};
  const auto res = close_gaps(lines, GapCloserConfig{});
  ASSERT_EQ(res.connectors.size(), 1u);

  const auto features = make_connector_features(lines, res.connectors);
  ASSERT_EQ(features.size(), 1u);
  const auto &f = features[0];
  EXPECT_EQ(f.fid, "Artificial_1_3");
  ASSERT_EQ(f.pts.size(), 2u);
  EXPECT_EQ(f.pts[0], (geom_common::Pt{0, 0}));
  EXPECT_EQ(f.pts[1], (geom_common::Pt{0.001, 0}));
  EXPECT_EQ(f.attributes.at("name"), "Artificial_1_3");
  EXPECT_EQ(f.attributes.at("length"), "0");
  EXPECT_EQ(f.attributes.at("kind"), "_");
  EXPECT_EQ(f.attributes.at("width"), "_");
  EXPECT_EQ(f.attributes.size(), 4u);

  ConnectorFields dutch;
  dutch.name_field = "naam";
  dutch.length_field = "lengte";
  dutch.placeholder = "-";
  const auto renamed = make_connector_features(lines, res.connectors, dutch);
  EXPECT_EQ(renamed[0].attributes.at("naam"), "Artificial_1_3");
  EXPECT_EQ(renamed[0].attributes.at("lengte"), "0");
  EXPECT_EQ(renamed[0].attributes.at("name"), "-");
}
