#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "geom_common.h"

namespace gapfill {

// Point entry; id is caller-defined and breaks distance ties (lower id first).
struct RTreeEntry {
  geom_common::Pt p;
  int id = -1;
};

struct R_tree_node {
  R_tree_node *parent = nullptr;
  std::unique_ptr<R_tree_node> left;
  std::unique_ptr<R_tree_node> right;
  geom_common::BBox bb = geom_common::bbox_empty();
  std::vector<RTreeEntry> entries;
  std::size_t count = 0;  // entries in this subtree

  bool is_leaf() const { return !left && !right; }
};

struct RTreeHit {
  int id = -1;
  double dist2 = 0.0;
};

// Binary R-tree over points: linear split on overflow, incremental insert/remove.
// bulk_load() builds a balanced tree in one pass; inserting presorted points one
// by one deepens the tree along the insertion direction.
class R_tree {
public:
  R_tree() : root_(std::make_unique<R_tree_node>()) {}

  int max_entries_per_node = 8;

  // Replaces the contents with entries, split at the median of the wider axis.
  void bulk_load(std::vector<RTreeEntry> entries);
  void insert(const geom_common::Pt &p, int id);
  // Removes the entry with this id stored at p. Returns false if absent.
  bool remove(const geom_common::Pt &p, int id);

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  // Levels from the root to the deepest leaf; 1 for a lone root leaf.
  std::size_t depth() const;

  void query_box_ids(double minx, double miny, double maxx, double maxy, std::vector<int> &out_ids) const;
  // Up to k entries nearest to p, sorted by (dist2, id).
  std::vector<RTreeHit> nearest_k(const geom_common::Pt &p, std::size_t k) const;

private:
  using EntryIt = std::vector<RTreeEntry>::iterator;

  void build(R_tree_node &node, EntryIt first, EntryIt last) const;
  void split(R_tree_node &node);
  static void recompute_bbox(R_tree_node *node);
  static void condense(R_tree_node *node);

  std::unique_ptr<R_tree_node> root_;
  std::size_t size_ = 0;
};

} // namespace gapfill
