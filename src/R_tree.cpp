#include "R_tree.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>

namespace gapfill {

using geom_common::BBox;
using geom_common::Pt;

static BBox point_bbox(const Pt &p) { return BBox{p.x, p.y, p.x, p.y}; }

void R_tree::split(R_tree_node &node) {
  const std::size_t n = node.entries.size();
  if (n <= 1) {
    return;
  }

  // Linear split: pick the pair with the largest normalized separation on
  // either axis, then hand out the rest by least enlargement.
  struct SeedPick {
    int a = -1;
    int b = -1;
    double sep = 0.0;
  };

  const auto pick_seeds_axis = [&](bool use_x) -> SeedPick {
    double min_low = std::numeric_limits<double>::infinity();
    double max_high = -std::numeric_limits<double>::infinity();
    int idx_max = -1;
    int idx_min = -1;
    double max_v = -std::numeric_limits<double>::infinity();
    double min_v = std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < n; ++i) {
      const auto &p = node.entries[i].p;
      const double v = use_x ? p.x : p.y;
      min_low = std::min(min_low, v);
      max_high = std::max(max_high, v);
      if (v > max_v) {
        max_v = v;
        idx_max = static_cast<int>(i);
      }
      if (v < min_v) {
        min_v = v;
        idx_min = static_cast<int>(i);
      }
    }

    SeedPick out;
    out.a = idx_max;
    out.b = idx_min;
    const double width = std::max(1e-12, max_high - min_low);
    out.sep = (max_v - min_v) / width;
    return out;
  };

  SeedPick sx = pick_seeds_axis(true);
  SeedPick sy = pick_seeds_axis(false);
  SeedPick s = (sy.sep > sx.sep) ? sy : sx;

  int seed_a = s.a;
  int seed_b = s.b;
  if (seed_a < 0 || seed_b < 0) {
    return;
  }
  if (seed_a == seed_b) {
    // All entries share one coordinate: split by position.
    seed_b = (seed_a == 0) ? 1 : 0;
  }

  auto left = std::make_unique<R_tree_node>();
  auto right = std::make_unique<R_tree_node>();
  left->parent = &node;
  right->parent = &node;

  const auto push_to = [](R_tree_node &dst, const RTreeEntry &e) {
    dst.entries.push_back(e);
    geom_common::bbox_expand(dst.bb, e.p);
  };

  push_to(*left, node.entries[static_cast<std::size_t>(seed_a)]);
  push_to(*right, node.entries[static_cast<std::size_t>(seed_b)]);

  const std::size_t min_fill = (n + 1) / 2 - 1;

  std::size_t remaining = n - 2;
  for (std::size_t k = 0; k < n; ++k) {
    if (static_cast<int>(k) == seed_a || static_cast<int>(k) == seed_b) {
      continue;
    }
    const auto &e = node.entries[k];

    if (left->entries.size() + remaining <= min_fill) {
      push_to(*left, e);
    } else if (right->entries.size() + remaining <= min_fill) {
      push_to(*right, e);
    } else {
      const BBox eb = point_bbox(e.p);
      const double el = geom_common::enlargement_needed(left->bb, eb);
      const double er = geom_common::enlargement_needed(right->bb, eb);
      const double dl = geom_common::bbox_dist2(left->bb, e.p);
      const double dr = geom_common::bbox_dist2(right->bb, e.p);
      if (el < er) {
        push_to(*left, e);
      } else if (er < el) {
        push_to(*right, e);
      } else if (dl < dr) {
        push_to(*left, e);
      } else if (dr < dl) {
        push_to(*right, e);
      } else if (left->entries.size() <= right->entries.size()) {
        push_to(*left, e);
      } else {
        push_to(*right, e);
      }
    }
    remaining -= 1;
  }

  left->count = left->entries.size();
  right->count = right->entries.size();
  node.left = std::move(left);
  node.right = std::move(right);
  node.entries.clear();
  recompute_bbox(&node);
}

void R_tree::build(R_tree_node &node, EntryIt first, EntryIt last) const {
  node.count = static_cast<std::size_t>(last - first);
  if (node.count <= static_cast<std::size_t>(max_entries_per_node)) {
    node.entries.assign(first, last);
    recompute_bbox(&node);
    return;
  }

  BBox span = geom_common::bbox_empty();
  for (auto it = first; it != last; ++it) {
    geom_common::bbox_expand(span, it->p);
  }
  const bool use_x = (span.maxx - span.minx) >= (span.maxy - span.miny);
  const auto mid = first + (last - first) / 2;
  std::nth_element(first, mid, last, [use_x](const RTreeEntry &a, const RTreeEntry &b) {
    return use_x ? a.p.x < b.p.x : a.p.y < b.p.y;
  });

  node.left = std::make_unique<R_tree_node>();
  node.right = std::make_unique<R_tree_node>();
  node.left->parent = &node;
  node.right->parent = &node;
  build(*node.left, first, mid);
  build(*node.right, mid, last);
  recompute_bbox(&node);
}

void R_tree::bulk_load(std::vector<RTreeEntry> entries) {
  root_ = std::make_unique<R_tree_node>();
  size_ = entries.size();
  build(*root_, entries.begin(), entries.end());
}

void R_tree::insert(const Pt &p, int id) {
  R_tree_node *current = root_.get();
  const BBox pb = point_bbox(p);
  while (!current->is_leaf()) {
    current->count += 1;
    R_tree_node *l = current->left.get();
    R_tree_node *r = current->right.get();
    const double enlarge_left = geom_common::enlargement_needed(l->bb, pb);
    const double enlarge_right = geom_common::enlargement_needed(r->bb, pb);
    // Zero-area boxes (collinear points) tie on area.
    const double dist_left = geom_common::bbox_dist2(l->bb, p);
    const double dist_right = geom_common::bbox_dist2(r->bb, p);
    if (enlarge_left < enlarge_right) {
      current = l;
    } else if (enlarge_right < enlarge_left) {
      current = r;
    } else if (dist_left < dist_right) {
      current = l;
    } else if (dist_right < dist_left) {
      current = r;
    } else if (l->count <= r->count) {
      current = l;
    } else {
      current = r;
    }
  }
  current->count += 1;
  current->entries.push_back(RTreeEntry{p, id});
  geom_common::bbox_expand(current->bb, p);
  size_ += 1;

  if (current->entries.size() > static_cast<std::size_t>(max_entries_per_node)) {
    split(*current);
  }

  // Ancestors must cover the new point or queries will skip it.
  for (R_tree_node *n = current; n != nullptr; n = n->parent) {
    recompute_bbox(n);
  }
}

bool R_tree::remove(const Pt &p, int id) {
  std::function<R_tree_node *(R_tree_node *)> find_leaf = [&](R_tree_node *node) -> R_tree_node * {
    if (!node || !geom_common::bbox_contains(node->bb, p)) return nullptr;
    if (node->is_leaf()) {
      for (const auto &e : node->entries) {
        if (e.id == id && e.p == p) return node;
      }
      return nullptr;
    }
    if (auto *hit = find_leaf(node->left.get())) return hit;
    return find_leaf(node->right.get());
  };

  R_tree_node *leaf = find_leaf(root_.get());
  if (!leaf) {
    return false;
  }
  auto it = std::find_if(leaf->entries.begin(), leaf->entries.end(),
                         [&](const RTreeEntry &e) { return e.id == id && e.p == p; });
  leaf->entries.erase(it);
  size_ -= 1;
  for (R_tree_node *n = leaf; n != nullptr; n = n->parent) {
    n->count -= 1;
  }
  condense(leaf);
  return true;
}

std::size_t R_tree::depth() const {
  std::function<std::size_t(const R_tree_node *)> levels = [&](const R_tree_node *node) -> std::size_t {
    if (!node) return 0;
    if (node->is_leaf()) return 1;
    return 1 + std::max(levels(node->left.get()), levels(node->right.get()));
  };
  return levels(root_.get());
}

void R_tree::recompute_bbox(R_tree_node *node) {
  if (!node) return;
  node->bb = geom_common::bbox_empty();
  if (!node->is_leaf()) {
    if (node->left) geom_common::bbox_merge(node->bb, node->left->bb);
    if (node->right) geom_common::bbox_merge(node->bb, node->right->bb);
  } else {
    for (const auto &e : node->entries) {
      geom_common::bbox_expand(node->bb, e.p);
    }
  }
}

// Walks from a leaf to the root, dropping emptied leaves and refitting boxes.
void R_tree::condense(R_tree_node *node) {
  for (R_tree_node *n = node; n != nullptr; n = n->parent) {
    if (!n->is_leaf()) {
      const bool left_empty = n->left->is_leaf() && n->left->entries.empty();
      const bool right_empty = n->right->is_leaf() && n->right->entries.empty();
      if (left_empty || right_empty) {
        std::unique_ptr<R_tree_node> keep = left_empty ? std::move(n->right) : std::move(n->left);
        n->left = std::move(keep->left);
        n->right = std::move(keep->right);
        n->entries = std::move(keep->entries);
        if (n->left) n->left->parent = n;
        if (n->right) n->right->parent = n;
      }
    }
    recompute_bbox(n);
  }
}

void R_tree::query_box_ids(double minx, double miny, double maxx, double maxy, std::vector<int> &out_ids) const {
  const BBox q{minx, miny, maxx, maxy};
  std::function<void(const R_tree_node *)> dfs = [&](const R_tree_node *node) {
    if (!node || geom_common::bbox_is_empty(node->bb) || !geom_common::bbox_intersects(node->bb, q)) return;
    if (node->is_leaf()) {
      for (const auto &e : node->entries) {
        if (geom_common::bbox_contains(q, e.p)) {
          out_ids.push_back(e.id);
        }
      }
    } else {
      dfs(node->left.get());
      dfs(node->right.get());
    }
  };
  dfs(root_.get());
}

std::vector<RTreeHit> R_tree::nearest_k(const Pt &p, std::size_t k) const {
  std::vector<RTreeHit> out;
  if (k == 0 || size_ == 0) {
    return out;
  }
  out.reserve(std::min(k, size_));

  // Best-first search. At equal distance nodes are expanded before entries are
  // emitted, so equidistant entries come out in id order.
  struct QItem {
    double d2;
    bool is_entry;
    int id;
    const R_tree_node *node;
  };
  const auto later = [](const QItem &a, const QItem &b) {
    if (a.d2 != b.d2) return a.d2 > b.d2;
    if (a.is_entry != b.is_entry) return a.is_entry;
    return a.id > b.id;
  };
  std::priority_queue<QItem, std::vector<QItem>, decltype(later)> pq(later);
  pq.push(QItem{geom_common::bbox_dist2(root_->bb, p), false, -1, root_.get()});

  while (!pq.empty() && out.size() < k) {
    const QItem top = pq.top();
    pq.pop();
    if (top.is_entry) {
      out.push_back(RTreeHit{top.id, top.d2});
      continue;
    }
    const R_tree_node *node = top.node;
    if (node->is_leaf()) {
      for (const auto &e : node->entries) {
        pq.push(QItem{geom_common::dist2(p, e.p), true, e.id, nullptr});
      }
    } else {
      for (const R_tree_node *child : {node->left.get(), node->right.get()}) {
        if (child && !geom_common::bbox_is_empty(child->bb)) {
          pq.push(QItem{geom_common::bbox_dist2(child->bb, p), false, -1, child});
        }
      }
    }
  }
  return out;
}

} // namespace gapfill
