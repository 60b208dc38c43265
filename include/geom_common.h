#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <optional>

namespace geom_common {

struct Pt {
  double x;
  double y;
};

inline bool operator==(const Pt &a, const Pt &b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Pt &a, const Pt &b) { return !(a == b); }

struct BBox {
  double minx{std::numeric_limits<double>::infinity()};
  double miny{std::numeric_limits<double>::infinity()};
  double maxx{-std::numeric_limits<double>::infinity()};
  double maxy{-std::numeric_limits<double>::infinity()};
};

static inline bool bbox_is_empty(const BBox &b) { return b.minx > b.maxx || b.miny > b.maxy; }

static inline bool bbox_intersects(const BBox &a, const BBox &b) {
  return !(a.maxx < b.minx || a.minx > b.maxx || a.maxy < b.miny || a.miny > b.maxy);
}

static inline bool bbox_contains(const BBox &b, const Pt &p) {
  return p.x >= b.minx && p.x <= b.maxx && p.y >= b.miny && p.y <= b.maxy;
}

static inline double dist2(const Pt &a, const Pt &b) {
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  return dx * dx + dy * dy;
}

// Squared distance from p to the closest point of bb; infinity for an empty box.
static inline double bbox_dist2(const BBox &bb, const Pt &p) {
  if (bbox_is_empty(bb)) {
    return std::numeric_limits<double>::infinity();
  }
  const double nx = std::max(bb.minx, std::min(p.x, bb.maxx));
  const double ny = std::max(bb.miny, std::min(p.y, bb.maxy));
  return dist2(p, Pt{nx, ny});
}

static inline double bbox_area(const BBox &b) {
  if (bbox_is_empty(b)) return 0.0;
  return (b.maxx - b.minx) * (b.maxy - b.miny);
}

static inline BBox bbox_empty() {
  return BBox{std::numeric_limits<double>::infinity(),
              std::numeric_limits<double>::infinity(),
              -std::numeric_limits<double>::infinity(),
              -std::numeric_limits<double>::infinity()};
}

static inline void bbox_expand(BBox &bb, const Pt &p) {
  bb.minx = std::min(bb.minx, p.x);
  bb.miny = std::min(bb.miny, p.y);
  bb.maxx = std::max(bb.maxx, p.x);
  bb.maxy = std::max(bb.maxy, p.y);
}

static inline void bbox_merge(BBox &bb, const BBox &other) {
  bb.minx = std::min(bb.minx, other.minx);
  bb.miny = std::min(bb.miny, other.miny);
  bb.maxx = std::max(bb.maxx, other.maxx);
  bb.maxy = std::max(bb.maxy, other.maxy);
}

static inline double enlargement_needed(const BBox &box, const BBox &add) {
  BBox merged = box;
  bbox_merge(merged, add);
  return bbox_area(merged) - bbox_area(box);
}

// Direction of a->b in degrees, straight from atan2 (range (-180, 180]).
// A zero-length segment has no direction.
static inline std::optional<double> bearing_deg(const Pt &a, const Pt &b) {
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  if (dx == 0.0 && dy == 0.0) {
    return std::nullopt;
  }
  constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
  return std::atan2(dy, dx) * kRadToDeg;
}

// Exact coordinate key: two points share a key iff they compare equal.
struct PtKey {
  std::uint64_t xbits;
  std::uint64_t ybits;

  bool operator==(const PtKey &o) const noexcept { return xbits == o.xbits && ybits == o.ybits; }
};

struct PtKeyHash {
  std::size_t operator()(const PtKey &k) const noexcept {
    std::size_t h = std::hash<std::uint64_t>{}(k.xbits);
    h ^= (std::hash<std::uint64_t>{}(k.ybits) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    return h;
  }
};

static inline std::uint64_t double_bits(double v) {
  if (v == 0.0) {
    v = 0.0;  // -0.0 == 0.0
  }
  std::uint64_t out = 0;
  std::memcpy(&out, &v, sizeof(out));
  return out;
}

static inline PtKey exact_key(const Pt &p) { return PtKey{double_bits(p.x), double_bits(p.y)}; }

} // namespace geom_common
