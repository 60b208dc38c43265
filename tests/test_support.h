#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "line_feature.h"

namespace gapfill::testing {

inline LineFeature make_line(const std::string &fid, std::initializer_list<geom_common::Pt> pts) {
  LineFeature ln;
  ln.fid = fid;
  ln.pts.assign(pts.begin(), pts.end());
  return ln;
}

// Index of the line with this fid, or -1.
inline int index_of(const std::vector<LineFeature> &lines, const std::string &fid) {
  for (std::size_t i = 0; i < lines.size(); i++) {
    if (lines[i].fid == fid) return static_cast<int>(i);
  }
  return -1;
}

} // namespace gapfill::testing
