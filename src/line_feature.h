#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "geom_common.h"

namespace gapfill {

using Attributes = std::unordered_map<std::string, std::string>;

struct LineFeature {
  std::string fid;
  std::vector<geom_common::Pt> pts;
  Attributes attributes;

  const geom_common::Pt &start_point() const { return pts.front(); }
  const geom_common::Pt &end_point() const { return pts.back(); }
};

// Raised when a line layer breaks the input contract (ids, geometry, threshold).
class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string &what) : std::runtime_error(what) {}
};

// Checks every line before a run: non-empty unique fid, >= 2 finite coordinates.
void validate_lines(const std::vector<LineFeature> &lines);

// Integer ids compare numerically, everything else as text.
bool fid_less(const std::string &a, const std::string &b);

void sort_by_fid(std::vector<LineFeature> &lines);

} // namespace gapfill
