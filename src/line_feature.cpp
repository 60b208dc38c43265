#include "line_feature.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_set>

namespace gapfill {

namespace {

bool is_integer_text(const std::string &s) {
  std::size_t i = 0;
  if (!s.empty() && s[0] == '-') {
    i = 1;
  }
  if (i >= s.size()) {
    return false;
  }
  for (; i < s.size(); i++) {
    if (s[i] < '0' || s[i] > '9') {
      return false;
    }
  }
  return true;
}

// Compares two integer strings without converting (ids may exceed 64 bits).
bool integer_text_less(const std::string &a, const std::string &b) {
  const bool na = a[0] == '-';
  const bool nb = b[0] == '-';
  if (na != nb) {
    return na;
  }
  std::string ma = na ? a.substr(1) : a;
  std::string mb = nb ? b.substr(1) : b;
  ma.erase(0, std::min(ma.find_first_not_of('0'), ma.size() - 1));
  mb.erase(0, std::min(mb.find_first_not_of('0'), mb.size() - 1));
  bool mag_less;
  if (ma.size() != mb.size()) {
    mag_less = ma.size() < mb.size();
  } else if (ma == mb) {
    return false;
  } else {
    mag_less = ma < mb;
  }
  return na ? !mag_less : mag_less;
}

} // namespace

void validate_lines(const std::vector<LineFeature> &lines) {
  std::unordered_set<std::string> seen;
  seen.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); i++) {
    const auto &ln = lines[i];
    if (ln.fid.empty()) {
      throw InputError("line #" + std::to_string(i) + " has an empty id");
    }
    if (!seen.insert(ln.fid).second) {
      throw InputError("duplicate line id: " + ln.fid);
    }
    if (ln.pts.size() < 2) {
      throw InputError("line " + ln.fid + " has " + std::to_string(ln.pts.size()) +
                       " coordinate(s); at least 2 are required");
    }
    for (const auto &p : ln.pts) {
      if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
        throw InputError("line " + ln.fid + " has a non-finite coordinate");
      }
    }
  }
}

bool fid_less(const std::string &a, const std::string &b) {
  const bool ia = is_integer_text(a);
  const bool ib = is_integer_text(b);
  if (ia && ib) {
    return integer_text_less(a, b);
  }
  if (ia != ib) {
    return ia;  // numeric ids first
  }
  return a < b;
}

void sort_by_fid(std::vector<LineFeature> &lines) {
  std::stable_sort(lines.begin(), lines.end(),
                   [](const LineFeature &a, const LineFeature &b) { return fid_less(a.fid, b.fid); });
}

} // namespace gapfill
