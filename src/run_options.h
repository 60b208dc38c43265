#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "gap_closer.h"

namespace gapfill {

struct RunOptions {
  std::string input_path = "Meetvak/Meetvakken_WGS84.geojson";
  int angle_threshold = 5;
  std::string output_path = "filtered_lines.geojson";
  int max_rounds = 0;
  bool quiet = false;
  bool show_help = false;
  ConnectorFields fields;
};

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

// Environment overrides; a malformed value warns on stderr and keeps the default.
int read_env_int(const char *key, int defv);
std::string read_env_string(const char *key, const std::string &defv);

// Defaults, then GAPFILL_* environment variables, then command-line flags.
RunOptions parse_run_options(const std::vector<std::string> &args);

std::string usage_text(const std::string &program);

GapCloserConfig to_config(const RunOptions &opts);

} // namespace gapfill
