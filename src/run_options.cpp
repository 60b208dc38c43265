#include "run_options.h"

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace gapfill {

namespace {

int parse_int(const std::string &flag, const std::string &text) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(text, &used);
  } catch (const std::invalid_argument &) {
    throw UsageError(flag + " expects an integer, got '" + text + "'");
  } catch (const std::out_of_range &) {
    throw UsageError(flag + " is out of range: '" + text + "'");
  }
  if (used != text.size()) {
    throw UsageError(flag + " expects an integer, got '" + text + "'");
  }
  return v;
}

} // namespace

int read_env_int(const char *key, int defv) {
  const char *v = std::getenv(key);
  if (!v) {
    return defv;
  }
  try {
    return parse_int(key, v);
  } catch (const UsageError &e) {
    std::cerr << "Ignoring " << key << ": " << e.what() << std::endl;
    return defv;
  }
}

std::string read_env_string(const char *key, const std::string &defv) {
  const char *v = std::getenv(key);
  if (!v || *v == '\0') {
    return defv;
  }
  return std::string(v);
}

RunOptions parse_run_options(const std::vector<std::string> &args) {
  RunOptions opts;
  opts.max_rounds = read_env_int("GAPFILL_MAX_ROUNDS", opts.max_rounds);
  opts.fields.name_field = read_env_string("GAPFILL_NAME_FIELD", opts.fields.name_field);
  opts.fields.length_field = read_env_string("GAPFILL_LENGTH_FIELD", opts.fields.length_field);

  for (std::size_t i = 0; i < args.size(); i++) {
    const std::string &a = args[i];
    const auto next = [&]() -> const std::string & {
      if (i + 1 >= args.size()) {
        throw UsageError(a + " requires a value");
      }
      return args[++i];
    };

    if (a == "--p" || a == "--PATH") {
      opts.input_path = next();
    } else if (a == "--d" || a == "--DEGREE") {
      opts.angle_threshold = parse_int(a, next());
    } else if (a == "--o" || a == "--OUTPUT") {
      opts.output_path = next();
    } else if (a == "--max-rounds") {
      opts.max_rounds = parse_int(a, next());
    } else if (a == "--quiet" || a == "-q") {
      opts.quiet = true;
    } else if (a == "--help" || a == "-h") {
      opts.show_help = true;
    } else {
      throw UsageError("unknown argument: " + a);
    }
  }

  if (opts.angle_threshold <= 0) {
    throw UsageError("--d must be > 0, got " + std::to_string(opts.angle_threshold));
  }
  if (opts.max_rounds < 0) {
    throw UsageError("--max-rounds must be >= 0, got " + std::to_string(opts.max_rounds));
  }
  return opts;
}

std::string usage_text(const std::string &program) {
  std::ostringstream os;
  os << "Usage: " << program << " [--p PATH] [--d DEGREE] [--o OUTPUT] [--max-rounds N] [--quiet]\n"
     << "  --p, --PATH     GeoJSON line layer to repair. Default: Meetvak/Meetvakken_WGS84.geojson\n"
     << "  --d, --DEGREE   Acceptable angle (degrees) between an artificial line and the lines it joins. Default: 5\n"
     << "  --o, --OUTPUT   Where the repaired layer is written. Default: filtered_lines.geojson\n"
     << "  --max-rounds    Stop after N rounds (0 = until convergence). Env: GAPFILL_MAX_ROUNDS\n"
     << "  --quiet, -q     Only print errors\n"
     << "Env GAPFILL_NAME_FIELD / GAPFILL_LENGTH_FIELD rename the artificial line name/length fields.\n";
  return os.str();
}

GapCloserConfig to_config(const RunOptions &opts) {
  GapCloserConfig cfg;
  cfg.angle_threshold = static_cast<double>(opts.angle_threshold);
  cfg.max_rounds = opts.max_rounds;
  return cfg;
}

} // namespace gapfill
