#include <chrono>
#include <exception>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "src/gap_closer.h"
#include "src/geojson_io.h"
#include "src/run_options.h"

static void print_options(const gapfill::RunOptions &opts) {
  std::cout << "Running with the following options:\n"
            << " - File path: " << opts.input_path << ",\n"
            << " - Acceptable angle: " << opts.angle_threshold << "\n"
            << " - Output path: " << opts.output_path << "\n";
  if (opts.max_rounds > 0) {
    std::cout << " - Max rounds: " << opts.max_rounds << "\n";
  }
}

static void print_round(const gapfill::RoundReport &r) {
  std::cout << "Round " << r.round << ": " << r.accepted << " artificial lines from " << r.groups
            << " groups (rejected angle=" << r.rejected_angle << " connector=" << r.rejected_connector_angle
            << " self=" << r.rejected_self_loop << " degenerate=" << r.rejected_degenerate
            << "), open ends " << r.no_successor_left << "/" << r.no_predecessor_left << "\n";
}

int main(int argc, char **argv) {
  const std::string program = argc > 0 ? argv[0] : "gapfill";
  gapfill::RunOptions opts;
  try {
    opts = gapfill::parse_run_options(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const gapfill::UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n" << gapfill::usage_text(program);
    return 2;
  }
  if (opts.show_help) {
    std::cout << gapfill::usage_text(program);
    return 0;
  }
  if (!opts.quiet) {
    print_options(opts);
  }

  const auto start = std::chrono::steady_clock::now();
  try {
    auto lines = gapfill::load_line_layer(opts.input_path);

    auto config = gapfill::to_config(opts);
    if (!opts.quiet) {
      config.on_round = print_round;
    }
    const auto result = gapfill::close_gaps(lines, config);

    auto artificial = gapfill::make_connector_features(lines, result.connectors, opts.fields);
    if (!opts.quiet) {
      std::cout << artificial.size() << " artificial lines after " << result.rounds.size() << " rounds ("
                << gapfill::stop_reason_name(result.stop_reason) << ")\n";
    }
    lines.insert(lines.end(), std::make_move_iterator(artificial.begin()), std::make_move_iterator(artificial.end()));
    gapfill::save_line_layer(opts.output_path, lines);
  } catch (const gapfill::InputError &e) {
    std::cerr << "Invalid input: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  if (!opts.quiet) {
    std::cout << "Finished.\n"
              << "Total time elapsed: " << elapsed.count() << " Seconds." << std::endl;
  }
  return 0;
}
