#pragma once

#include <ostream>
#include <string>

namespace reqnav::cli {

/// Parsed command line. Defaults match an interactive session over empty data.
struct CliOptions {
  std::string collections_path;
  std::string history_path;
  std::string mode = "collections";
  int timeout_ms = 5000;
  int history_limit = 100;
  bool print = false;
  std::string keys;
  bool keys_set = false;
  int width = 60;
  int height = 24;
  bool show_help = false;
  bool show_version = false;
};

/// Prints usage, flags, and key bindings.
void print_help(std::ostream& os);

/// Parses argv into typed options.
/// MUST return false with a one-line `error` for unknown flags, missing or
/// non-numeric values, non-positive limits, and an invalid --mode.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace reqnav::cli
