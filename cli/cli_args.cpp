#include "cli_args.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

namespace reqnav::cli {

namespace {

// Parses a strictly positive decimal integer that fits in an int.
bool parse_positive_int(const std::string& text, int& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (value <= 0 || value > INT_MAX) return false;
  out = static_cast<int>(value);
  return true;
}

bool take_value(int argc, char** argv, int& i, const std::string& flag, std::string& value,
                std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  value = argv[++i];
  return true;
}

bool take_positive_int(int argc, char** argv, int& i, const std::string& flag, int& out,
                       std::string& error) {
  std::string value;
  if (!take_value(argc, argv, i, flag, value, error)) return false;
  if (!parse_positive_int(value, out)) {
    error = "Invalid " + flag + " value (must be a positive integer): " + value;
    return false;
  }
  return true;
}

}  // namespace

/// Prints the help requested by --help, including the sidebar key bindings.
/// MUST list every supported flag and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to it.
void print_help(std::ostream& os) {
  os << "Usage: reqnav [--collections <file.json>] [--history <file.json>]\n";
  os << "              [--mode collections|history] [--timeout-ms <n>] [--history-limit <n>]\n";
  os << "       reqnav --print [--keys <sequence>] [--width <n>] [--height <n>] ...\n";
  os << "       reqnav --version\n";
  os << "Keys: j/k or Down/Up move, l/h or Right/Left expand/collapse, Enter activate,\n";
  os << "      / search, H toggle history, G/End bottom, gg/Home top, Esc back, q quit.\n";
  os << "History: r refresh, m cycle method filter, s cycle status filter, x clear filters,\n";
  os << "         C back to collections.\n";
  os << "--keys accepts literal characters and names such as <Down>, <Enter>, <Esc>, <BS>,\n";
  os << "<C-u>, <Space>, <Home>, <End>, <Del>, <lt>.\n";
  os << "Exit codes: 0=success, 1=runtime error, 2=CLI/IO usage error.\n";
}

/// Parses argv into typed options so main can pick print or interactive mode.
/// MUST return false for invalid flags and MUST not mutate options on parse failure.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--collections") {
      if (!take_value(argc, argv, i, arg, parsed.collections_path, error)) return false;
    } else if (arg == "--history") {
      if (!take_value(argc, argv, i, arg, parsed.history_path, error)) return false;
    } else if (arg == "--mode") {
      if (!take_value(argc, argv, i, arg, parsed.mode, error)) return false;
      if (parsed.mode != "collections" && parsed.mode != "history") {
        error = "Invalid --mode value (use collections|history)";
        return false;
      }
    } else if (arg == "--timeout-ms") {
      if (!take_positive_int(argc, argv, i, arg, parsed.timeout_ms, error)) return false;
    } else if (arg == "--history-limit") {
      if (!take_positive_int(argc, argv, i, arg, parsed.history_limit, error)) return false;
    } else if (arg == "--print") {
      parsed.print = true;
    } else if (arg == "--keys") {
      if (!take_value(argc, argv, i, arg, parsed.keys, error)) return false;
      parsed.keys_set = true;
    } else if (arg == "--width") {
      if (!take_positive_int(argc, argv, i, arg, parsed.width, error)) return false;
    } else if (arg == "--height") {
      if (!take_positive_int(argc, argv, i, arg, parsed.height, error)) return false;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (parsed.keys_set && !parsed.print) {
    error = "--keys is only supported with --print";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace reqnav::cli
