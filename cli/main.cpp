#include <exception>
#include <iostream>
#include <string>

#include "cli_args.h"
#include "explore/sidebar_explorer.h"
#include "reqnav/version.h"

using namespace reqnav::cli;

/// Entry point that parses CLI options and dispatches to print or interactive mode.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << "Error: " << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "reqnav " << reqnav::version_string() << std::endl;
    return 0;
  }

  try {
    if (options.print) {
      return run_sidebar_print(options, std::cout, std::cerr);
    }
    return run_sidebar_explorer(options, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
