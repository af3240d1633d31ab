#pragma once

#include <ostream>
#include <string>

#include "cli_args.h"
#include "reqnav/history.h"
#include "reqnav/navigator.h"

namespace reqnav::cli {

/// Loads collections and history named by `options` into the navigator and
/// applies mode, limit, and timeout settings.
/// MUST report IO/JSON failures to `err` as "Error: ..." and return false.
bool load_sidebar_data(const CliOptions& options,
                       Navigator& navigator,
                       MemoryHistoryStore& store,
                       std::ostream& err);

/// One-line status text for an effect returned by Navigator::update.
std::string describe_effect(const NavigatorEffect& effect);

/// Renders once (after replaying --keys) to `out`.
/// MUST return 0 on success, 2 on load or --keys errors.
int run_sidebar_print(const CliOptions& options, std::ostream& out, std::ostream& err);

/// Runs the interactive sidebar in raw terminal mode until q or Ctrl-C.
/// MUST return 0 on normal exit and non-zero on usage/IO/runtime errors.
int run_sidebar_explorer(const CliOptions& options, std::ostream& err);

}  // namespace reqnav::cli
