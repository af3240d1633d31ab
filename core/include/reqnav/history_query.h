#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "reqnav/history.h"

namespace reqnav {

constexpr std::chrono::milliseconds kDefaultHistoryQueryTimeout{5000};
constexpr size_t kDefaultHistoryLimit = 100;

/// User-facing history filters as shown in the sidebar header.
/// Empty strings mean "no filter".
struct HistoryFilters {
  std::string method;
  std::string status_class;
  std::string search;
};

/// Returns the method filter that follows `current` in the fixed cycle
/// "" → GET → POST → PUT → PATCH → DELETE → HEAD → OPTIONS → "".
/// MUST restart the cycle at "" for unknown values.
std::string next_method_filter(const std::string& current);
/// Returns the status filter that follows `current` in "" → 2xx → 3xx → 4xx → 5xx → "".
/// MUST restart the cycle at "" for unknown values.
std::string next_status_filter(const std::string& current);
/// Maps a status class such as "4xx" to its inclusive range [400, 499].
/// MUST return nullopt for empty or malformed classes.
std::optional<StatusRange> status_range_for_class(const std::string& status_class);

/// Builds store options: newest first by timestamp, `limit` results, the
/// active method/status filters, and the free-text term when non-empty.
QueryOptions build_history_query_options(const HistoryFilters& filters, size_t limit);

/// Runs one bounded store call. Calls `search` when `options.search` holds a
/// non-empty term, `list` otherwise.
/// MUST NOT throw: store exceptions and calls that return after the deadline
/// are reported through `HistoryResult::error_message`.
HistoryResult run_history_query(HistoryStore& store,
                                const QueryOptions& options,
                                std::chrono::milliseconds timeout = kDefaultHistoryQueryTimeout);

}  // namespace reqnav
