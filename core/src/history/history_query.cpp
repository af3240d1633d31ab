#include "reqnav/history_query.h"

#include <array>
#include <exception>

namespace reqnav {

namespace {

constexpr std::array<const char*, 8> kMethodCycle = {
    "", "GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS",
};

constexpr std::array<const char*, 5> kStatusCycle = {
    "", "2xx", "3xx", "4xx", "5xx",
};

template <size_t N>
std::string next_in_cycle(const std::array<const char*, N>& cycle, const std::string& current) {
  for (size_t i = 0; i < cycle.size(); ++i) {
    if (current == cycle[i]) return cycle[(i + 1) % cycle.size()];
  }
  return cycle[0];
}

}  // namespace

std::string next_method_filter(const std::string& current) {
  return next_in_cycle(kMethodCycle, current);
}

std::string next_status_filter(const std::string& current) {
  return next_in_cycle(kStatusCycle, current);
}

std::optional<StatusRange> status_range_for_class(const std::string& status_class) {
  if (status_class.size() != 3) return std::nullopt;
  if (status_class[1] != 'x' || status_class[2] != 'x') return std::nullopt;
  char digit = status_class[0];
  if (digit < '1' || digit > '5') return std::nullopt;
  int base = (digit - '0') * 100;
  return StatusRange{base, base + 99};
}

QueryOptions build_history_query_options(const HistoryFilters& filters, size_t limit) {
  QueryOptions options;
  options.limit = limit;
  options.sort_by = HistorySortField::Timestamp;
  options.sort_direction = SortDirection::Descending;
  if (!filters.method.empty()) options.method = filters.method;
  options.status = status_range_for_class(filters.status_class);
  if (!filters.search.empty()) options.search = filters.search;
  return options;
}

HistoryResult run_history_query(HistoryStore& store,
                                const QueryOptions& options,
                                std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) timeout = kDefaultHistoryQueryTimeout;
  const QueryDeadline deadline = std::chrono::steady_clock::now() + timeout;

  HistoryResult result;
  try {
    if (options.search.has_value() && !options.search->empty()) {
      result = store.search(*options.search, options, deadline);
    } else {
      result = store.list(options, deadline);
    }
  } catch (const std::exception& ex) {
    result.entries.clear();
    result.error_message = std::string("history store failure: ") + ex.what();
    return result;
  }

  if (result.ok() && std::chrono::steady_clock::now() > deadline) {
    result.entries.clear();
    result.error_message = "history query timed out after " +
                           std::to_string(timeout.count()) + "ms";
  }
  return result;
}

}  // namespace reqnav
