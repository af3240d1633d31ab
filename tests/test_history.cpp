#include "test_harness.h"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "reqnav/history.h"
#include "reqnav/history_query.h"
#include "test_utils.h"

using namespace reqnav;

namespace {

QueryDeadline far_deadline() {
  return std::chrono::steady_clock::now() + std::chrono::seconds(5);
}

MemoryHistoryStore make_store() {
  MemoryHistoryStore store;
  store.add(make_history_entry("h1", "GET", "https://api.test/users", 200, 1000));
  store.add(make_history_entry("h2", "POST", "https://api.test/users", 201, 3000));
  store.add(make_history_entry("h3", "GET", "https://api.test/orders", 404, 2000));
  store.add(make_history_entry("h4", "DELETE", "https://api.test/users/7", 500, 4000));
  return store;
}

// Sleeps past the deadline before answering.
class SlowHistoryStore : public HistoryStore {
 public:
  HistoryResult list(const QueryOptions&, QueryDeadline) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    HistoryResult result;
    result.entries.push_back(make_history_entry("late", "GET", "https://late.test", 200, 1));
    return result;
  }
  HistoryResult search(const std::string&, const QueryOptions& options,
                       QueryDeadline deadline) override {
    return list(options, deadline);
  }
};

void test_memory_store_sorts_newest_first_with_limit() {
  MemoryHistoryStore store = make_store();
  QueryOptions options;
  options.limit = 3;
  HistoryResult result = store.list(options, far_deadline());
  expect_true(result.ok(), "list succeeds");
  expect_eq(result.entries.size(), 3, "limit applied");
  expect_true(result.entries[0].id == "h4" && result.entries[2].id == "h3",
              "descending timestamp order");

  options.limit = 0;
  options.sort_direction = SortDirection::Ascending;
  result = store.list(options, far_deadline());
  expect_eq(result.entries.size(), 4, "zero limit means unlimited");
  expect_true(result.entries[0].id == "h1", "ascending starts with oldest");
}

void test_memory_store_method_status_and_search() {
  MemoryHistoryStore store = make_store();
  QueryOptions options;
  options.method = std::string("get");
  HistoryResult result = store.list(options, far_deadline());
  expect_eq(result.entries.size(), 2, "method filter ignores case");

  options.method.reset();
  options.status = StatusRange{400, 599};
  result = store.list(options, far_deadline());
  expect_eq(result.entries.size(), 2, "status range is inclusive");

  options.status.reset();
  result = store.search("ORDERS", options, far_deadline());
  expect_eq(result.entries.size(), 1, "search matches url case-insensitively");
  result = store.search("201", options, far_deadline());
  expect_true(result.entries.size() == 1 && result.entries[0].id == "h2", "search matches status");
}

void test_memory_store_rejects_expired_deadline() {
  MemoryHistoryStore store = make_store();
  HistoryResult result =
      store.list(QueryOptions{}, std::chrono::steady_clock::now() - std::chrono::seconds(1));
  expect_true(!result.ok(), "expired deadline reported as error");
  expect_eq(result.entries.size(), 0, "no entries with an error");
}

void test_memory_store_generates_missing_ids() {
  MemoryHistoryStore store;
  std::string id = store.add(make_history_entry("", "GET", "https://a.test", 200, 1));
  expect_true(!id.empty(), "id generated for empty id");
  expect_eq(store.size(), 1, "entry stored");
}

void test_filter_cycles_wrap_and_reset() {
  std::string method;
  std::vector<std::string> seen;
  for (int i = 0; i < 8; ++i) {
    method = next_method_filter(method);
    seen.push_back(method);
  }
  expect_true(join_names(seen) == "GET|POST|PUT|PATCH|DELETE|HEAD|OPTIONS|",
              "method cycle order: " + join_names(seen));
  expect_true(next_method_filter("TRACE").empty(), "unknown method resets the cycle");

  expect_true(next_status_filter("") == "2xx", "status cycle starts at 2xx");
  expect_true(next_status_filter("5xx").empty(), "status cycle wraps to none");
  expect_true(next_status_filter("9xx").empty(), "unknown status resets the cycle");
}

void test_status_range_for_class() {
  auto range = status_range_for_class("4xx");
  expect_true(range.has_value() && range->min == 400 && range->max == 499, "4xx maps to 400-499");
  expect_true(!status_range_for_class("").has_value(), "empty class has no range");
  expect_true(!status_range_for_class("6xx").has_value(), "out of range class rejected");
  expect_true(!status_range_for_class("4x").has_value(), "malformed class rejected");
}

void test_build_query_options_from_filters() {
  HistoryFilters filters;
  filters.method = "POST";
  filters.status_class = "2xx";
  QueryOptions options = build_history_query_options(filters, 50);
  expect_eq(options.limit, 50, "limit passed through");
  expect_true(options.sort_by == HistorySortField::Timestamp, "sorted by timestamp");
  expect_true(options.sort_direction == SortDirection::Descending, "newest first");
  expect_true(options.method && *options.method == "POST", "method filter set");
  expect_true(options.status && options.status->min == 200, "status range set");
  expect_true(!options.search.has_value(), "no search term when empty");
}

void test_run_query_uses_search_only_with_term() {
  MemoryHistoryStore store = make_store();
  HistoryFilters filters;
  filters.search = "orders";
  HistoryResult result = run_history_query(store, build_history_query_options(filters, 100));
  expect_eq(result.entries.size(), 1, "search path taken with a term");

  filters.search.clear();
  result = run_history_query(store, build_history_query_options(filters, 100));
  expect_eq(result.entries.size(), 4, "list path taken without a term");
}

void test_run_query_reports_store_exception() {
  FailingHistoryStore store(true);
  HistoryResult result = run_history_query(store, QueryOptions{});
  expect_true(!result.ok(), "exception converted to error");
  expect_true(result.error_message->find("database is locked") != std::string::npos,
              "error message keeps store text");
}

void test_run_query_times_out_late_store() {
  SlowHistoryStore store;
  HistoryResult result =
      run_history_query(store, QueryOptions{}, std::chrono::milliseconds(5));
  expect_true(!result.ok(), "late answer treated as timeout");
  expect_eq(result.entries.size(), 0, "late entries discarded");
  expect_true(result.error_message->find("timed out") != std::string::npos,
              "timeout error message");
}

}  // namespace

void register_history_tests(std::vector<TestCase>& tests) {
  tests.push_back({"memory_store_sorts_newest_first_with_limit",
                   test_memory_store_sorts_newest_first_with_limit});
  tests.push_back({"memory_store_method_status_and_search",
                   test_memory_store_method_status_and_search});
  tests.push_back({"memory_store_rejects_expired_deadline",
                   test_memory_store_rejects_expired_deadline});
  tests.push_back({"memory_store_generates_missing_ids", test_memory_store_generates_missing_ids});
  tests.push_back({"filter_cycles_wrap_and_reset", test_filter_cycles_wrap_and_reset});
  tests.push_back({"status_range_for_class", test_status_range_for_class});
  tests.push_back({"build_query_options_from_filters", test_build_query_options_from_filters});
  tests.push_back({"run_query_uses_search_only_with_term",
                   test_run_query_uses_search_only_with_term});
  tests.push_back({"run_query_reports_store_exception", test_run_query_reports_store_exception});
  tests.push_back({"run_query_times_out_late_store", test_run_query_times_out_late_store});
}
