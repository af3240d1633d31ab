#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reqnav {

/// One past request/response exchange as reported by a history store.
/// Read-only for the navigator.
struct HistoryEntry {
  std::string id;
  std::string request_method;
  std::string request_url;
  int response_status = 0;
  std::chrono::system_clock::time_point timestamp{};
  std::string request_name;
  int64_t response_time_ms = 0;
};

enum class HistorySortField {
  Timestamp,
  ResponseTime,
  Status,
};

enum class SortDirection {
  Ascending,
  Descending,
};

/// Inclusive status code range, e.g. [400, 499] for "4xx".
struct StatusRange {
  int min = 0;
  int max = 0;
};

/// Query parameters passed through to the store.
/// `limit == 0` means unlimited.
struct QueryOptions {
  size_t limit = 0;
  HistorySortField sort_by = HistorySortField::Timestamp;
  SortDirection sort_direction = SortDirection::Descending;
  std::optional<std::string> method;
  std::optional<StatusRange> status;
  std::optional<std::string> search;
};

/// Entries plus an error signal. When `error_message` is set the entries
/// MUST be treated as unusable.
struct HistoryResult {
  std::vector<HistoryEntry> entries;
  std::optional<std::string> error_message;

  bool ok() const { return !error_message.has_value(); }
};

/// Absolute point after which a store call is considered timed out.
using QueryDeadline = std::chrono::steady_clock::time_point;

/// Queryable request log. Only the two read operations the navigator needs.
/// Implementations MUST honour `deadline` and report an error instead of
/// blocking past it.
class HistoryStore {
 public:
  virtual ~HistoryStore() = default;

  virtual HistoryResult list(const QueryOptions& options, QueryDeadline deadline) = 0;
  virtual HistoryResult search(const std::string& text,
                               const QueryOptions& options,
                               QueryDeadline deadline) = 0;
};

/// In-memory store used by the CLI front end and the tests.
/// Search is a case-insensitive substring match over method, URL, request
/// name, and status code.
class MemoryHistoryStore : public HistoryStore {
 public:
  /// Appends an entry; an empty id is replaced with a generated one.
  /// Returns the id actually stored.
  std::string add(HistoryEntry entry);
  void clear();
  size_t size() const { return entries_.size(); }

  HistoryResult list(const QueryOptions& options, QueryDeadline deadline) override;
  HistoryResult search(const std::string& text,
                       const QueryOptions& options,
                       QueryDeadline deadline) override;

 private:
  HistoryResult run_query(const std::string* text,
                          const QueryOptions& options,
                          QueryDeadline deadline) const;

  std::vector<HistoryEntry> entries_;
};

}  // namespace reqnav
