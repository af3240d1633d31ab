#include "reqnav/history.h"

#include <algorithm>

#include "reqnav/collection.h"
#include "util/string_util.h"

namespace reqnav {

namespace {

bool matches_filters(const HistoryEntry& entry, const QueryOptions& options) {
  if (options.method.has_value() && !options.method->empty() &&
      util::to_upper(entry.request_method) != util::to_upper(*options.method)) {
    return false;
  }
  if (options.status.has_value()) {
    if (entry.response_status < options.status->min ||
        entry.response_status > options.status->max) {
      return false;
    }
  }
  return true;
}

bool matches_text(const HistoryEntry& entry, const std::string& needle_lower) {
  return util::contains_lowered(entry.request_url, needle_lower) ||
         util::contains_lowered(entry.request_method, needle_lower) ||
         util::contains_lowered(entry.request_name, needle_lower) ||
         util::contains_lowered(std::to_string(entry.response_status), needle_lower);
}

bool sort_key_less(const HistoryEntry& left, const HistoryEntry& right, HistorySortField field) {
  switch (field) {
    case HistorySortField::Timestamp:
      return left.timestamp < right.timestamp;
    case HistorySortField::ResponseTime:
      return left.response_time_ms < right.response_time_ms;
    case HistorySortField::Status:
      return left.response_status < right.response_status;
  }
  return false;
}

}  // namespace

std::string MemoryHistoryStore::add(HistoryEntry entry) {
  if (entry.id.empty()) entry.id = generate_node_id();
  entries_.push_back(std::move(entry));
  return entries_.back().id;
}

void MemoryHistoryStore::clear() {
  entries_.clear();
}

HistoryResult MemoryHistoryStore::list(const QueryOptions& options, QueryDeadline deadline) {
  return run_query(nullptr, options, deadline);
}

HistoryResult MemoryHistoryStore::search(const std::string& text,
                                         const QueryOptions& options,
                                         QueryDeadline deadline) {
  return run_query(&text, options, deadline);
}

HistoryResult MemoryHistoryStore::run_query(const std::string* text,
                                            const QueryOptions& options,
                                            QueryDeadline deadline) const {
  HistoryResult result;
  if (std::chrono::steady_clock::now() > deadline) {
    result.error_message = "history query deadline exceeded";
    return result;
  }

  const std::string needle = text ? util::to_lower(*text) : std::string();
  std::vector<HistoryEntry> matched;
  matched.reserve(entries_.size());
  for (const auto& entry : entries_) {
    if (!matches_filters(entry, options)) continue;
    if (text && !matches_text(entry, needle)) continue;
    matched.push_back(entry);
  }

  // Stable so equal keys keep insertion order in either direction.
  const HistorySortField field = options.sort_by;
  if (options.sort_direction == SortDirection::Ascending) {
    std::stable_sort(matched.begin(), matched.end(),
                     [field](const HistoryEntry& left, const HistoryEntry& right) {
                       return sort_key_less(left, right, field);
                     });
  } else {
    std::stable_sort(matched.begin(), matched.end(),
                     [field](const HistoryEntry& left, const HistoryEntry& right) {
                       return sort_key_less(right, left, field);
                     });
  }

  if (options.limit > 0 && matched.size() > options.limit) {
    matched.resize(options.limit);
  }
  result.entries = std::move(matched);
  return result;
}

}  // namespace reqnav
