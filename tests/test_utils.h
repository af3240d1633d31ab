#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "reqnav/collection.h"
#include "reqnav/history.h"
#include "reqnav/navigator.h"

// Collection "API" (c-api) holding folder "Users" (f-users) with
// "List Users" GET (r-list) and "Create User" POST (r-create), plus root-level
// request "Health" GET (r-health) and socket "Events" (s-events).
reqnav::CollectionHandle make_sample_collection();

reqnav::RequestHandle make_request(const std::string& id,
                                   const std::string& name,
                                   const std::string& method);

reqnav::HistoryEntry make_history_entry(const std::string& id,
                                        const std::string& method,
                                        const std::string& url,
                                        int status,
                                        int64_t epoch_seconds);

// Focused navigator sized `width` x `height`.
void prepare_navigator(reqnav::Navigator& navigator, int width = 60, int height = 24);

reqnav::KeyPress char_key(char ch);
reqnav::KeyPress code_key(reqnav::KeyCode code);
void press_keys(reqnav::Navigator& navigator, const std::string& chars);

std::vector<std::string> display_names(const reqnav::Navigator& navigator);
std::string join_names(const std::vector<std::string>& names);

// Store whose queries always fail or throw, for stale-data tests.
class FailingHistoryStore : public reqnav::HistoryStore {
 public:
  explicit FailingHistoryStore(bool throw_exception) : throw_exception_(throw_exception) {}

  reqnav::HistoryResult list(const reqnav::QueryOptions& options,
                             reqnav::QueryDeadline deadline) override;
  reqnav::HistoryResult search(const std::string& text,
                               const reqnav::QueryOptions& options,
                               reqnav::QueryDeadline deadline) override;

  int calls = 0;

 private:
  bool throw_exception_;
};
