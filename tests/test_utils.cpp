#include "test_utils.h"

#include <memory>
#include <stdexcept>

using namespace reqnav;

CollectionHandle make_sample_collection() {
  auto collection = std::make_shared<Collection>("c-api", "API");
  auto users = std::make_unique<Folder>("f-users", "Users");
  users->add_request(make_request("r-list", "List Users", "GET"));
  users->add_request(make_request("r-create", "Create User", "POST"));
  collection->add_folder(std::move(users));
  collection->add_request(make_request("r-health", "Health", "GET"));
  collection->add_socket(
      std::make_shared<SocketDefinition>("s-events", "Events", "wss://example.test/events"));
  return collection;
}

RequestHandle make_request(const std::string& id,
                           const std::string& name,
                           const std::string& method) {
  return std::make_shared<RequestDefinition>(id, name, method,
                                             "https://example.test/" + id);
}

HistoryEntry make_history_entry(const std::string& id,
                                const std::string& method,
                                const std::string& url,
                                int status,
                                int64_t epoch_seconds) {
  HistoryEntry entry;
  entry.id = id;
  entry.request_method = method;
  entry.request_url = url;
  entry.response_status = status;
  entry.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
  return entry;
}

void prepare_navigator(Navigator& navigator, int width, int height) {
  navigator.update(ResizeEvent{width, height});
  navigator.update(FocusGained{});
}

KeyPress char_key(char ch) {
  if (ch == ' ') return KeyPress{KeyCode::Space, 0};
  return KeyPress{KeyCode::Character, ch};
}

KeyPress code_key(KeyCode code) {
  return KeyPress{code, 0};
}

void press_keys(Navigator& navigator, const std::string& chars) {
  for (char ch : chars) navigator.update(char_key(ch));
}

std::vector<std::string> display_names(const Navigator& navigator) {
  std::vector<std::string> out;
  for (const auto& item : navigator.display_items()) out.push_back(item.name);
  return out;
}

std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += "|";
    out += names[i];
  }
  return out;
}

HistoryResult FailingHistoryStore::list(const QueryOptions&, QueryDeadline) {
  ++calls;
  if (throw_exception_) throw std::runtime_error("database is locked");
  HistoryResult result;
  result.error_message = "store unavailable";
  return result;
}

HistoryResult FailingHistoryStore::search(const std::string&,
                                          const QueryOptions& options,
                                          QueryDeadline deadline) {
  return list(options, deadline);
}
