#include "reqnav/json_io.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace reqnav {

namespace {

using json = nlohmann::json;

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

json parse_document(const std::string& text, const char* what) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    throw std::runtime_error(std::string("Invalid JSON in ") + what);
  }
  return doc;
}

// Returns the array stored under `key`, or the document itself when it is a
// bare array.
const json& top_level_array(const json& doc, const char* key) {
  if (doc.is_array()) return doc;
  if (doc.is_object() && doc.contains(key) && doc[key].is_array()) return doc[key];
  throw std::runtime_error(std::string("Expected an array or an object with '") + key +
                           "' array");
}

std::string required_string(const json& node, const char* field, const std::string& where) {
  if (!node.contains(field) || !node[field].is_string()) {
    throw std::runtime_error("Field '" + std::string(field) + "' is required and must be a string (" +
                             where + ")");
  }
  return node[field].get<std::string>();
}

std::string optional_string(const json& node, const char* field, const std::string& where) {
  if (!node.contains(field) || node[field].is_null()) return {};
  if (!node[field].is_string()) {
    throw std::runtime_error("Field '" + std::string(field) + "' must be a string (" + where +
                             ")");
  }
  return node[field].get<std::string>();
}

const json* optional_array(const json& node, const char* field, const std::string& where) {
  if (!node.contains(field) || node[field].is_null()) return nullptr;
  if (!node[field].is_array()) {
    throw std::runtime_error("Field '" + std::string(field) + "' must be an array (" + where +
                             ")");
  }
  return &node[field];
}

std::string node_id(const json& node, const std::string& where) {
  std::string id = optional_string(node, "id", where);
  return id.empty() ? generate_node_id() : id;
}

void load_children(const json& node, Folder& parent, const std::string& where);

std::unique_ptr<Folder> load_folder(const json& node, const std::string& where) {
  if (!node.is_object()) {
    throw std::runtime_error("Folder must be a JSON object (" + where + ")");
  }
  const std::string name = required_string(node, "name", where);
  auto folder = std::make_unique<Folder>(node_id(node, where), name);
  load_children(node, *folder, where + "/" + name);
  return folder;
}

void load_children(const json& node, Folder& parent, const std::string& where) {
  if (const json* folders = optional_array(node, "folders", where)) {
    for (const auto& child : *folders) {
      parent.add_folder(load_folder(child, where));
    }
  }
  if (const json* requests = optional_array(node, "requests", where)) {
    for (const auto& child : *requests) {
      if (!child.is_object()) {
        throw std::runtime_error("Request must be a JSON object (" + where + ")");
      }
      std::string method = required_string(child, "method", where);
      parent.add_request(std::make_shared<RequestDefinition>(
          node_id(child, where), required_string(child, "name", where), std::move(method),
          optional_string(child, "url", where)));
    }
  }
  if (const json* sockets = optional_array(node, "sockets", where)) {
    for (const auto& child : *sockets) {
      if (!child.is_object()) {
        throw std::runtime_error("Socket must be a JSON object (" + where + ")");
      }
      parent.add_socket(std::make_shared<SocketDefinition>(
          node_id(child, where), required_string(child, "name", where),
          optional_string(child, "endpoint", where)));
    }
  }
}

int64_t required_integer(const json& node, const char* field, const std::string& where) {
  if (!node.contains(field) || !node[field].is_number_integer()) {
    throw std::runtime_error("Field '" + std::string(field) +
                             "' is required and must be an integer (" + where + ")");
  }
  return node[field].get<int64_t>();
}

}  // namespace

std::vector<CollectionHandle> load_collections_json(const std::string& text) {
  const json doc = parse_document(text, "collections");
  const json& roots = top_level_array(doc, "collections");
  std::vector<CollectionHandle> out;
  out.reserve(roots.size());
  for (size_t i = 0; i < roots.size(); ++i) {
    const json& node = roots[i];
    const std::string where = "collections[" + std::to_string(i) + "]";
    if (!node.is_object()) {
      throw std::runtime_error("Collection must be a JSON object (" + where + ")");
    }
    const std::string name = required_string(node, "name", where);
    auto collection = std::make_shared<Collection>(node_id(node, where), name);
    load_children(node, *collection, name);
    out.push_back(std::move(collection));
  }
  return out;
}

std::vector<CollectionHandle> load_collections_file(const std::string& path) {
  return load_collections_json(read_text_file(path));
}

std::vector<HistoryEntry> load_history_json(const std::string& text) {
  const json doc = parse_document(text, "history");
  const json& rows = top_level_array(doc, "entries");
  std::vector<HistoryEntry> out;
  out.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    const json& node = rows[i];
    const std::string where = "entries[" + std::to_string(i) + "]";
    if (!node.is_object()) {
      throw std::runtime_error("History entry must be a JSON object (" + where + ")");
    }
    HistoryEntry entry;
    entry.id = optional_string(node, "id", where);
    entry.request_method = required_string(node, "method", where);
    entry.request_url = required_string(node, "url", where);
    entry.response_status = static_cast<int>(required_integer(node, "status", where));
    entry.timestamp = std::chrono::system_clock::time_point(
        std::chrono::seconds(required_integer(node, "timestamp", where)));
    entry.request_name = optional_string(node, "name", where);
    if (node.contains("response_time_ms") && node["response_time_ms"].is_number_integer()) {
      entry.response_time_ms = node["response_time_ms"].get<int64_t>();
    }
    out.push_back(std::move(entry));
  }
  return out;
}

std::vector<HistoryEntry> load_history_file(const std::string& path) {
  return load_history_json(read_text_file(path));
}

}  // namespace reqnav
