#pragma once

#include <string>
#include <vector>

#include "reqnav/collection.h"
#include "reqnav/history.h"

namespace reqnav {

/// Parses a collection tree from JSON text.
/// Accepts {"collections": [...]} or a bare array. Nodes without an "id"
/// receive a generated one.
/// MUST throw std::runtime_error naming the offending field on malformed input.
std::vector<CollectionHandle> load_collections_json(const std::string& text);
std::vector<CollectionHandle> load_collections_file(const std::string& path);

/// Parses history entries from JSON text ({"entries": [...]} or a bare array).
/// "timestamp" is seconds since the Unix epoch.
/// MUST throw std::runtime_error on malformed input.
std::vector<HistoryEntry> load_history_json(const std::string& text);
std::vector<HistoryEntry> load_history_file(const std::string& path);

}  // namespace reqnav
