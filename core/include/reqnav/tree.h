#pragma once

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "reqnav/collection.h"

namespace reqnav {

enum class TreeItemKind {
  Collection,
  Folder,
  Request,
  Socket,
};

/// Back reference from a display row to the domain node it projects.
/// Container pointers stay valid while the collection set that produced the
/// row is alive; rows are rebuilt whenever that set changes.
using TreeNodeRef =
    std::variant<const Collection*, const Folder*, RequestHandle, SocketHandle>;

/// One visible row of the collections panel.
/// MUST be rebuilt rather than edited when data or expansion state changes.
struct TreeItem {
  std::string id;
  std::string name;
  TreeItemKind kind = TreeItemKind::Collection;
  int level = 0;
  bool expandable = false;
  bool expanded = false;
  std::string method;
  TreeNodeRef node;

  const Collection* collection() const;
  const Folder* folder() const;
  RequestHandle request() const;
  SocketHandle socket() const;
};

/// Open/closed flags keyed by stable node ID. Absent means collapsed.
class ExpansionState {
 public:
  bool is_expanded(const std::string& id) const;
  void set_expanded(const std::string& id, bool expanded);
  /// Flips the flag and returns the new value.
  bool toggle(const std::string& id);
  void clear() { expanded_.clear(); }
  size_t size() const { return expanded_.size(); }

 private:
  std::unordered_map<std::string, bool> expanded_;
};

/// Flattens the collection forest into display rows.
/// MUST emit depth-first preorder (folders, then requests, then sockets under
/// each container) and MUST NOT descend into nodes that are not expanded.
std::vector<TreeItem> flatten_collection_tree(const std::vector<CollectionHandle>& roots,
                                              const ExpansionState& expansion);

/// Keeps rows whose name (or method, for requests) contains `query`,
/// ignoring ASCII case.
/// MUST preserve input order and MUST NOT add ancestors of matched rows, so a
/// nested match shows without its folder or collection.
std::vector<TreeItem> filter_tree_items(const std::vector<TreeItem>& items,
                                        const std::string& query);

}  // namespace reqnav
