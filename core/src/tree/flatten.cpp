#include "reqnav/tree.h"

#include <utility>

namespace reqnav {

namespace {

struct PendingNode {
  TreeNodeRef ref;
  int level = 0;
};

TreeItem make_container_row(const Folder& node,
                            TreeItemKind kind,
                            TreeNodeRef ref,
                            int level,
                            const ExpansionState& expansion) {
  TreeItem item;
  item.id = node.id();
  item.name = node.name();
  item.kind = kind;
  item.level = level;
  item.expandable = node.has_children();
  item.expanded = expansion.is_expanded(node.id());
  item.node = std::move(ref);
  return item;
}

// Pushes children in reverse so they pop in folders/requests/sockets order.
void push_children(const Folder& node, int level, std::vector<PendingNode>& stack) {
  const auto& sockets = node.sockets();
  for (auto it = sockets.rbegin(); it != sockets.rend(); ++it) {
    stack.push_back({*it, level});
  }
  const auto& requests = node.requests();
  for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
    stack.push_back({*it, level});
  }
  const auto& folders = node.folders();
  for (auto it = folders.rbegin(); it != folders.rend(); ++it) {
    stack.push_back({static_cast<const Folder*>(it->get()), level});
  }
}

}  // namespace

const Collection* TreeItem::collection() const {
  auto* ref = std::get_if<const Collection*>(&node);
  return ref ? *ref : nullptr;
}

const Folder* TreeItem::folder() const {
  auto* ref = std::get_if<const Folder*>(&node);
  return ref ? *ref : nullptr;
}

RequestHandle TreeItem::request() const {
  auto* ref = std::get_if<RequestHandle>(&node);
  return ref ? *ref : nullptr;
}

SocketHandle TreeItem::socket() const {
  auto* ref = std::get_if<SocketHandle>(&node);
  return ref ? *ref : nullptr;
}

bool ExpansionState::is_expanded(const std::string& id) const {
  auto it = expanded_.find(id);
  return it != expanded_.end() && it->second;
}

void ExpansionState::set_expanded(const std::string& id, bool expanded) {
  expanded_[id] = expanded;
}

bool ExpansionState::toggle(const std::string& id) {
  bool next = !is_expanded(id);
  expanded_[id] = next;
  return next;
}

std::vector<TreeItem> flatten_collection_tree(const std::vector<CollectionHandle>& roots,
                                              const ExpansionState& expansion) {
  std::vector<TreeItem> out;
  out.reserve(roots.size() * 2);
  std::vector<PendingNode> stack;
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
    if (!*it) continue;
    stack.push_back({static_cast<const Collection*>(it->get()), 0});
  }

  while (!stack.empty()) {
    PendingNode pending = std::move(stack.back());
    stack.pop_back();

    const Folder* container = nullptr;
    switch (pending.ref.index()) {
      case 0: {
        const Collection* collection = std::get<const Collection*>(pending.ref);
        out.push_back(make_container_row(*collection, TreeItemKind::Collection, collection,
                                         pending.level, expansion));
        container = collection;
        break;
      }
      case 1: {
        const Folder* folder = std::get<const Folder*>(pending.ref);
        out.push_back(make_container_row(*folder, TreeItemKind::Folder, folder, pending.level,
                                         expansion));
        container = folder;
        break;
      }
      case 2: {
        const RequestHandle& request = std::get<RequestHandle>(pending.ref);
        TreeItem item;
        item.id = request->id();
        item.name = request->name();
        item.kind = TreeItemKind::Request;
        item.level = pending.level;
        item.method = request->method();
        item.node = request;
        out.push_back(std::move(item));
        break;
      }
      case 3: {
        const SocketHandle& socket = std::get<SocketHandle>(pending.ref);
        TreeItem item;
        item.id = socket->id();
        item.name = socket->name();
        item.kind = TreeItemKind::Socket;
        item.level = pending.level;
        item.node = socket;
        out.push_back(std::move(item));
        break;
      }
      default:
        break;
    }

    if (container == nullptr || !out.back().expanded) continue;
    push_children(*container, pending.level + 1, stack);
  }
  return out;
}

}  // namespace reqnav
