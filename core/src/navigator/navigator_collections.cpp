#include "reqnav/navigator.h"

#include <algorithm>

namespace reqnav {

const std::vector<TreeItem>& Navigator::display_items() const {
  if (collection_search_.empty()) return items_;
  return filtered_items_;
}

const TreeItem* Navigator::selected_item() const {
  const auto& rows = display_items();
  if (collections_view_.cursor >= rows.size()) return nullptr;
  return &rows[collections_view_.cursor];
}

const Collection* Navigator::selected_collection() const {
  if (collections_.empty()) return nullptr;
  const TreeItem* item = selected_item();
  if (item) {
    for (const auto& collection : collections_) {
      if (collection && collection->contains_node(item->id)) return collection.get();
    }
  }
  return collections_.front().get();
}

void Navigator::set_collections(std::vector<CollectionHandle> collections) {
  collections_ = std::move(collections);
  collections_view_ = ViewportState{};
  rebuild_rows();
}

bool Navigator::add_request(RequestHandle request, Collection* target) {
  if (!request) return false;
  if (!target) {
    if (collections_.empty()) {
      collections_.push_back(std::make_shared<Collection>("Default"));
    }
    target = collections_.front().get();
  }
  const std::string request_id = request->id();
  if (!target->add_request(std::move(request))) return false;
  expansion_.set_expanded(target->id(), true);
  rebuild_rows();

  const auto& rows = display_items();
  auto it = std::find_if(rows.begin(), rows.end(), [&](const TreeItem& row) {
    return row.kind == TreeItemKind::Request && row.id == request_id;
  });
  if (it != rows.end()) {
    collections_view_.cursor = static_cast<size_t>(it - rows.begin());
  }
  clamp_collection_view();
  return true;
}

CollectionHandle Navigator::get_or_create_collection(const std::string& name) {
  for (const auto& collection : collections_) {
    if (collection && collection->name() == name) return collection;
  }
  auto created = std::make_shared<Collection>(name);
  collections_.push_back(created);
  rebuild_rows();
  return created;
}

void Navigator::rebuild_items() {
  rebuild_rows();
}

void Navigator::expand_at(size_t index) {
  set_expanded_at(index, true);
}

void Navigator::collapse_at(size_t index) {
  set_expanded_at(index, false);
}

void Navigator::select_index(size_t index) {
  if (index >= display_items().size()) return;
  collections_view_.cursor = index;
  clamp_collection_view();
}

bool Navigator::is_expanded(size_t index) const {
  const auto& rows = display_items();
  if (index >= rows.size()) return false;
  return expansion_.is_expanded(rows[index].id);
}

void Navigator::set_expanded_at(size_t index, bool expanded) {
  const auto& rows = display_items();
  if (index >= rows.size()) return;
  const TreeItem& row = rows[index];
  if (!row.expandable) return;
  if (expansion_.is_expanded(row.id) == expanded) return;
  expansion_.set_expanded(row.id, expanded);
  rebuild_rows();
}

void Navigator::rebuild_rows() {
  items_ = flatten_collection_tree(collections_, expansion_);
  if (collection_search_.empty()) {
    filtered_items_.clear();
  } else {
    filtered_items_ = filter_tree_items(items_, collection_search_);
  }
  clamp_collection_view();
}

void Navigator::apply_collection_filter() {
  if (collection_search_.empty()) {
    filtered_items_.clear();
  } else {
    filtered_items_ = filter_tree_items(items_, collection_search_);
    collections_view_ = ViewportState{};
  }
  clamp_collection_view();
}

void Navigator::clamp_collection_view() {
  collections_view_ =
      clamp_viewport(collections_view_, display_items().size(), collection_viewport_height());
}

void Navigator::move_collection_cursor(long delta) {
  collections_view_ = move_viewport(collections_view_, delta, display_items().size(),
                                    collection_viewport_height());
}

std::optional<NavigatorEffect> Navigator::activate_collection_row() {
  const TreeItem* item = selected_item();
  if (!item) return std::nullopt;
  if (item->expandable) {
    // rebuild_rows() replaces the row vector `item` points into.
    const std::string id = item->id;
    expansion_.toggle(id);
    rebuild_rows();
    return std::nullopt;
  }
  switch (item->kind) {
    case TreeItemKind::Request:
      if (auto request = item->request()) return RequestSelected{request};
      return std::nullopt;
    case TreeItemKind::Socket:
      if (auto socket = item->socket()) return SocketSelected{socket};
      return std::nullopt;
    case TreeItemKind::Collection:
    case TreeItemKind::Folder:
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<NavigatorEffect> Navigator::handle_collection_key(const KeyPress& key) {
  if (handle_chord(key, collections_view_)) return std::nullopt;

  switch (key.code) {
    case KeyCode::Down:
      move_collection_cursor(1);
      return std::nullopt;
    case KeyCode::Up:
      move_collection_cursor(-1);
      return std::nullopt;
    case KeyCode::Right:
      expand_at(collections_view_.cursor);
      return std::nullopt;
    case KeyCode::Left:
      collapse_at(collections_view_.cursor);
      return std::nullopt;
    case KeyCode::End:
      collections_view_ = jump_to_bottom(collections_view_, display_items().size(),
                                         collection_viewport_height());
      return std::nullopt;
    case KeyCode::Home:
      collections_view_ = jump_to_top();
      return std::nullopt;
    case KeyCode::Enter:
      return activate_collection_row();
    case KeyCode::Escape:
      if (!collection_search_.empty()) {
        collection_search_.clear();
        filtered_items_.clear();
        collections_view_ = ViewportState{};
      }
      return std::nullopt;
    case KeyCode::Backspace:
    case KeyCode::Delete:
    case KeyCode::ClearAll:
    case KeyCode::Space:
      return std::nullopt;
    case KeyCode::Character:
      break;
  }

  switch (key.ch) {
    case 'j':
      move_collection_cursor(1);
      break;
    case 'k':
      move_collection_cursor(-1);
      break;
    case 'l':
      expand_at(collections_view_.cursor);
      break;
    case 'h':
      collapse_at(collections_view_.cursor);
      break;
    case '/':
      start_search();
      break;
    case 'H':
      set_view_mode(NavigatorViewMode::History);
      break;
    case 'G':
      collections_view_ = jump_to_bottom(collections_view_, display_items().size(),
                                         collection_viewport_height());
      break;
    default:
      break;
  }
  return std::nullopt;
}

}  // namespace reqnav
