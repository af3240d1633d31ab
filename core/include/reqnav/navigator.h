#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "reqnav/collection.h"
#include "reqnav/history.h"
#include "reqnav/history_query.h"
#include "reqnav/tree.h"
#include "reqnav/viewport.h"

namespace reqnav {

enum class NavigatorViewMode {
  Collections,
  History,
};

enum class KeyCode {
  Character,
  Up,
  Down,
  Left,
  Right,
  Enter,
  Escape,
  Backspace,
  Delete,
  Home,
  End,
  ClearAll,
  Space,
};

/// One key press. `ch` is only meaningful for KeyCode::Character.
struct KeyPress {
  KeyCode code = KeyCode::Character;
  char ch = 0;
};

struct ResizeEvent {
  int width = 0;
  int height = 0;
};

struct FocusGained {};
struct FocusLost {};

using NavigatorEvent = std::variant<ResizeEvent, FocusGained, FocusLost, KeyPress>;

struct RequestSelected {
  RequestHandle request;
};

struct SocketSelected {
  SocketHandle socket;
};

struct HistoryEntrySelected {
  HistoryEntry entry;
};

/// Outbound message produced by an update. The caller dispatches it.
using NavigatorEffect = std::variant<RequestSelected, SocketSelected, HistoryEntrySelected>;

/// Sidebar navigator: a collection tree and a request history list behind
/// one modal key handler.
///
/// Each call to update() processes exactly one event to completion. The only
/// blocking work is a history query, bounded by the configured timeout.
/// Collections and history keep separate cursors, offsets, and search text.
class Navigator {
 public:
  Navigator();

  /// Dispatches one event based on focus, search editing, and view mode.
  /// MUST ignore everything except resize/focus-gained while unfocused.
  std::optional<NavigatorEffect> update(const NavigatorEvent& event);

  // Collection data.
  /// Replaces the collection set, rebuilds rows, and resets the collections cursor.
  void set_collections(std::vector<CollectionHandle> collections);
  const std::vector<CollectionHandle>& collections() const { return collections_; }
  /// Appends `request` to `target` (first collection when null, a new
  /// "Default" collection when none exist), expands that collection, and
  /// moves the collections cursor onto the new row.
  /// MUST return false and leave state untouched for a null request.
  bool add_request(RequestHandle request, Collection* target = nullptr);
  /// Returns the collection named `name`, appending a new one if absent.
  CollectionHandle get_or_create_collection(const std::string& name);
  /// Recomputes rows after the caller mutated collection objects directly.
  void rebuild_items();

  // History data.
  /// Non-owning; the store MUST outlive the navigator or be reset to null.
  void set_history_store(HistoryStore* store) { history_store_ = store; }
  void set_history_query_timeout(std::chrono::milliseconds timeout);
  void set_history_limit(size_t limit);
  void set_history_method_filter(std::string method) { history_filters_.method = std::move(method); }
  void set_history_status_filter(std::string status) {
    history_filters_.status_class = std::move(status);
  }
  /// Re-issues the history query and resets the history cursor.
  void refresh_history();

  // Mode and focus.
  /// Switches views; entering History issues a query.
  void set_view_mode(NavigatorViewMode mode);
  NavigatorViewMode view_mode() const { return view_mode_; }
  void focus() { focused_ = true; }
  void blur() { focused_ = false; }
  bool focused() const { return focused_; }
  bool searching() const { return searching_; }
  bool chord_pending() const { return chord_pending_; }

  // Explicit index operations. Out-of-range indices are silent no-ops.
  void expand_at(size_t index);
  void collapse_at(size_t index);
  void select_index(size_t index);
  bool is_expanded(size_t index) const;

  // Collections view state.
  const std::vector<TreeItem>& items() const { return items_; }
  /// Rows currently shown: all rows, or the filtered subset when a query is set.
  const std::vector<TreeItem>& display_items() const;
  const TreeItem* selected_item() const;
  /// Collection owning the selected row, falling back to the first collection.
  const Collection* selected_collection() const;
  size_t cursor() const { return collections_view_.cursor; }
  size_t offset() const { return collections_view_.offset; }
  const std::string& search_query() const { return collection_search_; }

  // History view state.
  const std::vector<HistoryEntry>& history_entries() const { return history_entries_; }
  size_t history_cursor() const { return history_view_.cursor; }
  size_t history_offset() const { return history_view_.offset; }
  const std::string& history_search_query() const { return history_filters_.search; }
  const std::string& history_method_filter() const { return history_filters_.method; }
  const std::string& history_status_filter() const { return history_filters_.status_class; }
  bool has_history_store() const { return history_store_ != nullptr; }
  /// True when the latest query failed and the entries shown are from an
  /// earlier successful query.
  bool history_stale() const { return last_history_error_.has_value(); }
  const std::optional<std::string>& last_history_error() const { return last_history_error_; }

  // Layout.
  int width() const { return width_; }
  int height() const { return height_; }
  size_t collection_viewport_height() const;
  size_t history_viewport_height() const;

 private:
  std::optional<NavigatorEffect> handle_key(const KeyPress& key);
  std::optional<NavigatorEffect> handle_search_key(const KeyPress& key);
  std::optional<NavigatorEffect> handle_collection_key(const KeyPress& key);
  std::optional<NavigatorEffect> handle_history_key(const KeyPress& key);
  std::optional<NavigatorEffect> activate_collection_row();
  std::optional<NavigatorEffect> activate_history_row();

  bool handle_chord(const KeyPress& key, ViewportState& view);
  void start_search();
  std::string& active_search_text();
  void apply_active_search();

  void move_collection_cursor(long delta);
  void set_expanded_at(size_t index, bool expanded);
  void rebuild_rows();
  void apply_collection_filter();
  void clamp_collection_view();

  void move_history_cursor(long delta);
  void load_history(bool reset_cursor);

  bool focused_ = false;
  bool searching_ = false;
  bool chord_pending_ = false;
  NavigatorViewMode view_mode_ = NavigatorViewMode::Collections;
  int width_ = 0;
  int height_ = 0;

  std::vector<CollectionHandle> collections_;
  ExpansionState expansion_;
  std::vector<TreeItem> items_;
  std::vector<TreeItem> filtered_items_;
  std::string collection_search_;
  ViewportState collections_view_;

  HistoryStore* history_store_ = nullptr;
  std::chrono::milliseconds history_timeout_ = kDefaultHistoryQueryTimeout;
  size_t history_limit_ = kDefaultHistoryLimit;
  HistoryFilters history_filters_;
  std::vector<HistoryEntry> history_entries_;
  std::optional<std::string> last_history_error_;
  ViewportState history_view_;
};

}  // namespace reqnav
