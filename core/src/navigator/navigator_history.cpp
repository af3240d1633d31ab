#include "reqnav/navigator.h"

namespace reqnav {

void Navigator::set_history_query_timeout(std::chrono::milliseconds timeout) {
  history_timeout_ = timeout.count() > 0 ? timeout : kDefaultHistoryQueryTimeout;
}

void Navigator::set_history_limit(size_t limit) {
  history_limit_ = limit > 0 ? limit : kDefaultHistoryLimit;
}

void Navigator::refresh_history() {
  load_history(true);
}

void Navigator::load_history(bool reset_cursor) {
  if (!history_store_) {
    history_entries_.clear();
    last_history_error_.reset();
    history_view_ = ViewportState{};
    return;
  }

  QueryOptions options = build_history_query_options(history_filters_, history_limit_);
  HistoryResult result = run_history_query(*history_store_, options, history_timeout_);
  if (result.ok()) {
    history_entries_ = std::move(result.entries);
    last_history_error_.reset();
  } else {
    // Previous entries stay visible; the header marks them stale.
    last_history_error_ = std::move(result.error_message);
  }

  if (reset_cursor) history_view_ = ViewportState{};
  history_view_ =
      clamp_viewport(history_view_, history_entries_.size(), history_viewport_height());
}

void Navigator::move_history_cursor(long delta) {
  history_view_ = move_viewport(history_view_, delta, history_entries_.size(),
                                history_viewport_height());
}

std::optional<NavigatorEffect> Navigator::activate_history_row() {
  if (history_view_.cursor >= history_entries_.size()) return std::nullopt;
  return HistoryEntrySelected{history_entries_[history_view_.cursor]};
}

std::optional<NavigatorEffect> Navigator::handle_history_key(const KeyPress& key) {
  if (handle_chord(key, history_view_)) return std::nullopt;

  switch (key.code) {
    case KeyCode::Down:
      move_history_cursor(1);
      return std::nullopt;
    case KeyCode::Up:
      move_history_cursor(-1);
      return std::nullopt;
    case KeyCode::End:
      history_view_ = jump_to_bottom(history_view_, history_entries_.size(),
                                     history_viewport_height());
      return std::nullopt;
    case KeyCode::Home:
      history_view_ = jump_to_top();
      return std::nullopt;
    case KeyCode::Enter:
      return activate_history_row();
    case KeyCode::Escape:
      // Only the text filter is cancelled; method/status stay until 'x'.
      if (!history_filters_.search.empty()) {
        history_filters_.search.clear();
        load_history(true);
      } else {
        set_view_mode(NavigatorViewMode::Collections);
      }
      return std::nullopt;
    case KeyCode::Left:
    case KeyCode::Right:
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
      move_history_cursor(1);
      break;
    case 'k':
      move_history_cursor(-1);
      break;
    case '/':
      start_search();
      break;
    case 'H':
    case 'C':
      set_view_mode(NavigatorViewMode::Collections);
      break;
    case 'G':
      history_view_ = jump_to_bottom(history_view_, history_entries_.size(),
                                     history_viewport_height());
      break;
    case 'r':
      load_history(true);
      break;
    case 'm':
      history_filters_.method = next_method_filter(history_filters_.method);
      load_history(true);
      break;
    case 's':
      history_filters_.status_class = next_status_filter(history_filters_.status_class);
      load_history(true);
      break;
    case 'x':
      history_filters_ = HistoryFilters{};
      load_history(true);
      break;
    default:
      break;
  }
  return std::nullopt;
}

}  // namespace reqnav
