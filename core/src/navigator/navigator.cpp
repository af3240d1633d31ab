#include "reqnav/navigator.h"

namespace reqnav {

namespace {

constexpr int kBorderRows = 2;
// Search bar plus one header per section.
constexpr int kChromeRows = 3;

size_t available_section_rows(int height) {
  int available = height - kBorderRows - kChromeRows;
  if (available < 2) available = 2;
  return static_cast<size_t>(available);
}

}  // namespace

Navigator::Navigator() = default;

std::optional<NavigatorEffect> Navigator::update(const NavigatorEvent& event) {
  if (const auto* resize = std::get_if<ResizeEvent>(&event)) {
    width_ = resize->width;
    height_ = resize->height;
    clamp_collection_view();
    history_view_ =
        clamp_viewport(history_view_, history_entries_.size(), history_viewport_height());
    return std::nullopt;
  }
  if (std::holds_alternative<FocusGained>(event)) {
    focused_ = true;
    return std::nullopt;
  }
  if (!focused_) return std::nullopt;

  if (std::holds_alternative<FocusLost>(event)) {
    focused_ = false;
    return std::nullopt;
  }
  if (const auto* key = std::get_if<KeyPress>(&event)) {
    return handle_key(*key);
  }
  return std::nullopt;
}

std::optional<NavigatorEffect> Navigator::handle_key(const KeyPress& key) {
  if (searching_) return handle_search_key(key);
  if (view_mode_ == NavigatorViewMode::History) return handle_history_key(key);
  return handle_collection_key(key);
}

bool Navigator::handle_chord(const KeyPress& key, ViewportState& view) {
  if (key.code == KeyCode::Character && key.ch == 'g') {
    if (chord_pending_) {
      view = jump_to_top();
      chord_pending_ = false;
    } else {
      chord_pending_ = true;
    }
    return true;
  }
  chord_pending_ = false;
  return false;
}

void Navigator::start_search() {
  searching_ = true;
  active_search_text().clear();
  if (view_mode_ == NavigatorViewMode::Collections) {
    filtered_items_.clear();
    clamp_collection_view();
  }
}

std::string& Navigator::active_search_text() {
  if (view_mode_ == NavigatorViewMode::History) return history_filters_.search;
  return collection_search_;
}

void Navigator::apply_active_search() {
  if (view_mode_ == NavigatorViewMode::History) {
    load_history(true);
  } else {
    apply_collection_filter();
  }
}

std::optional<NavigatorEffect> Navigator::handle_search_key(const KeyPress& key) {
  std::string& text = active_search_text();
  switch (key.code) {
    case KeyCode::Escape:
      // Leaves edit mode; the query stays applied.
      searching_ = false;
      break;
    case KeyCode::Enter:
      searching_ = false;
      apply_active_search();
      break;
    case KeyCode::Backspace:
      if (!text.empty()) {
        text.pop_back();
        apply_active_search();
      }
      break;
    case KeyCode::ClearAll:
      text.clear();
      apply_active_search();
      break;
    case KeyCode::Space:
      text.push_back(' ');
      apply_active_search();
      break;
    case KeyCode::Character:
      if (key.ch != 0) {
        text.push_back(key.ch);
        apply_active_search();
      }
      break;
    case KeyCode::Up:
    case KeyCode::Down:
    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Delete:
    case KeyCode::Home:
    case KeyCode::End:
      break;
  }
  return std::nullopt;
}

void Navigator::set_view_mode(NavigatorViewMode mode) {
  view_mode_ = mode;
  if (mode == NavigatorViewMode::History) {
    load_history(false);
  }
}

size_t Navigator::collection_viewport_height() const {
  size_t available = available_section_rows(height_);
  size_t history_rows = history_viewport_height();
  return available > history_rows ? available - history_rows : 1;
}

size_t Navigator::history_viewport_height() const {
  size_t rows = available_section_rows(height_) * 3 / 10;
  return rows < 1 ? 1 : rows;
}

}  // namespace reqnav
