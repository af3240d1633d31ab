#include "explore/navigator_view.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#include "input/text_util.h"

namespace reqnav::cli {

namespace {

constexpr const char* kSelectedMarker = "> ";
constexpr const char* kUnselectedMarker = "  ";
constexpr const char* kSearchCursor = "▌";

std::string strip_scheme(const std::string& url) {
  for (const char* scheme : {"https://", "http://", "wss://", "ws://"}) {
    const std::string prefix(scheme);
    if (url.compare(0, prefix.size(), prefix) == 0) return url.substr(prefix.size());
  }
  return url;
}

std::string ascii_upper(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string plural(size_t count, const char* word) {
  std::string out = std::to_string(count) + " " + word;
  if (count != 1) out += "s";
  return out;
}

}  // namespace

std::string method_badge(const std::string& method) {
  const std::string upper = ascii_upper(method);
  if (upper == "GET") return " GET ";
  if (upper == "POST") return " POST";
  if (upper == "PUT") return " PUT ";
  if (upper == "PATCH") return " PTCH";
  if (upper == "DELETE") return " DEL ";
  if (upper == "HEAD") return " HEAD";
  if (upper == "OPTIONS") return " OPT ";
  char buf[16];
  std::snprintf(buf, sizeof(buf), " %-4.4s", method.c_str());
  return buf;
}

std::string format_time_ago(std::chrono::system_clock::time_point timestamp,
                            std::chrono::system_clock::time_point now) {
  using std::chrono::duration_cast;
  const auto diff = now - timestamp;
  if (diff < std::chrono::minutes(1)) return "just now";
  if (diff < std::chrono::hours(1)) {
    return std::to_string(duration_cast<std::chrono::minutes>(diff).count()) + "m ago";
  }
  if (diff < std::chrono::hours(24)) {
    return std::to_string(duration_cast<std::chrono::hours>(diff).count()) + "h ago";
  }
  if (diff < std::chrono::hours(24 * 7)) {
    return std::to_string(duration_cast<std::chrono::hours>(diff).count() / 24) + "d ago";
  }
  const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%b ", &tm);
  return std::string(buf) + std::to_string(tm.tm_mday);
}

std::string format_tree_row(const TreeItem& item, bool selected, size_t width) {
  std::string out;
  out.reserve(64);
  out += selected ? kSelectedMarker : kUnselectedMarker;
  out.append(static_cast<size_t>(std::max(item.level, 0)) * 2, ' ');
  if (item.expandable) {
    out += item.expanded ? "- " : "+ ";
  } else {
    out += "  ";
  }
  switch (item.kind) {
    case TreeItemKind::Request:
      out += method_badge(item.method);
      out.push_back(' ');
      break;
    case TreeItemKind::Socket:
      out += " WS  ";
      break;
    case TreeItemKind::Collection:
    case TreeItemKind::Folder:
      break;
  }
  out += item.name;
  return truncate_display_width(out, width);
}

std::string format_history_row(const HistoryEntry& entry,
                               bool selected,
                               size_t width,
                               std::chrono::system_clock::time_point now) {
  // Marker, badge, status, time, and separators take about 27 columns.
  size_t url_width = width > 37 ? width - 27 : 10;
  std::string url = truncate_display_width(strip_scheme(entry.request_url), url_width);

  std::string out = selected ? kSelectedMarker : kUnselectedMarker;
  out += method_badge(entry.request_method);
  out += " " + url;
  out += " " + std::to_string(entry.response_status);
  out += " " + format_time_ago(entry.timestamp, now);
  return truncate_display_width(out, width);
}

std::string format_search_bar(const Navigator& navigator) {
  const bool history = navigator.view_mode() == NavigatorViewMode::History;
  const std::string& query =
      history ? navigator.history_search_query() : navigator.search_query();

  std::string out = "/ ";
  if (!navigator.searching() && query.empty()) {
    out += "search...";
    return out;
  }
  out += query;
  if (navigator.searching()) {
    out += kSearchCursor;
    return out;
  }
  const size_t count =
      history ? navigator.history_entries().size() : navigator.display_items().size();
  if (count == 0) {
    out += " (No matches)";
  } else {
    out += " (" + plural(count, "result") + ")";
  }
  return out;
}

std::string format_collections_header(const Navigator& navigator) {
  std::string out = "Collections";
  if (navigator.view_mode() != NavigatorViewMode::Collections) out += " (C)";
  return out;
}

std::string format_history_header(const Navigator& navigator) {
  std::string out = "History";
  if (navigator.view_mode() != NavigatorViewMode::History) out += " (H)";

  std::string filters;
  if (!navigator.history_method_filter().empty()) filters = navigator.history_method_filter();
  if (!navigator.history_status_filter().empty()) {
    if (!filters.empty()) filters += ",";
    filters += navigator.history_status_filter();
  }
  if (!filters.empty()) out += " [" + filters + "]";
  if (navigator.history_stale()) out += " [stale]";
  return out;
}

std::vector<std::string> boxed_panel_lines(const std::string& title,
                                           const std::vector<std::string>& content_lines,
                                           size_t pane_width,
                                           size_t pane_rows) {
  std::vector<std::string> out;
  if (pane_rows == 0) return out;
  if (pane_width < 4) {
    out.reserve(pane_rows);
    for (size_t i = 0; i < pane_rows; ++i) {
      std::string line = i < content_lines.size() ? content_lines[i] : "";
      out.push_back(truncate_display_width(line, pane_width));
    }
    return out;
  }

  const size_t middle_width = pane_width - 2;
  const size_t inner_width = pane_width - 4;

  std::string label = truncate_display_width(" " + title + " ", middle_width);
  const size_t label_w = column_width(label, 0, label.size());
  const size_t left = (middle_width > label_w) ? (middle_width - label_w) / 2 : 0;
  const size_t right = (middle_width > label_w) ? (middle_width - label_w - left) : 0;
  const std::string top = "┌" + repeat_utf8("─", left) + label + repeat_utf8("─", right) + "┐";
  const std::string bottom = "└" + repeat_utf8("─", middle_width) + "┘";

  out.reserve(pane_rows);
  out.push_back(top);
  if (pane_rows == 1) return out;
  for (size_t i = 0; i + 2 < pane_rows; ++i) {
    std::string line = i < content_lines.size() ? content_lines[i] : "";
    out.push_back("│ " + pad_display_width(line, inner_width) + " │");
  }
  out.push_back(bottom);
  return out;
}

std::vector<std::string> render_navigator_lines(const Navigator& navigator,
                                                std::chrono::system_clock::time_point now) {
  if (navigator.width() <= 0) return {};
  const size_t width = static_cast<size_t>(navigator.width());
  const size_t rows = static_cast<size_t>(std::max(navigator.height(), 1));
  const size_t inner_width = width > 4 ? width - 4 : 1;

  std::vector<std::string> content;
  content.push_back(format_search_bar(navigator));

  content.push_back(format_history_header(navigator));
  const auto& entries = navigator.history_entries();
  const size_t history_rows = navigator.history_viewport_height();
  if (entries.empty()) {
    std::string empty_msg = "No history entries";
    if (!navigator.has_history_store()) empty_msg = "History not available";
    if (!navigator.history_method_filter().empty() ||
        !navigator.history_status_filter().empty()) {
      empty_msg = "No matching entries (m:method s:status x:clear)";
    }
    content.push_back(empty_msg);
    for (size_t i = 1; i < history_rows; ++i) content.emplace_back();
  } else {
    for (size_t i = 0; i < history_rows; ++i) {
      const size_t idx = navigator.history_offset() + i;
      if (idx >= entries.size()) {
        content.emplace_back();
        continue;
      }
      content.push_back(format_history_row(entries[idx], idx == navigator.history_cursor(),
                                           inner_width, now));
    }
  }

  content.push_back(format_collections_header(navigator));
  const auto& items = navigator.display_items();
  const size_t collection_rows = navigator.collection_viewport_height();
  for (size_t i = 0; i < collection_rows; ++i) {
    const size_t idx = navigator.offset() + i;
    if (idx < items.size()) {
      content.push_back(format_tree_row(items[idx], idx == navigator.cursor(), inner_width));
    } else if (i == 0 && !navigator.search_query().empty()) {
      content.push_back("No matches");
    } else if (i == 0 && items.empty()) {
      content.push_back("No collections");
    } else {
      content.emplace_back();
    }
  }

  return boxed_panel_lines("Sidebar", content, width, rows);
}

}  // namespace reqnav::cli
