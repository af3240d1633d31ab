#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "reqnav/history.h"
#include "reqnav/navigator.h"
#include "reqnav/tree.h"

namespace reqnav::cli {

/// Fixed five-column badge for an HTTP method (" GET ", " POST", " PTCH", ...).
/// Unknown methods are left-aligned in four columns after a space.
std::string method_badge(const std::string& method);

/// "just now", "5m ago", "3h ago", "2d ago", or a "Jan 2" date past a week.
std::string format_time_ago(std::chrono::system_clock::time_point timestamp,
                            std::chrono::system_clock::time_point now);

/// One collections row: selection marker, indentation, expander, badge, name.
/// MUST fit in `width` columns.
std::string format_tree_row(const TreeItem& item, bool selected, size_t width);

/// One history row: marker, badge, URL without scheme, status, relative time.
/// MUST fit in `width` columns.
std::string format_history_row(const HistoryEntry& entry,
                               bool selected,
                               size_t width,
                               std::chrono::system_clock::time_point now);

std::string format_search_bar(const Navigator& navigator);
std::string format_collections_header(const Navigator& navigator);
std::string format_history_header(const Navigator& navigator);

/// Wraps `content_lines` in a titled box of exactly `pane_rows` lines.
std::vector<std::string> boxed_panel_lines(const std::string& title,
                                           const std::vector<std::string>& content_lines,
                                           size_t pane_width,
                                           size_t pane_rows);

/// Renders the whole sidebar at the navigator's current size.
/// MUST return exactly max(height, 1) lines for a positive width.
std::vector<std::string> render_navigator_lines(const Navigator& navigator,
                                                std::chrono::system_clock::time_point now);

}  // namespace reqnav::cli
