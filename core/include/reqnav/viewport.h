#pragma once

#include <cstddef>

namespace reqnav {

/// Cursor and scroll offset of one list. Each browsing mode owns one.
struct ViewportState {
  size_t cursor = 0;
  size_t offset = 0;
};

/// Moves `cursor` by `delta` and clamps it to [0, item_count - 1].
/// MUST return 0 for an empty list.
size_t move_cursor(size_t cursor, long delta, size_t item_count);

/// Returns the scroll offset that keeps `cursor` inside a window of
/// `viewport_height` rows starting at `offset`.
/// MUST treat heights below 1 as 1.
size_t adjust_offset(size_t cursor, size_t offset, size_t viewport_height);

/// Applies move_cursor then adjust_offset.
ViewportState move_viewport(ViewportState state,
                            long delta,
                            size_t item_count,
                            size_t viewport_height);

/// Re-clamps after the list length changed without a cursor move.
ViewportState clamp_viewport(ViewportState state, size_t item_count, size_t viewport_height);

ViewportState jump_to_top();
ViewportState jump_to_bottom(ViewportState state, size_t item_count, size_t viewport_height);

}  // namespace reqnav
