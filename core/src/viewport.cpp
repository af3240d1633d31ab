#include "reqnav/viewport.h"

namespace reqnav {

size_t move_cursor(size_t cursor, long delta, size_t item_count) {
  if (item_count == 0) return 0;
  const long last = static_cast<long>(item_count) - 1;
  long next = static_cast<long>(cursor) + delta;
  if (next < 0) return 0;
  if (next > last) return static_cast<size_t>(last);
  return static_cast<size_t>(next);
}

size_t adjust_offset(size_t cursor, size_t offset, size_t viewport_height) {
  if (viewport_height < 1) viewport_height = 1;
  if (cursor < offset) return cursor;
  if (cursor >= offset + viewport_height) return cursor - viewport_height + 1;
  return offset;
}

ViewportState move_viewport(ViewportState state,
                            long delta,
                            size_t item_count,
                            size_t viewport_height) {
  state.cursor = move_cursor(state.cursor, delta, item_count);
  state.offset = adjust_offset(state.cursor, state.offset, viewport_height);
  return state;
}

ViewportState clamp_viewport(ViewportState state, size_t item_count, size_t viewport_height) {
  return move_viewport(state, 0, item_count, viewport_height);
}

ViewportState jump_to_top() {
  return ViewportState{};
}

ViewportState jump_to_bottom(ViewportState state, size_t item_count, size_t viewport_height) {
  if (item_count == 0) return state;
  state.cursor = item_count - 1;
  state.offset = adjust_offset(state.cursor, state.offset, viewport_height);
  return state;
}

}  // namespace reqnav
