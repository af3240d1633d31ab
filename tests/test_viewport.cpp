#include "test_harness.h"

#include <vector>

#include "reqnav/viewport.h"

using namespace reqnav;

namespace {

void test_move_cursor_clamps_to_bounds() {
  expect_eq(move_cursor(0, -1, 5), 0, "cannot move above first row");
  expect_eq(move_cursor(4, 1, 5), 4, "cannot move past last row");
  expect_eq(move_cursor(2, 1, 5), 3, "moves down by one");
  expect_eq(move_cursor(2, -10, 5), 0, "large negative delta clamps to 0");
  expect_eq(move_cursor(3, 0, 0), 0, "empty list pins cursor at 0");
}

void test_cursor_bounds_hold_for_any_move_sequence() {
  const std::vector<long> deltas = {1, 1, 1, -1, 5, 5, -3, -20, 7, 1, 1, -1};
  for (size_t count : {size_t(0), size_t(1), size_t(3), size_t(10)}) {
    ViewportState state;
    for (long delta : deltas) {
      state = move_viewport(state, delta, count, 4);
      if (count == 0) {
        expect_eq(state.cursor, 0, "empty list keeps cursor at 0");
      } else {
        expect_true(state.cursor < count, "cursor stays below item count");
      }
      expect_true(state.offset <= state.cursor, "offset never passes cursor");
      expect_true(state.cursor < state.offset + 4, "cursor stays inside viewport");
    }
  }
}

void test_adjust_offset_scrolls_window() {
  expect_eq(adjust_offset(2, 5, 4), 2, "cursor above window pulls offset up");
  expect_eq(adjust_offset(9, 0, 4), 6, "cursor below window pushes offset down");
  expect_eq(adjust_offset(3, 1, 4), 1, "cursor inside window keeps offset");
  expect_eq(adjust_offset(5, 0, 0), 5, "zero height behaves like one row");
}

void test_jump_to_top_and_bottom() {
  ViewportState state = jump_to_bottom(ViewportState{}, 20, 5);
  expect_eq(state.cursor, 19, "bottom selects last row");
  expect_eq(state.offset, 15, "bottom scrolls last row into view");

  state = jump_to_top();
  expect_eq(state.cursor, 0, "top resets cursor");
  expect_eq(state.offset, 0, "top resets offset");

  ViewportState untouched{0, 0};
  untouched = jump_to_bottom(untouched, 0, 5);
  expect_eq(untouched.cursor, 0, "bottom of empty list is a no-op");
}

void test_clamp_after_list_shrinks() {
  ViewportState state{8, 6};
  state = clamp_viewport(state, 3, 4);
  expect_eq(state.cursor, 2, "cursor clamped to new last row");
  expect_eq(state.offset, 2, "offset follows clamped cursor");
}

}  // namespace

void register_viewport_tests(std::vector<TestCase>& tests) {
  tests.push_back({"move_cursor_clamps_to_bounds", test_move_cursor_clamps_to_bounds});
  tests.push_back({"cursor_bounds_hold_for_any_move_sequence",
                   test_cursor_bounds_hold_for_any_move_sequence});
  tests.push_back({"adjust_offset_scrolls_window", test_adjust_offset_scrolls_window});
  tests.push_back({"jump_to_top_and_bottom", test_jump_to_top_and_bottom});
  tests.push_back({"clamp_after_list_shrinks", test_clamp_after_list_shrinks});
}
