#include "test_harness.h"

#include <string>
#include <vector>

#include "explore/key_decoder.h"

using namespace reqnav;
using namespace reqnav::cli;

namespace {

void test_decode_plain_and_control_bytes() {
  auto keys = decode_key_bytes(std::string("jk /\r\x7f\x15", 7));
  expect_eq(keys.size(), 7, "one key per byte");
  expect_true(keys[0].code == KeyCode::Character && keys[0].ch == 'j', "letter");
  expect_true(keys[2].code == KeyCode::Space, "space has its own code");
  expect_true(keys[3].code == KeyCode::Character && keys[3].ch == '/', "slash");
  expect_true(keys[4].code == KeyCode::Enter, "carriage return is enter");
  expect_true(keys[5].code == KeyCode::Backspace, "DEL byte is backspace");
  expect_true(keys[6].code == KeyCode::ClearAll, "ctrl-u clears");

  keys = decode_key_bytes(std::string("\x01\x02", 2));
  expect_eq(keys.size(), 0, "other control bytes dropped");
}

void test_decode_escape_sequences() {
  auto keys = decode_key_bytes("\x1b[A\x1b[B\x1b[C\x1b[D\x1b[H\x1b[F\x1b[3~\x1b[1~\x1b[4~\x1bOA");
  expect_eq(keys.size(), 10, "ten sequences decoded");
  expect_true(keys[0].code == KeyCode::Up, "up");
  expect_true(keys[1].code == KeyCode::Down, "down");
  expect_true(keys[2].code == KeyCode::Right, "right");
  expect_true(keys[3].code == KeyCode::Left, "left");
  expect_true(keys[4].code == KeyCode::Home, "home");
  expect_true(keys[5].code == KeyCode::End, "end");
  expect_true(keys[6].code == KeyCode::Delete, "delete");
  expect_true(keys[7].code == KeyCode::Home, "vt home");
  expect_true(keys[8].code == KeyCode::End, "vt end");
  expect_true(keys[9].code == KeyCode::Up, "ss3 up");
}

void test_decode_lone_escape() {
  auto keys = decode_key_bytes("\x1b");
  expect_true(keys.size() == 1 && keys[0].code == KeyCode::Escape, "lone escape");
  keys = decode_key_bytes("\x1bj");
  expect_eq(keys.size(), 2, "escape followed by a letter");
  expect_true(keys[0].code == KeyCode::Escape && keys[1].ch == 'j', "escape then j");
}

void test_key_notation_names_and_literals() {
  std::vector<KeyPress> keys;
  std::string error;
  expect_true(parse_key_notation("/ab<BS><Enter><down><C-u><Esc><Space><lt>", keys, error),
              "notation parsed");
  expect_eq(keys.size(), 10, "literal and named keys");
  expect_true(keys[3].code == KeyCode::Backspace, "BS");
  expect_true(keys[4].code == KeyCode::Enter, "Enter");
  expect_true(keys[5].code == KeyCode::Down, "names ignore case");
  expect_true(keys[6].code == KeyCode::ClearAll, "C-u");
  expect_true(keys[7].code == KeyCode::Escape, "Esc");
  expect_true(keys[8].code == KeyCode::Space, "Space");
  expect_true(keys[9].code == KeyCode::Character && keys[9].ch == '<', "lt is a literal <");
}

void test_key_notation_errors_leave_output() {
  std::vector<KeyPress> keys;
  std::string error;
  expect_true(!parse_key_notation("jj<Nope>", keys, error), "unknown name rejected");
  expect_true(error.find("<Nope>") != std::string::npos, "error names the key");
  expect_eq(keys.size(), 0, "no partial output");
  expect_true(!parse_key_notation("<Down", keys, error), "unterminated name rejected");
}

}  // namespace

void register_key_decoder_tests(std::vector<TestCase>& tests) {
  tests.push_back({"decode_plain_and_control_bytes", test_decode_plain_and_control_bytes});
  tests.push_back({"decode_escape_sequences", test_decode_escape_sequences});
  tests.push_back({"decode_lone_escape", test_decode_lone_escape});
  tests.push_back({"key_notation_names_and_literals", test_key_notation_names_and_literals});
  tests.push_back({"key_notation_errors_leave_output", test_key_notation_errors_leave_output});
}
