#include "explore/sidebar_explorer.h"

#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <unistd.h>
#include <vector>

#include "explore/key_decoder.h"
#include "explore/navigator_view.h"
#include "input/terminal.h"
#include "input/text_util.h"
#include "reqnav/json_io.h"

namespace reqnav::cli {

namespace {

constexpr char kCtrlC = 3;
constexpr char kEscape = 27;
constexpr int kEscapeSequenceWaitMs = 25;
constexpr size_t kMaxEscapeSequenceBytes = 8;

struct CursorVisibilityGuard {
  CursorVisibilityGuard() { std::cout << "\033[?25l" << std::flush; }
  ~CursorVisibilityGuard() { std::cout << "\033[?25h" << std::flush; }
};

// Reads one key's worth of bytes; escape sequences arrive in a burst.
std::optional<std::string> read_key_bytes() {
  char c = 0;
  if (::read(STDIN_FILENO, &c, 1) <= 0) return std::nullopt;
  std::string bytes(1, c);
  if (c != kEscape) return bytes;
  while (bytes.size() < kMaxEscapeSequenceBytes && wait_input_ready(kEscapeSequenceWaitMs)) {
    char next = 0;
    if (::read(STDIN_FILENO, &next, 1) <= 0) break;
    bytes.push_back(next);
    if (bytes.size() >= 3 && (std::isalpha(static_cast<unsigned char>(next)) || next == '~')) {
      break;
    }
  }
  return bytes;
}

std::string history_status_line(const Navigator& navigator) {
  if (navigator.last_history_error()) {
    return "Error: " + *navigator.last_history_error();
  }
  return "";
}

}  // namespace

bool load_sidebar_data(const CliOptions& options,
                       Navigator& navigator,
                       MemoryHistoryStore& store,
                       std::ostream& err) {
  try {
    if (!options.collections_path.empty()) {
      navigator.set_collections(load_collections_file(options.collections_path));
    }
    if (!options.history_path.empty()) {
      for (auto& entry : load_history_file(options.history_path)) {
        store.add(std::move(entry));
      }
    }
  } catch (const std::exception& ex) {
    err << "Error: " << ex.what() << std::endl;
    return false;
  }

  navigator.set_history_store(&store);
  navigator.set_history_limit(static_cast<size_t>(options.history_limit));
  navigator.set_history_query_timeout(std::chrono::milliseconds(options.timeout_ms));
  if (options.mode == "history") {
    navigator.set_view_mode(NavigatorViewMode::History);
  }
  return true;
}

std::string describe_effect(const NavigatorEffect& effect) {
  if (const auto* selected = std::get_if<RequestSelected>(&effect)) {
    const auto& request = *selected->request;
    return "Selected request: " + request.method() + " " + request.name() +
           (request.url().empty() ? "" : " (" + request.url() + ")");
  }
  if (const auto* selected = std::get_if<SocketSelected>(&effect)) {
    const auto& socket = *selected->socket;
    return "Selected socket: " + socket.name() +
           (socket.endpoint().empty() ? "" : " (" + socket.endpoint() + ")");
  }
  const auto& entry = std::get<HistoryEntrySelected>(effect).entry;
  return "Selected history entry: " + entry.request_method + " " + entry.request_url + " " +
         std::to_string(entry.response_status);
}

int run_sidebar_print(const CliOptions& options, std::ostream& out, std::ostream& err) {
  std::vector<KeyPress> keys;
  std::string key_error;
  if (!parse_key_notation(options.keys, keys, key_error)) {
    err << "Error: " << key_error << std::endl;
    return 2;
  }

  Navigator navigator;
  navigator.update(ResizeEvent{options.width, options.height});
  navigator.update(FocusGained{});
  MemoryHistoryStore store;
  if (!load_sidebar_data(options, navigator, store, err)) return 2;

  std::optional<NavigatorEffect> last_effect;
  for (const auto& key : keys) {
    if (auto effect = navigator.update(key)) last_effect = std::move(effect);
  }

  for (const auto& line : render_navigator_lines(navigator, std::chrono::system_clock::now())) {
    out << line << '\n';
  }
  if (last_effect) out << describe_effect(*last_effect) << '\n';
  const std::string status = history_status_line(navigator);
  if (!status.empty()) out << status << '\n';
  out << std::flush;
  return 0;
}

int run_sidebar_explorer(const CliOptions& options, std::ostream& err) {
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    err << "Error: interactive mode requires a terminal (use --print otherwise)." << std::endl;
    return 2;
  }

  Navigator navigator;
  // One row is reserved for the status line.
  int width = terminal_width();
  int height = terminal_height() - 1;
  navigator.update(ResizeEvent{width, height});
  navigator.update(FocusGained{});
  MemoryHistoryStore store;
  if (!load_sidebar_data(options, navigator, store, err)) return 2;

  TermiosGuard guard;
  if (!guard.ok()) {
    err << "Error: failed to initialize terminal raw mode." << std::endl;
    return 1;
  }
  CursorVisibilityGuard cursor_guard;

  std::string status;
  auto render = [&]() {
    std::cout << "\033[2J\033[H";
    for (const auto& line : render_navigator_lines(navigator, std::chrono::system_clock::now())) {
      std::cout << line << "\r\n";
    }
    std::string line = status.empty() ? history_status_line(navigator) : status;
    std::cout << truncate_display_width(line, static_cast<size_t>(width)) << std::flush;
  };

  bool running = true;
  render();
  while (running) {
    std::optional<std::string> bytes = read_key_bytes();
    if (!bytes || (*bytes)[0] == kCtrlC) break;

    const int new_width = terminal_width();
    const int new_height = terminal_height() - 1;
    if (new_width != width || new_height != height) {
      width = new_width;
      height = new_height;
      navigator.update(ResizeEvent{width, height});
    }

    for (const auto& key : decode_key_bytes(*bytes)) {
      if (key.code == KeyCode::Character && key.ch == 'q' && !navigator.searching()) {
        running = false;
        break;
      }
      if (auto effect = navigator.update(key)) {
        status = describe_effect(*effect);
      }
    }
    if (running) render();
  }

  std::cout << "\033[2J\033[H" << std::flush;
  return 0;
}

}  // namespace reqnav::cli
