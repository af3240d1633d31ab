#include "explore/key_decoder.h"

#include <cctype>

namespace reqnav::cli {

namespace {

constexpr char kEscape = 27;
constexpr char kCtrlU = 21;

KeyPress key(KeyCode code) {
  return KeyPress{code, 0};
}

// Decodes the tail of an escape sequence starting after "ESC [" or "ESC O".
// Returns the number of bytes consumed, 0 when the tail is not recognised.
size_t decode_escape_tail(const std::string& bytes, size_t pos, std::vector<KeyPress>& out) {
  if (pos >= bytes.size()) return 0;
  switch (bytes[pos]) {
    case 'A':
      out.push_back(key(KeyCode::Up));
      return 1;
    case 'B':
      out.push_back(key(KeyCode::Down));
      return 1;
    case 'C':
      out.push_back(key(KeyCode::Right));
      return 1;
    case 'D':
      out.push_back(key(KeyCode::Left));
      return 1;
    case 'H':
      out.push_back(key(KeyCode::Home));
      return 1;
    case 'F':
      out.push_back(key(KeyCode::End));
      return 1;
    default:
      break;
  }
  if (pos + 1 < bytes.size() && bytes[pos + 1] == '~') {
    switch (bytes[pos]) {
      case '1':
      case '7':
        out.push_back(key(KeyCode::Home));
        return 2;
      case '4':
      case '8':
        out.push_back(key(KeyCode::End));
        return 2;
      case '3':
        out.push_back(key(KeyCode::Delete));
        return 2;
      default:
        break;
    }
  }
  return 0;
}

bool named_key(const std::string& name, KeyPress& out) {
  std::string lowered;
  lowered.reserve(name.size());
  for (char c : name) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lowered == "up") out = key(KeyCode::Up);
  else if (lowered == "down") out = key(KeyCode::Down);
  else if (lowered == "left") out = key(KeyCode::Left);
  else if (lowered == "right") out = key(KeyCode::Right);
  else if (lowered == "enter" || lowered == "cr") out = key(KeyCode::Enter);
  else if (lowered == "esc") out = key(KeyCode::Escape);
  else if (lowered == "bs") out = key(KeyCode::Backspace);
  else if (lowered == "del") out = key(KeyCode::Delete);
  else if (lowered == "home") out = key(KeyCode::Home);
  else if (lowered == "end") out = key(KeyCode::End);
  else if (lowered == "c-u") out = key(KeyCode::ClearAll);
  else if (lowered == "space") out = key(KeyCode::Space);
  else if (lowered == "lt") out = KeyPress{KeyCode::Character, '<'};
  else return false;
  return true;
}

}  // namespace

std::vector<KeyPress> decode_key_bytes(const std::string& bytes) {
  std::vector<KeyPress> out;
  size_t i = 0;
  while (i < bytes.size()) {
    const char c = bytes[i];
    if (c == kEscape) {
      if (i + 1 < bytes.size() && (bytes[i + 1] == '[' || bytes[i + 1] == 'O')) {
        size_t used = decode_escape_tail(bytes, i + 2, out);
        if (used > 0) {
          i += 2 + used;
          continue;
        }
        // Unknown sequence: drop the introducer and keep going.
        i += 2;
        continue;
      }
      out.push_back(key(KeyCode::Escape));
      ++i;
      continue;
    }
    if (c == 127 || c == 8) {
      out.push_back(key(KeyCode::Backspace));
    } else if (c == kCtrlU) {
      out.push_back(key(KeyCode::ClearAll));
    } else if (c == '\r' || c == '\n') {
      out.push_back(key(KeyCode::Enter));
    } else if (c == ' ') {
      out.push_back(key(KeyCode::Space));
    } else if (static_cast<unsigned char>(c) > 0x20) {
      out.push_back(KeyPress{KeyCode::Character, c});
    }
    ++i;
  }
  return out;
}

bool parse_key_notation(const std::string& text, std::vector<KeyPress>& out, std::string& error) {
  std::vector<KeyPress> keys;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      size_t close = text.find('>', i + 1);
      if (close == std::string::npos) {
        error = "Unterminated key name in --keys";
        return false;
      }
      const std::string name = text.substr(i + 1, close - i - 1);
      KeyPress press;
      if (!named_key(name, press)) {
        error = "Unknown key name in --keys: <" + name + ">";
        return false;
      }
      keys.push_back(press);
      i = close + 1;
      continue;
    }
    auto decoded = decode_key_bytes(std::string(1, text[i]));
    keys.insert(keys.end(), decoded.begin(), decoded.end());
    ++i;
  }
  out.insert(out.end(), keys.begin(), keys.end());
  return true;
}

}  // namespace reqnav::cli
