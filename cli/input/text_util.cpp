#include "input/text_util.h"

#include <algorithm>

namespace reqnav::cli {

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

uint32_t decode_utf8(const std::string& s, size_t i, size_t* bytes) {
  size_t used = 1;
  uint32_t cp = kReplacementChar;
  const unsigned char c0 = static_cast<unsigned char>(s[i]);
  if (c0 < 0x80) {
    cp = c0;
  } else if ((c0 & 0xE0) == 0xC0 && i + 1 < s.size() &&
             is_continuation(static_cast<unsigned char>(s[i + 1]))) {
    cp = ((c0 & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
    used = 2;
  } else if ((c0 & 0xF0) == 0xE0 && i + 2 < s.size() &&
             is_continuation(static_cast<unsigned char>(s[i + 1])) &&
             is_continuation(static_cast<unsigned char>(s[i + 2]))) {
    cp = ((c0 & 0x0Fu) << 12) | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 6) |
         (static_cast<unsigned char>(s[i + 2]) & 0x3Fu);
    used = 3;
  } else if ((c0 & 0xF8) == 0xF0 && i + 3 < s.size() &&
             is_continuation(static_cast<unsigned char>(s[i + 1])) &&
             is_continuation(static_cast<unsigned char>(s[i + 2])) &&
             is_continuation(static_cast<unsigned char>(s[i + 3]))) {
    cp = ((c0 & 0x07u) << 18) | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 12) |
         ((static_cast<unsigned char>(s[i + 2]) & 0x3Fu) << 6) |
         (static_cast<unsigned char>(s[i + 3]) & 0x3Fu);
    used = 4;
  }
  if (bytes) *bytes = used;
  return cp;
}

int display_width(uint32_t cp) {
  if (cp == 0) return 0;
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
  if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x200B && cp <= 0x200F) ||
      (cp >= 0xFE00 && cp <= 0xFE0F)) {
    return 0;
  }
  if ((cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0xA4CF) ||
      (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) ||
      (cp >= 0xFF00 && cp <= 0xFF60) || (cp >= 0xFFE0 && cp <= 0xFFE6) ||
      (cp >= 0x1F300 && cp <= 0x1FAFF) || (cp >= 0x20000 && cp <= 0x3FFFD)) {
    return 2;
  }
  return 1;
}

size_t column_width(const std::string& s, size_t start, size_t end) {
  size_t width = 0;
  size_t i = start;
  end = std::min(end, s.size());
  while (i < end) {
    size_t bytes = 0;
    uint32_t cp = decode_utf8(s, i, &bytes);
    width += static_cast<size_t>(display_width(cp));
    i += bytes ? bytes : 1;
  }
  return width;
}

std::string truncate_display_width(const std::string& text, size_t width) {
  if (width == 0) return "";
  if (column_width(text, 0, text.size()) <= width) return text;
  if (width <= 3) return std::string(width, '.');
  const size_t content_limit = width - 3;
  size_t i = 0;
  size_t used = 0;
  while (i < text.size()) {
    size_t bytes = 0;
    uint32_t cp = decode_utf8(text, i, &bytes);
    const size_t cp_width = static_cast<size_t>(display_width(cp));
    if (used + cp_width > content_limit) break;
    used += cp_width;
    i += bytes ? bytes : 1;
  }
  return text.substr(0, i) + "...";
}

std::string pad_display_width(const std::string& text, size_t width) {
  std::string out = truncate_display_width(text, width);
  size_t used = column_width(out, 0, out.size());
  if (used < width) out.append(width - used, ' ');
  return out;
}

std::string repeat_utf8(const std::string& token, size_t count) {
  std::string out;
  out.reserve(token.size() * count);
  for (size_t i = 0; i < count; ++i) out += token;
  return out;
}

}  // namespace reqnav::cli
