#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace reqnav::cli {

/// Decodes one UTF-8 code point starting at `i`.
/// MUST report at least one consumed byte for invalid sequences (U+FFFD).
uint32_t decode_utf8(const std::string& s, size_t i, size_t* bytes);
/// Terminal column width of a code point: 0 for combining marks, 2 for wide
/// East Asian ranges, 1 otherwise.
int display_width(uint32_t cp);
/// Column width of `s[start, end)`.
size_t column_width(const std::string& s, size_t start, size_t end);

/// Cuts `text` to `width` columns, ending in "..." when something was dropped.
std::string truncate_display_width(const std::string& text, size_t width);
/// Truncates then pads with spaces to exactly `width` columns.
std::string pad_display_width(const std::string& text, size_t width);
std::string repeat_utf8(const std::string& token, size_t count);

}  // namespace reqnav::cli
