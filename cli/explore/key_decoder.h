#pragma once

#include <string>
#include <vector>

#include "reqnav/navigator.h"

namespace reqnav::cli {

/// Decodes raw terminal bytes into key presses.
/// Recognises CSI/SS3 arrows, Home, End, and Delete; 127/8 as Backspace;
/// Ctrl-U as ClearAll; CR/LF as Enter. An ESC not followed by '[' or 'O' is
/// a plain Escape. Other control bytes are dropped.
std::vector<KeyPress> decode_key_bytes(const std::string& bytes);

/// Decodes a --keys argument: literal characters plus bracketed names such
/// as <Down>, <Enter>, <Esc>, <BS>, <C-u>, <Space>, <Home>, <End>, <Del>.
/// Names are case-insensitive; an unknown name is an error.
/// MUST return false and set `error` without touching `out` on failure.
bool parse_key_notation(const std::string& text, std::vector<KeyPress>& out, std::string& error);

}  // namespace reqnav::cli
