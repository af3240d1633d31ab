#pragma once

#include <string>
#include <string_view>

namespace reqnav::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(std::string_view s);
/// Converts a string to uppercase for method comparisons.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
/// Inputs are strings; outputs are uppercase strings with no side effects.
std::string to_upper(std::string_view s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Reports whether `needle_lower` occurs in `haystack`, ignoring ASCII case.
/// MUST be given an already-lowercased needle; an empty needle always matches.
bool contains_lowered(std::string_view haystack, std::string_view needle_lower);

}  // namespace reqnav::util
