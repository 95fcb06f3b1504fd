#pragma once

#include <string>

namespace colpick::ui {

/**
 * Display width of a string in terminal cells:
 * - ANSI CSI escape sequences take no space
 * - East Asian wide characters take two cells, combining marks none
 */
int display_cols(const std::string& s);

/**
 * Longest prefix of `s` that fits in `width` cells.
 * Escape sequences are copied through; a wide character that would
 * straddle the limit is dropped.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate with "…" if too long, pad with spaces if too short.
 * Result is exactly `width` display cells.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Truncate with "…" if too long; never pads.
 */
std::string truncate_cols(const std::string& s, int width);

} // namespace colpick::ui
