#pragma once

#include <array>
#include <cstddef>

// Color and glyph palette shared by the renderer and the summary helpers.
namespace multiprogress::style {

inline constexpr const char* reset = "\033[0m";
inline constexpr const char* bold = "\033[1m";
inline constexpr const char* dim = "\033[2m";

inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* yellow = "\033[33m";
inline constexpr const char* cyan = "\033[36m";
inline constexpr const char* gray = "\033[90m";

inline constexpr const char* symbol_check = "✓";
inline constexpr const char* symbol_cross = "✗";
inline constexpr const char* symbol_dot = "•";
inline constexpr const char* symbol_circle = "○";
inline constexpr const char* symbol_dash = "-";

inline constexpr std::array<const char*, 10> spinner_frames = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

// Bar glyphs.
inline constexpr const char* bar_heavy = "━";
inline constexpr const char* bar_light = "─";
inline constexpr const char* bar_marker = "▶";
inline constexpr const char* bar_failed_filled = "╍";
inline constexpr const char* bar_failed_empty = "╌";

} // namespace multiprogress::style
