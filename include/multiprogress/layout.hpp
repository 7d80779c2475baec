#pragma once

#include "progress.hpp"
#include "task_status.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace multiprogress {

// Narrower terminals get the compact layout, which has no bar.
inline constexpr int min_width_for_bar = 70;

inline constexpr int icon_width = 2;
inline constexpr int percent_width = 5;
inline constexpr int time_width = 6;
inline constexpr int layout_padding = 3;
inline constexpr int max_description_width = 20;
inline constexpr int description_column = 25;
inline constexpr int min_bar_width = 15;
inline constexpr int max_bar_width = 30;
inline constexpr int min_compact_description_width = 10;

enum class LayoutMode {
    Full,
    Compact,
};

struct StatusIcon {
    const char* glyph;
    const char* color;
};

[[nodiscard]] LayoutMode selectLayout(int terminal_width) noexcept;
[[nodiscard]] int calculateBarWidth(int terminal_width) noexcept;

// Counts UTF-8 code points, which is what the terminal advances by for the
// glyphs used here.
[[nodiscard]] std::size_t displayWidth(std::string_view text) noexcept;

[[nodiscard]] std::string truncateString(std::string_view text, std::size_t max_width);

// Always exactly `bar_width` glyphs wide.
[[nodiscard]] std::string formatBarContent(TaskStatus status, int bar_width, double progress);

[[nodiscard]] std::string formatElapsedTime(TaskStatus status, double elapsed_seconds);
[[nodiscard]] StatusIcon statusIcon(TaskStatus status, std::chrono::system_clock::time_point now) noexcept;

[[nodiscard]] std::string buildFullLine(const TaskSnapshot& task,
                                        int terminal_width,
                                        std::chrono::system_clock::time_point now);
[[nodiscard]] std::string buildCompactLine(const TaskSnapshot& task,
                                           int terminal_width,
                                           std::chrono::system_clock::time_point now);

// Picks the layout for `terminal_width`.
[[nodiscard]] std::string buildProgressLine(const TaskSnapshot& task,
                                            int terminal_width,
                                            std::chrono::system_clock::time_point now);

[[nodiscard]] std::string formatErrorLine(std::string_view message, int terminal_width);

} // namespace multiprogress
