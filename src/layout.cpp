#include "multiprogress/layout.hpp"
#include "multiprogress/estimator.hpp"
#include "multiprogress/style.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace multiprogress {

namespace {

bool isContinuationByte(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte offset of the code point at index `count`, or text.size().
std::size_t byteOffset(std::string_view text, std::size_t count) noexcept {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isContinuationByte(text[i])) {
            if (seen == count) {
                return i;
            }
            ++seen;
        }
    }
    return text.size();
}

std::string repeat(const char* glyph, int count) {
    std::string out;
    if (count <= 0) {
        return out;
    }
    const std::string_view piece{glyph};
    out.reserve(piece.size() * static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        out.append(piece);
    }
    return out;
}

} // namespace

LayoutMode selectLayout(int terminal_width) noexcept {
    return terminal_width < min_width_for_bar ? LayoutMode::Compact : LayoutMode::Full;
}

int calculateBarWidth(int terminal_width) noexcept {
    const int width = terminal_width - icon_width - max_description_width - percent_width -
                      time_width - layout_padding;
    return std::clamp(width, min_bar_width, max_bar_width);
}

std::size_t displayWidth(std::string_view text) noexcept {
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](char c) { return !isContinuationByte(c); }));
}

std::string truncateString(std::string_view text, std::size_t max_width) {
    if (displayWidth(text) <= max_width) {
        return std::string{text};
    }
    if (max_width <= 3) {
        return std::string{text.substr(0, byteOffset(text, max_width))};
    }
    std::string out{text.substr(0, byteOffset(text, max_width - 3))};
    out.append("...");
    return out;
}

std::string formatBarContent(TaskStatus status, int bar_width, double progress) {
    if (bar_width <= 0) {
        return {};
    }
    const int filled = std::clamp(static_cast<int>(bar_width * progress / 100.0), 0, bar_width);

    switch (status) {
    case TaskStatus::Success:
        return repeat(style::bar_heavy, bar_width);
    case TaskStatus::Failed:
        return repeat(style::bar_failed_filled, filled) +
               repeat(style::bar_failed_empty, bar_width - filled);
    case TaskStatus::Running:
        if (filled > 0) {
            return repeat(style::bar_heavy, filled - 1) + style::bar_marker +
                   repeat(style::bar_light, bar_width - filled);
        }
        return repeat(style::bar_light, bar_width);
    default:
        return repeat(style::bar_light, bar_width);
    }
}

std::string formatElapsedTime(TaskStatus status, double elapsed_seconds) {
    if (status == TaskStatus::Running || status == TaskStatus::Success ||
        status == TaskStatus::Failed) {
        return fmt::format("{:.1f}s", elapsed_seconds);
    }
    return {};
}

StatusIcon statusIcon(TaskStatus status, std::chrono::system_clock::time_point now) noexcept {
    switch (status) {
    case TaskStatus::Pending:
        return {style::symbol_circle, style::dim};
    case TaskStatus::Running:
        return {spinnerFrame(now), style::cyan};
    case TaskStatus::Success:
        return {style::symbol_check, style::green};
    case TaskStatus::Failed:
        return {style::symbol_cross, style::red};
    case TaskStatus::Skipped:
        return {style::symbol_dash, style::gray};
    }
    return {style::symbol_circle, style::dim};
}

std::string buildFullLine(const TaskSnapshot& task,
                          int terminal_width,
                          std::chrono::system_clock::time_point now) {
    const auto icon = statusIcon(task.status, now);
    const auto description = truncateString(task.description, max_description_width);

    if (task.status == TaskStatus::Pending) {
        return fmt::format("{}{}{} {:<{}}", icon.color, icon.glyph, style::reset,
                           description, description_column);
    }

    const auto bar = formatBarContent(task.status, calculateBarWidth(terminal_width), task.progress);
    return fmt::format("{}{}{} {:<{}} [{}{}{}] {:3.0f}% {}{}{}",
                       icon.color, icon.glyph, style::reset,
                       description, description_column,
                       icon.color, bar, style::reset,
                       task.progress,
                       style::dim, formatElapsedTime(task.status, task.elapsed_seconds), style::reset);
}

std::string buildCompactLine(const TaskSnapshot& task,
                             int terminal_width,
                             std::chrono::system_clock::time_point now) {
    const auto icon = statusIcon(task.status, now);

    // icon(2) + percent(5) + time(6) + spacing leaves the rest for the description.
    const int max_description = std::max(terminal_width - 15, min_compact_description_width);
    const auto description = truncateString(task.description, static_cast<std::size_t>(max_description));

    if (task.status == TaskStatus::Pending) {
        return fmt::format("{}{}{} {}", icon.color, icon.glyph, style::reset, description);
    }

    return fmt::format("{}{}{} {} {:3.0f}% {}{}{}",
                       icon.color, icon.glyph, style::reset,
                       description,
                       task.progress,
                       style::dim, formatElapsedTime(task.status, task.elapsed_seconds), style::reset);
}

std::string buildProgressLine(const TaskSnapshot& task,
                              int terminal_width,
                              std::chrono::system_clock::time_point now) {
    if (selectLayout(terminal_width) == LayoutMode::Compact) {
        return buildCompactLine(task, terminal_width, now);
    }
    return buildFullLine(task, terminal_width, now);
}

std::string formatErrorLine(std::string_view message, int terminal_width) {
    const auto max_width = static_cast<std::size_t>(std::max(terminal_width - 6, 0));
    return fmt::format("   {}{}{}", style::red, truncateString(message, max_width), style::reset);
}

} // namespace multiprogress
