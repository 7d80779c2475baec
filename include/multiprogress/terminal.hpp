#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace multiprogress {

inline constexpr int default_terminal_width = 80;

enum class WidthSource {
    Default,
    Environment,
    Terminal,
    Explicit,
};

struct TerminalGeometry {
    int width{default_terminal_width};
    WidthSource source{WidthSource::Default};
};

[[nodiscard]] std::string_view toString(WidthSource source) noexcept;

// Accepts a decimal column count with nothing after it; zero and negatives are rejected.
[[nodiscard]] std::optional<int> parseColumns(std::string_view text) noexcept;

// Width of the terminal attached to stderr, if there is one.
[[nodiscard]] std::optional<int> queryTerminalWidth() noexcept;

// A non-empty COLUMNS value decides the width on its own: if it does not parse,
// the default is used without asking the terminal.
[[nodiscard]] TerminalGeometry resolveTerminalGeometry(const char* columns_env);

namespace terminal {

inline constexpr const char* hide_cursor = "\033[?25l";
inline constexpr const char* show_cursor = "\033[?25h";
inline constexpr const char* clear_line = "\r\033[2K";

[[nodiscard]] std::string cursorUp(int lines);
[[nodiscard]] std::string cursorDown(int lines);

} // namespace terminal

void hideCursor(std::ostream& out);
void showCursor(std::ostream& out);
void clearLine(std::ostream& out);
void moveCursorUp(std::ostream& out, int lines);
void moveCursorDown(std::ostream& out, int lines);

// Blanks `lines` rows starting at the cursor and returns to the first of them.
void clearLines(std::ostream& out, int lines);

// Reserves rows below the cursor for a display that repaints upwards.
void ensureInitialLines(std::ostream& out, int lines);

} // namespace multiprogress
