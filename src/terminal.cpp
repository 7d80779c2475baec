#include "multiprogress/terminal.hpp"

#include <charconv>

#include <fmt/format.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace multiprogress {

std::string_view toString(WidthSource source) noexcept {
    switch (source) {
    case WidthSource::Default:
        return "default";
    case WidthSource::Environment:
        return "COLUMNS env var";
    case WidthSource::Terminal:
        return "terminal size query";
    case WidthSource::Explicit:
        return "explicit setting";
    }
    return "unknown";
}

std::optional<int> parseColumns(std::string_view text) noexcept {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> queryTerminalWidth() noexcept {
    struct winsize ws {};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return static_cast<int>(ws.ws_col);
    }
    return std::nullopt;
}

TerminalGeometry resolveTerminalGeometry(const char* columns_env) {
    TerminalGeometry geometry;
    if (columns_env && *columns_env) {
        if (const auto columns = parseColumns(columns_env)) {
            geometry.width = *columns;
            geometry.source = WidthSource::Environment;
        }
        return geometry;
    }

    if (const auto columns = queryTerminalWidth()) {
        geometry.width = *columns;
        geometry.source = WidthSource::Terminal;
    }
    return geometry;
}

namespace terminal {

std::string cursorUp(int lines) {
    if (lines <= 0) {
        return {};
    }
    return fmt::format("\033[{}A", lines);
}

std::string cursorDown(int lines) {
    if (lines <= 0) {
        return {};
    }
    return fmt::format("\033[{}B", lines);
}

} // namespace terminal

void hideCursor(std::ostream& out) {
    out << terminal::hide_cursor << std::flush;
}

void showCursor(std::ostream& out) {
    out << terminal::show_cursor << std::flush;
}

void clearLine(std::ostream& out) {
    out << terminal::clear_line;
}

void moveCursorUp(std::ostream& out, int lines) {
    out << terminal::cursorUp(lines);
}

void moveCursorDown(std::ostream& out, int lines) {
    out << terminal::cursorDown(lines);
}

void clearLines(std::ostream& out, int lines) {
    for (int i = 0; i < lines; ++i) {
        out << "\033[2K";
        if (i < lines - 1) {
            out << '\n';
        }
    }
    if (lines > 1) {
        moveCursorUp(out, lines - 1);
    }
    out << '\r' << std::flush;
}

void ensureInitialLines(std::ostream& out, int lines) {
    for (int i = 0; i < lines; ++i) {
        out << '\n';
    }
    out << std::flush;
}

} // namespace multiprogress
