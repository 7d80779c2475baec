#include "multiprogress/summary.hpp"
#include "multiprogress/style.hpp"

#include <fmt/format.h>

namespace multiprogress {

std::string formatStatusLine(const StatusLine& line) {
    if (line.success) {
        return fmt::format("{}{}{} {}", style::green, style::symbol_check, style::reset, line.description);
    }
    return fmt::format("{}{}{} {}", style::red, style::symbol_cross, style::reset, line.description);
}

std::string formatStatusLines(const std::vector<StatusLine>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out += formatStatusLine(lines[i]);
        if (i + 1 < lines.size()) {
            out.push_back('\n');
        }
    }
    return out;
}

void printStatus(std::ostream& out, std::string_view description, bool success) {
    out << formatStatusLine({std::string{description}, success}) << '\n';
}

void printSummary(std::ostream& out,
                  std::size_t total,
                  std::size_t succeeded,
                  const std::vector<std::string>& failed_tasks) {
    out << '\n';
    if (succeeded == total) {
        out << fmt::format("{}{}{} Completed {} task(s)\n",
                           style::green, style::symbol_check, style::reset, total);
        return;
    }

    out << fmt::format("{}{}{} Failed {} task(s)\n",
                       style::red, style::symbol_cross, style::reset, total - succeeded);
    for (const auto& task : failed_tasks) {
        out << fmt::format("  {}{}{} {}\n", style::dim, style::symbol_dot, style::reset, task);
    }
}

} // namespace multiprogress
