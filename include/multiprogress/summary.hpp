#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace multiprogress {

// Final one-line outcome of a task, printed after the progress block is gone.
struct StatusLine {
    std::string description;
    bool success{false};
};

[[nodiscard]] std::string formatStatusLine(const StatusLine& line);

// Lines joined by '\n', without a trailing newline.
[[nodiscard]] std::string formatStatusLines(const std::vector<StatusLine>& lines);

void printStatus(std::ostream& out, std::string_view description, bool success);

void printSummary(std::ostream& out,
                  std::size_t total,
                  std::size_t succeeded,
                  const std::vector<std::string>& failed_tasks);

} // namespace multiprogress
