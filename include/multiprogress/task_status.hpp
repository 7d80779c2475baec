#pragma once

#include <string_view>

namespace multiprogress {

enum class TaskStatus {
    Pending,
    Running,
    Success,
    Failed,
    Skipped,
};

// Success, Failed and Skipped are final; no further transitions are rendered.
[[nodiscard]] constexpr bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Success || status == TaskStatus::Failed ||
           status == TaskStatus::Skipped;
}

[[nodiscard]] constexpr std::string_view toString(TaskStatus status) noexcept {
    switch (status) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Running:
        return "running";
    case TaskStatus::Success:
        return "success";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

} // namespace multiprogress
