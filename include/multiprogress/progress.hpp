#pragma once

#include "task_status.hpp"

#include <cstdint>
#include <string>

namespace multiprogress {

// One task as seen by the renderer at a single instant.
struct TaskSnapshot {
    std::string description;
    TaskStatus status{TaskStatus::Pending};
    std::uint64_t bytes_written{0};
    double progress{0.0};
    double elapsed_seconds{0.0};
    std::string error_message;
};

} // namespace multiprogress
