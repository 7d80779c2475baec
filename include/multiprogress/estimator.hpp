#pragma once

#include "task_status.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace multiprogress {

inline constexpr std::uint64_t default_estimated_total_bytes = 10 * 1024 * 1024;
inline constexpr double default_estimated_completion_seconds = 30.0;
inline constexpr std::uint64_t bytes_per_increment = 1024;

// Only an explicit complete() reaches 100%.
inline constexpr double progress_cap_running = 95.0;
inline constexpr double progress_cap_time_estimate = 90.0;

inline constexpr std::chrono::milliseconds spinner_frame_interval{80};

struct EstimatorSettings {
    std::uint64_t estimated_total_bytes{default_estimated_total_bytes};
    double estimated_completion_seconds{default_estimated_completion_seconds};
};

// Uncapped percentage of the expected output volume.
[[nodiscard]] double progressFromBytes(std::uint64_t bytes_written,
                                       const EstimatorSettings& settings) noexcept;

// Terminal states report `previous_progress` untouched and Pending reports 0.
// A running task is measured by bytes when it has produced any, otherwise by
// elapsed time; the result is never below `previous_progress`.
[[nodiscard]] double estimateProgress(TaskStatus status,
                                      std::uint64_t bytes_written,
                                      double elapsed_seconds,
                                      double previous_progress,
                                      const EstimatorSettings& settings) noexcept;

[[nodiscard]] std::size_t spinnerFrameIndex(std::chrono::system_clock::time_point when) noexcept;
[[nodiscard]] const char* spinnerFrame(std::chrono::system_clock::time_point when) noexcept;

} // namespace multiprogress
