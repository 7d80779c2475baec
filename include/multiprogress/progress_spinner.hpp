#pragma once

#include "estimator.hpp"
#include "progress.hpp"
#include "task_status.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace multiprogress {

// Progress record of one task. Every call locks the task's own mutex for its duration only.
class ProgressSpinner {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressSpinner(std::string description, EstimatorSettings settings = {});

    ProgressSpinner(const ProgressSpinner&) = delete;
    ProgressSpinner& operator=(const ProgressSpinner&) = delete;

    // Enters Running and restarts the timer.
    void start();

    // Enters Success at 100%, whatever the previous status.
    void complete();

    // Enters Failed; progress freezes at the byte-based estimate, at most 100%.
    void fail(std::string message);

    // Enters Skipped at 0%.
    void skip();

    void increment();
    void addBytes(std::uint64_t n);

    [[nodiscard]] bool isIncomplete() const;

    // Completes a task left Pending or Running; terminal tasks are left alone.
    void finalize();

    // Live view: runs the estimator and keeps the stored progress monotonic.
    [[nodiscard]] TaskSnapshot sample(Clock::time_point now);

    // Final view: reports the stored progress without estimating.
    [[nodiscard]] TaskSnapshot frozen(Clock::time_point now) const;

    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] TaskStatus status() const;
    [[nodiscard]] std::uint64_t bytesWritten() const;
    [[nodiscard]] double finalProgress() const;
    [[nodiscard]] std::string errorMessage() const;
    [[nodiscard]] Clock::time_point startTime() const;

    // Clock::time_point{} until a terminal transition.
    [[nodiscard]] Clock::time_point endTime() const;

private:
    [[nodiscard]] bool isIncompleteLocked() const noexcept;
    [[nodiscard]] double elapsedSecondsLocked(Clock::time_point now) const noexcept;
    [[nodiscard]] TaskSnapshot snapshotLocked(double progress, Clock::time_point now) const;

    const std::string description_;
    const EstimatorSettings settings_;

    mutable std::mutex mutex_;
    TaskStatus status_{TaskStatus::Pending};
    std::uint64_t bytes_written_{0};
    double final_progress_{0.0};
    Clock::time_point start_time_;
    Clock::time_point end_time_{};
    std::string error_message_;
};

using ProgressSpinnerPtr = std::shared_ptr<ProgressSpinner>;

} // namespace multiprogress
