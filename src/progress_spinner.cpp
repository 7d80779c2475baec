#include "multiprogress/progress_spinner.hpp"

#include <algorithm>
#include <utility>

namespace multiprogress {

ProgressSpinner::ProgressSpinner(std::string description, EstimatorSettings settings)
    : description_(std::move(description)),
      settings_(settings),
      start_time_(Clock::now()) {}

void ProgressSpinner::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = TaskStatus::Running;
    start_time_ = Clock::now();
}

void ProgressSpinner::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    final_progress_ = 100.0;
    end_time_ = Clock::now();
    status_ = TaskStatus::Success;
}

void ProgressSpinner::fail(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    final_progress_ = std::min(progressFromBytes(bytes_written_, settings_), 100.0);
    error_message_ = std::move(message);
    end_time_ = Clock::now();
    status_ = TaskStatus::Failed;
}

void ProgressSpinner::skip() {
    std::lock_guard<std::mutex> lock(mutex_);
    final_progress_ = 0.0;
    end_time_ = Clock::now();
    status_ = TaskStatus::Skipped;
}

void ProgressSpinner::increment() {
    addBytes(bytes_per_increment);
}

void ProgressSpinner::addBytes(std::uint64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_written_ += n;
}

bool ProgressSpinner::isIncomplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isIncompleteLocked();
}

void ProgressSpinner::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isIncompleteLocked()) {
        final_progress_ = 100.0;
        end_time_ = Clock::now();
        status_ = TaskStatus::Success;
    }
}

TaskSnapshot ProgressSpinner::sample(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double elapsed = elapsedSecondsLocked(now);
    const double progress =
        estimateProgress(status_, bytes_written_, elapsed, final_progress_, settings_);
    if (!isTerminal(status_) && progress > final_progress_) {
        final_progress_ = progress;
    }
    return snapshotLocked(progress, now);
}

TaskSnapshot ProgressSpinner::frozen(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked(final_progress_, now);
}

TaskStatus ProgressSpinner::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::uint64_t ProgressSpinner::bytesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

double ProgressSpinner::finalProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_progress_;
}

std::string ProgressSpinner::errorMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

ProgressSpinner::Clock::time_point ProgressSpinner::startTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_time_;
}

ProgressSpinner::Clock::time_point ProgressSpinner::endTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

bool ProgressSpinner::isIncompleteLocked() const noexcept {
    return status_ == TaskStatus::Pending || status_ == TaskStatus::Running;
}

double ProgressSpinner::elapsedSecondsLocked(Clock::time_point now) const noexcept {
    using Seconds = std::chrono::duration<double>;
    if (status_ == TaskStatus::Success || status_ == TaskStatus::Failed) {
        return std::chrono::duration_cast<Seconds>(end_time_ - start_time_).count();
    }
    return std::chrono::duration_cast<Seconds>(now - start_time_).count();
}

TaskSnapshot ProgressSpinner::snapshotLocked(double progress, Clock::time_point now) const {
    return {
        description_,
        status_,
        bytes_written_,
        progress,
        elapsedSecondsLocked(now),
        error_message_
    };
}

} // namespace multiprogress
