#include "multiprogress/estimator.hpp"
#include "multiprogress/style.hpp"

#include <algorithm>

namespace multiprogress {

double progressFromBytes(std::uint64_t bytes_written, const EstimatorSettings& settings) noexcept {
    if (settings.estimated_total_bytes == 0) {
        return bytes_written > 0 ? 100.0 : 0.0;
    }
    return static_cast<double>(bytes_written) /
           static_cast<double>(settings.estimated_total_bytes) * 100.0;
}

double estimateProgress(TaskStatus status,
                        std::uint64_t bytes_written,
                        double elapsed_seconds,
                        double previous_progress,
                        const EstimatorSettings& settings) noexcept {
    if (isTerminal(status)) {
        return previous_progress;
    }
    if (status == TaskStatus::Pending) {
        return 0.0;
    }

    double percent = 0.0;
    if (bytes_written > 0) {
        percent = std::min(progressFromBytes(bytes_written, settings), progress_cap_running);
    } else if (elapsed_seconds > 0.0) {
        if (settings.estimated_completion_seconds > 0.0) {
            percent = elapsed_seconds / settings.estimated_completion_seconds * 100.0;
        } else {
            percent = progress_cap_time_estimate;
        }
        percent = std::min(percent, progress_cap_time_estimate);
    }

    return std::max(percent, previous_progress);
}

std::size_t spinnerFrameIndex(std::chrono::system_clock::time_point when) noexcept {
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;

    const auto count = static_cast<long long>(style::spinner_frames.size());
    const long long ticks = duration_cast<nanoseconds>(when.time_since_epoch()).count() /
                            duration_cast<nanoseconds>(spinner_frame_interval).count();
    return static_cast<std::size_t>(((ticks % count) + count) % count);
}

const char* spinnerFrame(std::chrono::system_clock::time_point when) noexcept {
    return style::spinner_frames[spinnerFrameIndex(when)];
}

} // namespace multiprogress
