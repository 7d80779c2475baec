#pragma once

#include "config.hpp"
#include "progress.hpp"
#include "progress_spinner.hpp"

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace multiprogress {

// Repaints one line per task, in insertion order, until stop() draws the final frame.
class MultiProgress {
public:
    explicit MultiProgress(std::ostream& out = std::cout,
                           ProgressConfig config = ProgressConfig::fromEnvironment());
    explicit MultiProgress(ProgressConfig config);
    ~MultiProgress();

    MultiProgress(const MultiProgress&) = delete;
    MultiProgress& operator=(const MultiProgress&) = delete;

    // Adds a Pending task. Reusing an id replaces that task but keeps its row.
    ProgressSpinnerPtr addBar(const std::string& id, std::string description);

    // nullptr when `id` is unknown.
    [[nodiscard]] ProgressSpinnerPtr getBar(const std::string& id) const;

    // Tasks in display order.
    [[nodiscard]] std::vector<ProgressSpinnerPtr> bars() const;
    [[nodiscard]] std::vector<std::string> ids() const;

    void start();

    // Safe to call more than once; later calls return after the first finishes.
    void stop();

    // Draws one frame. Does nothing once stopped.
    void render();

    [[nodiscard]] bool isStopped() const;
    [[nodiscard]] int terminalWidth() const noexcept { return config_.terminal_width; }
    [[nodiscard]] const ProgressConfig& config() const noexcept { return config_; }

private:
    void renderLoop();
    void renderFinal();
    [[nodiscard]] std::vector<ProgressSpinnerPtr> orderedBarsLocked() const;
    [[nodiscard]] std::string composeFrame(const std::vector<TaskSnapshot>& tasks,
                                           int previous_lines,
                                           int& line_count) const;
    void writeFrame(const std::string& frame);

    std::ostream& out_;
    const ProgressConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProgressSpinnerPtr> bars_;
    std::vector<std::string> order_;
    int last_line_count_{0};
    bool started_{false};
    bool stopped_{false};

    std::condition_variable stop_signal_;
    std::once_flag stop_once_;
    std::thread render_thread_;

    // Serializes frames written to out_.
    std::mutex render_mutex_;
};

} // namespace multiprogress
