#include "multiprogress/multi_progress.hpp"
#include "multiprogress/layout.hpp"
#include "multiprogress/terminal.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace multiprogress {

MultiProgress::MultiProgress(std::ostream& out, ProgressConfig config)
    : out_(out), config_(std::move(config)) {
    if (config_.debug) {
        fmt::print(stderr, "[DEBUG] Terminal width: {} columns from {} (using {} mode)\n",
                   config_.terminal_width,
                   toString(config_.width_source),
                   selectLayout(config_.terminal_width) == LayoutMode::Compact ? "compact" : "full");
    }
}

MultiProgress::MultiProgress(ProgressConfig config)
    : MultiProgress(std::cout, std::move(config)) {}

MultiProgress::~MultiProgress() {
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        started = started_;
    }
    if (started) {
        stop();
    }
}

ProgressSpinnerPtr MultiProgress::addBar(const std::string& id, std::string description) {
    auto bar = std::make_shared<ProgressSpinner>(std::move(description), config_.estimator);

    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool inserted = bars_.insert_or_assign(id, bar).second;
        if (inserted) {
            order_.push_back(id);
        }
        replaced = !inserted;
    }

    if (replaced && config_.debug) {
        fmt::print(stderr, "[DEBUG] Replacing progress task '{}'\n", id);
    }
    return bar;
}

ProgressSpinnerPtr MultiProgress::getBar(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = bars_.find(id);
    if (it == bars_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ProgressSpinnerPtr> MultiProgress::bars() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orderedBarsLocked();
}

std::vector<std::string> MultiProgress::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

void MultiProgress::start() {
    std::lock_guard<std::mutex> frame_lock(render_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopped_) {
        return;
    }
    started_ = true;
    last_line_count_ = static_cast<int>(order_.size());

    // The loop blocks on mutex_ until the thread handle is stored, so stop() always sees it.
    hideCursor(out_);
    render_thread_ = std::thread([this] { renderLoop(); });
}

void MultiProgress::stop() {
    std::call_once(stop_once_, [this] {
        std::thread loop;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            loop = std::move(render_thread_);
        }
        stop_signal_.notify_all();
        if (loop.joinable()) {
            loop.join();
        }

        for (const auto& bar : bars()) {
            bar->finalize();
        }

        renderFinal();
        showCursor(out_);
    });
}

bool MultiProgress::isStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

void MultiProgress::renderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        if (stop_signal_.wait_for(lock, config_.refresh_interval, [this] { return stopped_; })) {
            break;
        }
        lock.unlock();
        render();
        lock.lock();
    }
}

void MultiProgress::render() {
    std::lock_guard<std::mutex> frame_lock(render_mutex_);

    // Only references are copied; the collection lock is not held while tasks are sampled.
    std::vector<ProgressSpinnerPtr> bars;
    int previous_lines = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        bars = orderedBarsLocked();
        previous_lines = last_line_count_;
    }

    const auto now = ProgressSpinner::Clock::now();
    std::vector<TaskSnapshot> tasks;
    tasks.reserve(bars.size());
    for (const auto& bar : bars) {
        tasks.push_back(bar->sample(now));
    }

    int line_count = 0;
    writeFrame(composeFrame(tasks, previous_lines, line_count));

    std::lock_guard<std::mutex> lock(mutex_);
    last_line_count_ = line_count;
}

void MultiProgress::renderFinal() {
    std::lock_guard<std::mutex> frame_lock(render_mutex_);

    std::vector<ProgressSpinnerPtr> bars;
    int previous_lines = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bars = orderedBarsLocked();
        previous_lines = last_line_count_;
    }

    const auto now = ProgressSpinner::Clock::now();
    std::vector<TaskSnapshot> tasks;
    tasks.reserve(bars.size());
    for (const auto& bar : bars) {
        tasks.push_back(bar->frozen(now));
    }

    int line_count = 0;
    writeFrame(composeFrame(tasks, previous_lines, line_count));

    std::lock_guard<std::mutex> lock(mutex_);
    last_line_count_ = 0;
}

std::vector<ProgressSpinnerPtr> MultiProgress::orderedBarsLocked() const {
    std::vector<ProgressSpinnerPtr> bars;
    bars.reserve(order_.size());
    for (const auto& id : order_) {
        const auto it = bars_.find(id);
        if (it != bars_.end()) {
            bars.push_back(it->second);
        }
    }
    return bars;
}

std::string MultiProgress::composeFrame(const std::vector<TaskSnapshot>& tasks,
                                        int previous_lines,
                                        int& line_count) const {
    const auto wall_now = std::chrono::system_clock::now();

    std::string frame;
    frame.reserve(tasks.size() * 128 + 32);
    frame += terminal::cursorUp(previous_lines);

    line_count = 0;
    for (const auto& task : tasks) {
        frame += terminal::clear_line;
        frame += buildProgressLine(task, config_.terminal_width, wall_now);
        frame.push_back('\n');
        ++line_count;

        if (task.status == TaskStatus::Failed && !task.error_message.empty()) {
            frame += terminal::clear_line;
            frame += formatErrorLine(task.error_message, config_.terminal_width);
            frame.push_back('\n');
            ++line_count;
        }
    }

    // A shorter frame blanks the rows left over from the previous one.
    for (int i = line_count; i < previous_lines; ++i) {
        frame += terminal::clear_line;
        frame.push_back('\n');
    }
    if (line_count < previous_lines) {
        frame += terminal::cursorUp(previous_lines - line_count);
    }

    return frame;
}

void MultiProgress::writeFrame(const std::string& frame) {
    out_ << frame << std::flush;
}

} // namespace multiprogress
