#include <gtest/gtest.h>
#include "multiprogress/layout.hpp"
#include "multiprogress/style.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

using namespace multiprogress;

namespace {

std::size_t countGlyph(const std::string& text, const std::string& glyph) {
    std::size_t count = 0;
    for (auto pos = text.find(glyph); pos != std::string::npos; pos = text.find(glyph, pos + glyph.size())) {
        ++count;
    }
    return count;
}

TaskSnapshot makeTask(std::string description, TaskStatus status, double progress, double elapsed) {
    TaskSnapshot task;
    task.description = std::move(description);
    task.status = status;
    task.progress = progress;
    task.elapsed_seconds = elapsed;
    return task;
}

} // namespace

class LayoutTest : public ::testing::Test {
protected:
    const std::chrono::system_clock::time_point now_ = std::chrono::system_clock::now();
};

TEST_F(LayoutTest, NarrowTerminalsUseCompactLayout) {
    EXPECT_EQ(selectLayout(40), LayoutMode::Compact);
    EXPECT_EQ(selectLayout(69), LayoutMode::Compact);
    EXPECT_EQ(selectLayout(70), LayoutMode::Full);
    EXPECT_EQ(selectLayout(200), LayoutMode::Full);
}

TEST_F(LayoutTest, BarWidthIsClamped) {
    EXPECT_EQ(calculateBarWidth(40), min_bar_width);
    EXPECT_EQ(calculateBarWidth(200), max_bar_width);

    const int normal = calculateBarWidth(80);
    EXPECT_GE(normal, min_bar_width);
    EXPECT_LE(normal, max_bar_width);

    // 60 columns minus the fixed 36 columns of overhead.
    EXPECT_EQ(calculateBarWidth(60), 24);
}

TEST_F(LayoutTest, BarContentHasExactWidthForEveryStatus) {
    const TaskStatus statuses[] = {TaskStatus::Pending, TaskStatus::Running, TaskStatus::Success,
                                   TaskStatus::Failed, TaskStatus::Skipped};
    for (const auto status : statuses) {
        for (int width = min_bar_width; width <= max_bar_width; ++width) {
            for (int percent = 0; percent <= 100; percent += 5) {
                const auto bar = formatBarContent(status, width, percent);
                ASSERT_EQ(displayWidth(bar), static_cast<std::size_t>(width))
                    << toString(status) << " width=" << width << " percent=" << percent;
            }
        }
    }
}

TEST_F(LayoutTest, SuccessBarIsFullyFilled) {
    const auto bar = formatBarContent(TaskStatus::Success, 20, 100.0);
    EXPECT_EQ(countGlyph(bar, style::bar_heavy), 20u);
}

TEST_F(LayoutTest, RunningBarEndsWithMarker) {
    const auto bar = formatBarContent(TaskStatus::Running, 20, 50.0);
    EXPECT_EQ(countGlyph(bar, style::bar_heavy), 9u);
    EXPECT_EQ(countGlyph(bar, style::bar_marker), 1u);
    EXPECT_EQ(countGlyph(bar, style::bar_light), 10u);

    const auto empty = formatBarContent(TaskStatus::Running, 20, 0.0);
    EXPECT_EQ(countGlyph(empty, style::bar_light), 20u);
}

TEST_F(LayoutTest, FailedBarShowsProgressAtFailure) {
    const auto bar = formatBarContent(TaskStatus::Failed, 20, 25.0);
    EXPECT_EQ(countGlyph(bar, style::bar_failed_filled), 5u);
    EXPECT_EQ(countGlyph(bar, style::bar_failed_empty), 15u);
}

TEST_F(LayoutTest, PendingBarIsEmpty) {
    const auto bar = formatBarContent(TaskStatus::Pending, 20, 0.0);
    EXPECT_EQ(countGlyph(bar, style::bar_light), 20u);
}

TEST_F(LayoutTest, OutOfRangeProgressIsClamped) {
    EXPECT_EQ(displayWidth(formatBarContent(TaskStatus::Running, 15, 250.0)), 15u);
    EXPECT_EQ(displayWidth(formatBarContent(TaskStatus::Failed, 15, -10.0)), 15u);
    EXPECT_TRUE(formatBarContent(TaskStatus::Running, 0, 50.0).empty());
}

TEST_F(LayoutTest, TruncateString) {
    EXPECT_EQ(truncateString("hello", 10), "hello");
    EXPECT_EQ(truncateString("hello", 5), "hello");
    EXPECT_EQ(truncateString("hello world", 8), "hello...");
    EXPECT_EQ(truncateString("hello", 3), "hel");
    EXPECT_EQ(truncateString("", 10), "");
}

TEST_F(LayoutTest, TruncateStringKeepsCodePointsWhole) {
    const std::string accented = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"; // "ééééé"
    const auto cut = truncateString(accented, 4);
    EXPECT_EQ(cut, "\xC3\xA9...");
    EXPECT_EQ(displayWidth(cut), 4u);
}

TEST_F(LayoutTest, ElapsedTimeShownForActiveAndFinishedTasks) {
    EXPECT_EQ(formatElapsedTime(TaskStatus::Success, 5.3), "5.3s");
    EXPECT_EQ(formatElapsedTime(TaskStatus::Running, 12.7), "12.7s");
    EXPECT_EQ(formatElapsedTime(TaskStatus::Failed, 0.04), "0.0s");
    EXPECT_EQ(formatElapsedTime(TaskStatus::Pending, 3.0), "");
    EXPECT_EQ(formatElapsedTime(TaskStatus::Skipped, 3.0), "");
}

TEST_F(LayoutTest, StatusIcons) {
    EXPECT_STREQ(statusIcon(TaskStatus::Pending, now_).glyph, style::symbol_circle);
    EXPECT_STREQ(statusIcon(TaskStatus::Pending, now_).color, style::dim);
    EXPECT_STREQ(statusIcon(TaskStatus::Success, now_).glyph, style::symbol_check);
    EXPECT_STREQ(statusIcon(TaskStatus::Success, now_).color, style::green);
    EXPECT_STREQ(statusIcon(TaskStatus::Failed, now_).glyph, style::symbol_cross);
    EXPECT_STREQ(statusIcon(TaskStatus::Failed, now_).color, style::red);
    EXPECT_STREQ(statusIcon(TaskStatus::Skipped, now_).glyph, style::symbol_dash);
    EXPECT_STREQ(statusIcon(TaskStatus::Skipped, now_).color, style::gray);

    const auto running = statusIcon(TaskStatus::Running, now_);
    EXPECT_STREQ(running.color, style::cyan);
    const bool is_frame = std::any_of(style::spinner_frames.begin(), style::spinner_frames.end(),
                                      [&](const char* glyph) { return std::string{glyph} == running.glyph; });
    EXPECT_TRUE(is_frame);
}

TEST_F(LayoutTest, FullLineForRunningTask) {
    const auto line = buildProgressLine(makeTask("Building project", TaskStatus::Running, 50.0, 5.5), 80, now_);
    EXPECT_NE(line.find("Building project"), std::string::npos);
    EXPECT_NE(line.find(" 50%"), std::string::npos);
    EXPECT_NE(line.find("5.5s"), std::string::npos);
    EXPECT_NE(line.find(style::bar_marker), std::string::npos);
    EXPECT_NE(line.find(" ["), std::string::npos);
}

TEST_F(LayoutTest, FullLineForCompletedTask) {
    const auto line = buildProgressLine(makeTask("Tests passed", TaskStatus::Success, 100.0, 10.2), 120, now_);
    EXPECT_NE(line.find("Tests passed"), std::string::npos);
    EXPECT_NE(line.find("100%"), std::string::npos);
    EXPECT_NE(line.find("10.2s"), std::string::npos);
    EXPECT_EQ(countGlyph(line, style::bar_heavy), static_cast<std::size_t>(max_bar_width));
}

TEST_F(LayoutTest, PendingLineHasNoBarOrPercent) {
    const auto line = buildProgressLine(makeTask("Installing npm", TaskStatus::Pending, 0.0, 0.0), 80, now_);
    EXPECT_NE(line.find("Installing npm"), std::string::npos);
    EXPECT_EQ(line.find('%'), std::string::npos);
    EXPECT_EQ(line.find(" ["), std::string::npos);
}

TEST_F(LayoutTest, FullLineTruncatesLongDescriptions) {
    const auto line = buildProgressLine(
        makeTask("a-very-long-package-name-that-overflows", TaskStatus::Running, 10.0, 1.0), 100, now_);
    EXPECT_NE(line.find("a-very-long-packa..."), std::string::npos);
    EXPECT_EQ(line.find("overflows"), std::string::npos);
}

TEST_F(LayoutTest, CompactLineOmitsBar) {
    const auto line = buildProgressLine(makeTask("Building project", TaskStatus::Running, 50.0, 5.5), 50, now_);
    EXPECT_NE(line.find("Building project"), std::string::npos);
    EXPECT_NE(line.find("50%"), std::string::npos);
    EXPECT_NE(line.find("5.5s"), std::string::npos);
    EXPECT_EQ(line.find(" ["), std::string::npos);
    EXPECT_EQ(line.find(style::bar_marker), std::string::npos);
}

TEST_F(LayoutTest, CompactLineDescriptionFitsTerminal) {
    const std::string description(60, 'x');
    const auto line = buildCompactLine(makeTask(description, TaskStatus::Success, 100.0, 1.0), 40, now_);
    EXPECT_NE(line.find(std::string(22, 'x') + "..."), std::string::npos);
    EXPECT_EQ(line.find(std::string(26, 'x')), std::string::npos);

    // Very narrow terminals still keep ten columns of description.
    const auto tiny = buildCompactLine(makeTask(description, TaskStatus::Pending, 0.0, 0.0), 12, now_);
    EXPECT_NE(tiny.find(std::string(7, 'x') + "..."), std::string::npos);
}

TEST_F(LayoutTest, ErrorLineIsIndentedAndRed) {
    const std::string message = "Installation failed: network timeout";
    const auto line = formatErrorLine(message, 80);
    EXPECT_EQ(line.rfind("   ", 0), 0u);
    EXPECT_NE(line.find(message), std::string::npos);
    EXPECT_NE(line.find(style::red), std::string::npos);
}

TEST_F(LayoutTest, ErrorLineIsTruncatedToTerminal) {
    const auto line = formatErrorLine("0123456789abcdefghijklmnop", 20);
    EXPECT_NE(line.find("0123456789a..."), std::string::npos);
    EXPECT_EQ(line.find("abcdef"), std::string::npos);
}
