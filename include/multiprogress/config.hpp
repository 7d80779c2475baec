#pragma once

#include "estimator.hpp"
#include "terminal.hpp"

#include <chrono>

namespace multiprogress {

inline constexpr const char* columns_env_var = "COLUMNS";
inline constexpr const char* debug_env_var = "MULTIPROGRESS_DEBUG";
inline constexpr std::chrono::milliseconds default_refresh_interval{250};

struct ProgressConfig {
    int terminal_width{default_terminal_width};
    WidthSource width_source{WidthSource::Default};
    std::chrono::milliseconds refresh_interval{default_refresh_interval};
    EstimatorSettings estimator{};
    bool debug{false};

    // Width from COLUMNS or the terminal, debug flag from MULTIPROGRESS_DEBUG.
    [[nodiscard]] static ProgressConfig fromEnvironment();

    [[nodiscard]] ProgressConfig withWidth(int width) const;
};

// "true" and "1" enable debug output; anything else, including unset, does not.
[[nodiscard]] bool parseDebugFlag(const char* value) noexcept;

} // namespace multiprogress
