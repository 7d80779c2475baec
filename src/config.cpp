#include "multiprogress/config.hpp"

#include <cstdlib>
#include <string_view>

namespace multiprogress {

ProgressConfig ProgressConfig::fromEnvironment() {
    ProgressConfig config;
    const auto geometry = resolveTerminalGeometry(std::getenv(columns_env_var));
    config.terminal_width = geometry.width;
    config.width_source = geometry.source;
    config.debug = parseDebugFlag(std::getenv(debug_env_var));
    return config;
}

ProgressConfig ProgressConfig::withWidth(int width) const {
    ProgressConfig config = *this;
    config.terminal_width = width > 0 ? width : default_terminal_width;
    config.width_source = width > 0 ? WidthSource::Explicit : WidthSource::Default;
    return config;
}

bool parseDebugFlag(const char* value) noexcept {
    if (!value) {
        return false;
    }
    const std::string_view flag{value};
    return flag == "true" || flag == "1";
}

} // namespace multiprogress
