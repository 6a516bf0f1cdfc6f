#include "log/log_manager.hpp"

#include <stdexcept>

namespace todel {

bool IsValidLogLevel(const std::string& level_name) {
    // from_str对未知名称返回off，所以off要单独判断
    return level_name == "off" || spdlog::level::from_str(level_name) != spdlog::level::off;
}

void SetLogLevel(const std::string& level_name) {
    if (!IsValidLogLevel(level_name)) {
        throw std::invalid_argument("Unknown log level " + level_name);
    }
    spdlog::set_level(spdlog::level::from_str(level_name));
}

}  // namespace todel
