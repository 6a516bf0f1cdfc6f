#ifndef TODEL_LOG_MANAGER_HEADER
#define TODEL_LOG_MANAGER_HEADER

#include <spdlog/spdlog.h>

#include <string>

namespace todel {

// @brief 按名称设置全局日志等级
// @param level_name trace/debug/info/warn/error/critical/off 之一
// 无法识别的名称会抛出std::invalid_argument，不会悄悄回退成默认等级
void SetLogLevel(const std::string& level_name);

// @brief 判断名称是否是合法的spdlog等级
bool IsValidLogLevel(const std::string& level_name);

}  // namespace todel

#endif
