#ifndef TODEL_COMMON_CONF_HEADER
#define TODEL_COMMON_CONF_HEADER

// 平台配置文件（JSON格式），各个服务启动时读取
// 文件路径由环境变量TODEL_CONF指定，默认为当前目录下的todel.json

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "ids/clock_source.hpp"
#include "ids/snowflake_id.hpp"

namespace todel {

// 配置读取或校验失败
class ConfError : public std::runtime_error {
   public:
    explicit ConfError(const std::string& what) : std::runtime_error(what) {}
};

// ID生成器相关配置
struct IdsConf {
    std::optional<int64_t> worker_id;  // 未配置时由ResolveWorkerId决定
    uint64_t epoch_ms = kPlatformEpochMs;
    uint64_t max_wait_spins = kDefaultMaxWaitSpins;
};

// REST API服务
struct OprishConf {
    std::optional<std::string> url;
    uint32_t message_limit = 2048;
};

// 网关（websocket）服务
struct PandemoniumConf {
    std::optional<std::string> url;
};

// 文件存储服务
struct EffisConf {
    std::optional<std::string> url;
    std::string file_size = "20MB";
    std::string attachment_file_size = "100MB";
};

struct Conf {
    std::string instance_name;
    std::optional<std::string> description;
    std::string log_level = "info";
    IdsConf ids;
    OprishConf oprish;
    PandemoniumConf pandemonium;
    EffisConf effis;

    // @brief 从文件读取配置并校验，失败时抛出ConfError
    static Conf Load(const std::string& path);

    // @brief 从TODEL_CONF指定的路径读取配置，未设置时读取todel.json
    static Conf LoadFromEnv();

    // @brief 除实例名以外全部使用默认值
    static Conf FromName(std::string instance_name);

    // @brief 解析JSON文本并校验
    // @param source 出错时用于提示的来源名称
    static Conf Parse(const std::string& json_text, const std::string& source = "<string>");

    // @brief 校验各字段，遇到第一个不合法的字段就抛出ConfError
    void Validate() const;

    // @brief 决定本进程的worker id
    // 优先级：ids.worker_id > 环境变量TODEL_WORKER_ID > 由当前时间推导
    // 返回值的范围由UIDGenerator负责检查
    int64_t ResolveWorkerId(ClockSource& clock) const;
};

// @brief 解析"20MB"、"512 KiB"这样的大小描述，单位不区分大小写
// 十进制单位 B/KB/MB/GB/TB，二进制单位 KiB/MiB/GiB/TiB
// 格式错误或溢出时抛出ConfError
uint64_t ParseByteSize(const std::string& size);

// @brief 检查URL，scheme必须为http/https（websocket为ws/wss）
bool IsValidServiceUrl(const std::string& url, bool websocket = false);

// @brief 由当前时间推导worker id（自纪元起的秒数取低10位）
// 多个进程同一秒启动时会冲突，只能作为没有配置时的后备
int64_t DeriveWorkerId(ClockSource& clock);

}  // namespace todel

#endif
