#ifndef TODEL_IDS_CLOCK_SOURCE_HEADER
#define TODEL_IDS_CLOCK_SOURCE_HEADER

#include <chrono>
#include <cstdint>

namespace todel {

// 平台纪元：Unix时间 1650000000 秒
constexpr uint64_t kPlatformEpochMs = 1650000000000ULL;

// @brief 时钟接口，返回自平台纪元起经过的毫秒数
// 生成器只通过该接口读取时间，测试中可以替换成可控的时钟
class ClockSource {
   public:
    virtual ~ClockSource() = default;
    virtual uint64_t NowMs() = 0;
};

// 基于std::chrono::system_clock的墙上时钟
class SystemClockSource : public ClockSource {
   public:
    explicit SystemClockSource(uint64_t epoch_ms = kPlatformEpochMs) : epoch_(epoch_ms) {}

    // @brief 当前时间早于纪元时返回0
    uint64_t NowMs() override;

   private:
    std::chrono::milliseconds epoch_;
};

}  // namespace todel

#endif
