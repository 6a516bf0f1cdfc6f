#ifndef TODEL_IDS_SNOWFLAKE_ID_HEADER
#define TODEL_IDS_SNOWFLAKE_ID_HEADER

// 分布式唯一ID（snowflake）生成器
// 64位布局，高位在前：42bit 毫秒时间戳 | 10bit worker id | 12bit 同一毫秒内的序列号
// 时间戳从平台纪元起算，42bit 约可使用139年，不做运行时检查

#include <cstdint>
#include <memory>
#include <mutex>

#include "ids/clock_source.hpp"
#include "ids/id_error.hpp"
#include "utils/util_class.hpp"

namespace todel {

constexpr int kTimestampBits = 42;
constexpr int kWorkerIdBits = 10;
constexpr int kSequenceBits = 12;

constexpr int kWorkerIdShift = kSequenceBits;
constexpr int kTimestampShift = kSequenceBits + kWorkerIdBits;

constexpr uint64_t kTimestampMask = (1ULL << kTimestampBits) - 1;
constexpr int64_t kMaxWorkerId = (1 << kWorkerIdBits) - 1;    // 1023
constexpr uint16_t kMaxSequence = (1 << kSequenceBits) - 1;   // 4095

// 序列号耗尽时，等待时钟前进所允许的最大读时钟次数
constexpr uint64_t kDefaultMaxWaitSpins = 1ULL << 20;

// 一个ID拆解后的各字段
struct UIDParts {
    uint64_t timestamp{0};  // 自纪元起的毫秒数
    uint16_t worker_id{0};
    uint16_t sequence{0};

    // @brief 将时间戳字段换算回Unix毫秒
    uint64_t UnixMillis(uint64_t epoch_ms = kPlatformEpochMs) const { return timestamp + epoch_ms; }

    bool operator==(const UIDParts& rhs) const {
        return timestamp == rhs.timestamp && worker_id == rhs.worker_id && sequence == rhs.sequence;
    }
    bool operator!=(const UIDParts& rhs) const { return !(*this == rhs); }
};

// @brief 按位布局打包各字段，超出位宽的部分会被截掉
uint64_t ComposeUID(const UIDParts& parts);

class UIDGenerator : public Noncopyable {
   public:
    // @brief 创建生成器
    // @param worker_id 本进程的worker id，必须在[0, 1023]内，否则抛出InvalidWorkerId
    // @param clock 时钟来源，默认使用以kPlatformEpochMs为纪元的系统时钟
    //        配置了ids.epoch_ms的服务必须传入SystemClockSource(conf.ids.epoch_ms)，否则纪元不一致
    // @param max_wait_spins 序列号耗尽时等待下一毫秒的最大读时钟次数，必须大于0
    explicit UIDGenerator(int64_t worker_id,
                          std::shared_ptr<ClockSource> clock = std::make_shared<SystemClockSource>(),
                          uint64_t max_wait_spins = kDefaultMaxWaitSpins);

    // @brief 生成下一个ID，线程安全
    // 时钟回拨或者等待超出预算时抛出ClockRegression，不会返回重复或更小的ID
    uint64_t Generate();

    // @brief 拆解ID，任何64位值都有确定的结果
    static UIDParts Decompose(uint64_t id);

    uint16_t WorkerId() const { return worker_id_; }

   private:
    // @brief 自旋直到时钟越过last_ts，调用时必须持有mtx_
    uint64_t WaitNextMs(uint64_t last_ts);

    const uint16_t worker_id_;
    const uint64_t max_wait_spins_;
    std::shared_ptr<ClockSource> clock_;

    // 以下状态由mtx_保护
    bool started_{false};
    uint16_t seq_{0};
    uint64_t last_ts_{0};
    std::mutex mtx_;
};

}  // namespace todel

#endif
