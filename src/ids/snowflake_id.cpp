#include "ids/snowflake_id.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace todel {

namespace {

// 在初始化列表中校验worker id，不做截断
uint16_t CheckedWorkerId(int64_t worker_id) {
    if (worker_id < 0 || worker_id > kMaxWorkerId) {
        throw InvalidWorkerId(worker_id);
    }
    return static_cast<uint16_t>(worker_id);
}

ClockRegression MakeRegression(uint64_t last_ts, uint64_t ts) {
    uint64_t drift = last_ts - ts;
    spdlog::error("UIDGenerator: clock moved backwards by {} ms (last = {}, now = {})", drift, last_ts, ts);
    return ClockRegression(drift, "Clock moved backwards by " + std::to_string(drift) + " ms");
}

}  // namespace

uint64_t ComposeUID(const UIDParts& parts) {
    return ((parts.timestamp & kTimestampMask) << kTimestampShift) |
           (static_cast<uint64_t>(parts.worker_id & kMaxWorkerId) << kWorkerIdShift) |
           static_cast<uint64_t>(parts.sequence & kMaxSequence);
}

UIDGenerator::UIDGenerator(int64_t worker_id, std::shared_ptr<ClockSource> clock, uint64_t max_wait_spins)
    : worker_id_(CheckedWorkerId(worker_id)), max_wait_spins_(max_wait_spins), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("UIDGenerator requires a clock source");
    }
    if (max_wait_spins_ == 0) {
        throw std::invalid_argument("UIDGenerator max_wait_spins must be positive");
    }
    spdlog::info("UIDGenerator created, worker id = {}", worker_id_);
}

uint64_t UIDGenerator::Generate() {
    std::unique_lock lock(mtx_);
    uint64_t ts = clock_->NowMs();

    if (started_ && ts < last_ts_) {
        // 时钟回拨：既不复用旧时间戳，也不阻塞等待
        throw MakeRegression(last_ts_, ts);
    }

    if (started_ && ts == last_ts_) {
        if (seq_ == kMaxSequence) {
            // 这一毫秒的序列号已用完，等到下一毫秒
            // 等待失败时状态保持不变
            ts = WaitNextMs(last_ts_);
            seq_ = 0;
        } else {
            ++seq_;
        }
    } else {
        seq_ = 0;
    }
    started_ = true;
    last_ts_ = ts;
    return ComposeUID({ts, worker_id_, seq_});
}

UIDParts UIDGenerator::Decompose(uint64_t id) {
    UIDParts parts;
    parts.timestamp = id >> kTimestampShift;
    parts.worker_id = static_cast<uint16_t>((id >> kWorkerIdShift) & kMaxWorkerId);
    parts.sequence = static_cast<uint16_t>(id & kMaxSequence);
    return parts;
}

uint64_t UIDGenerator::WaitNextMs(uint64_t last_ts) {
    for (uint64_t spins = 0; spins < max_wait_spins_; ++spins) {
        uint64_t ts = clock_->NowMs();
        if (ts > last_ts) {
            return ts;
        }
        if (ts < last_ts) {
            throw MakeRegression(last_ts, ts);
        }
    }
    spdlog::error("UIDGenerator: clock did not advance past {} after {} reads", last_ts, max_wait_spins_);
    throw ClockRegression(0, "Clock stalled while waiting for the next millisecond");
}

}  // namespace todel
