#ifndef TODEL_IDS_ID_ERROR_HEADER
#define TODEL_IDS_ID_ERROR_HEADER

#include <cstdint>
#include <stdexcept>
#include <string>

namespace todel {

// ID生成相关错误的基类，均为致命错误，生成器内部不会重试
class IdError : public std::runtime_error {
   public:
    explicit IdError(const std::string& what) : std::runtime_error(what) {}
};

// 构造时worker id超出[0, 1023]
class InvalidWorkerId : public IdError {
   public:
    explicit InvalidWorkerId(int64_t worker_id)
        : IdError("Invalid worker id " + std::to_string(worker_id) + ", must be in [0, 1023]"),
          worker_id_(worker_id) {}

    int64_t WorkerId() const { return worker_id_; }

   private:
    int64_t worker_id_;
};

// 时钟回拨，或者序列号耗尽后等待时钟前进超出了重试预算
// drift为0时表示时钟停滞
class ClockRegression : public IdError {
   public:
    ClockRegression(uint64_t drift_ms, const std::string& what) : IdError(what), drift_ms_(drift_ms) {}

    uint64_t DriftMs() const { return drift_ms_; }
    bool Stalled() const { return drift_ms_ == 0; }

   private:
    uint64_t drift_ms_;
};

}  // namespace todel

#endif
