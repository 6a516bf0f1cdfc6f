#include "ids/clock_source.hpp"

namespace todel {

uint64_t SystemClockSource::NowMs() {
    auto now = std::chrono::system_clock::now();
    auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) - epoch_;
    if (since.count() < 0) {
        return 0;
    }
    return static_cast<uint64_t>(since.count());
}

}  // namespace todel
