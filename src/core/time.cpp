#include "outbox/core/time.hpp"

namespace outbox {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

std::int64_t IdGenerator::next() {
    std::lock_guard lock(mutex_);
    std::int64_t stamp = now_ms();
    if (stamp <= last_) {
        stamp = last_ + 1;
    }
    last_ = stamp;
    return stamp;
}

void IdGenerator::observe(std::int64_t stamp) {
    std::lock_guard lock(mutex_);
    if (stamp > last_) {
        last_ = stamp;
    }
}

} // namespace outbox
