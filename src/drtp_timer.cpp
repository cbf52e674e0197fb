#include "drtp_timer.h"

void RetransmitTimer::arm() {
    deadline_ = Clock::now() + timeout_;
    armed_ = true;
}

bool RetransmitTimer::expired() const {
    return armed_ && Clock::now() >= deadline_;
}

std::chrono::milliseconds RetransmitTimer::remaining() const {
    if (!armed_) return std::chrono::milliseconds(0);
    auto now = Clock::now();
    if (now >= deadline_) return std::chrono::milliseconds(0);
    // Round up so a sub-millisecond remainder still waits instead of spinning.
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
    if (left.count() == 0) return std::chrono::milliseconds(1);
    return left;
}
