#pragma once

#include <chrono>

// Single-shot retransmission timer. arm() starts one wait cycle; the owner
// polls remaining() for each blocking receive and treats expired() as
// "resend and start the next cycle". No backoff.
class RetransmitTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit RetransmitTimer(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    void arm();
    void disarm() { armed_ = false; }

    bool armed() const { return armed_; }
    bool expired() const;

    // Time left in the current cycle, clamped at zero. Zero when disarmed.
    std::chrono::milliseconds remaining() const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    Clock::time_point deadline_{};
    bool armed_ = false;
};
