#include "frame_buffer.hpp"

#include <algorithm>

namespace wiegand::rx {

FrameBuffer::FrameBuffer(std::size_t max_bits) : max_bits_(max_bits) {
    bits_.reserve(max_bits_);
}

void FrameBuffer::append(const BitEvent& ev) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (received_ < max_bits_) {
            bits_.push_back(ev.bit);
        }
        ++received_;
        // Two monitors stamp before locking; never let the deadline move back.
        last_bit_time_ = std::max(last_bit_time_, ev.timestamp);
    }
    cv_.notify_all();
}

Boundary FrameBuffer::wait_for_boundary(Clock::duration timeout,
                                        const StopSignal& stop) {
    std::unique_lock<std::mutex> lock(mu_);

    // Idle: sleep until the first bit of a frame.
    cv_.wait(lock, [&] { return stop.stop_requested() || received_ > 0; });

    // Accumulating: every new bit moves the deadline.
    while (!stop.stop_requested()) {
        Clock::time_point deadline = last_bit_time_ + timeout;
        if (Clock::now() >= deadline) break;
        cv_.wait_until(lock, deadline);
    }

    if (stop.stop_requested()) {
        return {BoundaryOutcome::Stopped, {}, 0};
    }

    Boundary result;
    if (received_ > max_bits_) {
        result.outcome = BoundaryOutcome::Overflow;
        result.dropped = received_;
    } else {
        result.outcome = BoundaryOutcome::Frame;
        result.bits    = bits_;
    }
    bits_.clear();
    received_ = 0;
    return result;
}

void FrameBuffer::wake() {
    // Taking the lock orders the wake after any in-progress predicate check.
    { std::lock_guard<std::mutex> lock(mu_); }
    cv_.notify_all();
}

FrameBuffer::State FrameBuffer::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_ > 0 ? State::Accumulating : State::Idle;
}

std::size_t FrameBuffer::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
}

Clock::time_point FrameBuffer::last_bit_time() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_bit_time_;
}

} // namespace wiegand::rx
