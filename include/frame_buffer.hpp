#ifndef WIEGAND_RX_FRAME_BUFFER_HPP
#define WIEGAND_RX_FRAME_BUFFER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "stop_signal.hpp"

namespace wiegand::rx {

using Clock = std::chrono::steady_clock;

/// One observed pulse on a data line.
struct BitEvent {
    uint8_t           bit = 0;
    Clock::time_point timestamp;
};

/// Ordered bits of one completed frame, most significant first.
using Frame = std::vector<uint8_t>;

/// What a boundary wait produced.
enum class BoundaryOutcome {
    Frame,      // silence elapsed with bits buffered
    Overflow,   // silence elapsed but the buffer overflowed, bits dropped
    Stopped     // cancellation was requested
};

struct Boundary {
    BoundaryOutcome outcome = BoundaryOutcome::Stopped;
    Frame           bits;
    std::size_t     dropped = 0;   // bits received while overflowing
};

/// Bits accumulated since the last frame boundary, guarded by one mutex.
///
/// Two states:
///   Idle          - empty buffer, nothing to wait for
///   Accumulating  - bits buffered, silence timer restarted on every bit
/// wait_for_boundary() moves Accumulating -> Idle once `timeout` passes
/// without a new bit.
class FrameBuffer {
public:
    enum class State { Idle, Accumulating };

    explicit FrameBuffer(std::size_t max_bits);

    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;

    /// Append one bit and wake the boundary waiter. last_bit_time() only
    /// moves forward, even if a racing producer stamped its bit earlier.
    /// Bits past max_bits are counted but not stored and mark the frame
    /// as overflowed.
    void append(const BitEvent& ev);

    /// Block until a frame boundary or cancellation.
    Boundary wait_for_boundary(Clock::duration timeout, const StopSignal& stop);

    /// Wake any waiter so it re-checks the stop signal.
    void wake();

    State       state() const;
    /// Bits received since the last boundary, including any past max_bits.
    std::size_t size() const;
    std::size_t max_bits() const noexcept { return max_bits_; }
    Clock::time_point last_bit_time() const;

private:
    const std::size_t       max_bits_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::vector<uint8_t>    bits_;
    std::size_t             received_ = 0;
    Clock::time_point       last_bit_time_{};
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_FRAME_BUFFER_HPP
