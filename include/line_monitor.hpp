#ifndef WIEGAND_RX_LINE_MONITOR_HPP
#define WIEGAND_RX_LINE_MONITOR_HPP

#include <chrono>
#include <cstdint>

#include "frame_buffer.hpp"
#include "input_line.hpp"
#include "stop_signal.hpp"

namespace wiegand::rx {

/// Watches one data line and appends its bit to the frame buffer on
/// every active (Low after edge) transition.
class LineMonitor {
public:
    /// @param line           Requested input line (D0 or D1)
    /// @param bit            Bit value this line carries (0 for D0, 1 for D1)
    /// @param buffer         Shared frame buffer
    /// @param poll_interval  Longest wait before re-checking `stop`
    LineMonitor(InputLine& line, uint8_t bit, FrameBuffer& buffer,
                std::chrono::milliseconds poll_interval);

    /// Run until `stop` is requested. Intended as a thread body.
    void run(const StopSignal& stop);

    uint8_t bit() const noexcept { return bit_; }

private:
    InputLine&                line_;
    uint8_t                   bit_;
    FrameBuffer&              buffer_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_LINE_MONITOR_HPP
