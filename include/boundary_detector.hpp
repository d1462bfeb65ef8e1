#ifndef WIEGAND_RX_BOUNDARY_DETECTOR_HPP
#define WIEGAND_RX_BOUNDARY_DETECTOR_HPP

#include <chrono>
#include <functional>
#include <string>

#include "frame_buffer.hpp"
#include "frame_decoder.hpp"
#include "stop_signal.hpp"

namespace wiegand::rx {

/// Waits for inter-bit silence, takes the completed frame out of the
/// buffer and decodes it. Valid frames are handed to `on_frame`.
class BoundaryDetector {
public:
    using FrameHandler = std::function<void(const DecodedResult&)>;

    BoundaryDetector(FrameBuffer& buffer, std::chrono::milliseconds timeout,
                     FrameHandler on_frame);

    /// Run until `stop` is requested. Intended as a thread body.
    void run(const StopSignal& stop);

    /// Decode and report one frame. Returns true if `on_frame` was called.
    bool process(const Frame& frame) const;

private:
    FrameBuffer&              buffer_;
    std::chrono::milliseconds timeout_;
    FrameHandler              on_frame_;
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_BOUNDARY_DETECTOR_HPP
