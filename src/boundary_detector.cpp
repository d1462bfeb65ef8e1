#include "boundary_detector.hpp"

#include <cstdio>
#include <utility>

namespace wiegand::rx {

BoundaryDetector::BoundaryDetector(FrameBuffer& buffer,
                                   std::chrono::milliseconds timeout,
                                   FrameHandler on_frame)
    : buffer_(buffer), timeout_(timeout), on_frame_(std::move(on_frame)) {}

void BoundaryDetector::run(const StopSignal& stop) {
    while (!stop.stop_requested()) {
        Boundary boundary = buffer_.wait_for_boundary(timeout_, stop);

        switch (boundary.outcome) {
            case BoundaryOutcome::Stopped:
                return;
            case BoundaryOutcome::Overflow:
                std::fprintf(stderr,
                             "[reader] dropped %zu bits (max %zu per frame)\n",
                             boundary.dropped, buffer_.max_bits());
                break;
            case BoundaryOutcome::Frame:
                // close() may have landed while the frame was taken.
                if (stop.stop_requested()) return;
                process(boundary.bits);
                break;
        }
    }
}

bool BoundaryDetector::process(const Frame& frame) const {
    if (frame.empty()) return false;

    std::printf("[reader] received %zu-bit value: %s\n", frame.size(),
                FrameDecoder::format_bits(frame).c_str());

    DecodeResult result = FrameDecoder::decode(frame);
    if (!result.ok()) {
        if (is_contract_violation(result.status)) {
            std::fprintf(stderr, "[decoder] internal error (%s): %s\n",
                         status_name(result.status), result.error.c_str());
        } else {
            std::fprintf(stderr, "[decoder] rejected frame (%s): %s\n",
                         status_name(result.status), result.error.c_str());
        }
        return false;
    }

    std::printf("[decoder] %zu-bit frame: site %s, tag %s\n",
                result.card.bit_count, result.card.site_code.c_str(),
                result.card.tag.c_str());

    if (on_frame_) on_frame_(result.card);
    return true;
}

} // namespace wiegand::rx
