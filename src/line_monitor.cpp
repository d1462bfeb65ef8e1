#include "line_monitor.hpp"

namespace wiegand::rx {

LineMonitor::LineMonitor(InputLine& line, uint8_t bit, FrameBuffer& buffer,
                         std::chrono::milliseconds poll_interval)
    : line_(line), bit_(bit), buffer_(buffer), poll_interval_(poll_interval) {}

void LineMonitor::run(const StopSignal& stop) {
    while (!stop.stop_requested()) {
        if (!paced_wait_for_edge(line_, poll_interval_)) continue;
        if (stop.stop_requested()) break;

        // Lines idle high; a pulse pulls the line low.
        if (line_.read() != Level::Low) continue;

        buffer_.append({bit_, Clock::now()});
    }
}

} // namespace wiegand::rx
