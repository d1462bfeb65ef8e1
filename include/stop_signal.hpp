#ifndef WIEGAND_RX_STOP_SIGNAL_HPP
#define WIEGAND_RX_STOP_SIGNAL_HPP

#include <atomic>

namespace wiegand::rx {

/// One-shot cancellation flag shared by every task of a reader.
class StopSignal {
public:
    void request_stop() noexcept { stopped_.store(true); }
    bool stop_requested() const noexcept { return stopped_.load(); }

private:
    std::atomic<bool> stopped_{false};
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_STOP_SIGNAL_HPP
