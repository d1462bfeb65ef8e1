#ifndef WIEGAND_RX_PIN_MONITOR_HPP
#define WIEGAND_RX_PIN_MONITOR_HPP

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "input_line.hpp"
#include "stop_signal.hpp"

namespace wiegand::rx {

/// Diagnostic monitor that prints every edge seen on a set of lines.
class PinMonitor {
public:
    PinMonitor() = default;
    ~PinMonitor();

    PinMonitor(const PinMonitor&) = delete;
    PinMonitor& operator=(const PinMonitor&) = delete;

    /// Raspberry Pi header pins with fixed alternate functions
    /// (HAT EEPROM, I2C1, SPI0, UART0).
    static const std::set<std::string>& reserved_lines();

    /// Split a comma-separated list of names, trimming whitespace and
    /// dropping empty entries.
    static std::vector<std::string> parse_list(const std::string& csv);

    /// Lines to monitor. With `requested` empty: every listed line that is
    /// neither reserved nor claimed by another consumer. Otherwise the
    /// requested names that exist in `available`.
    static std::vector<std::string> select(const std::vector<LineInfo>& available,
                                           const std::vector<std::string>& requested);

    /// Request the selected lines for both-edge detection and start one
    /// watcher thread per line. Returns false if no line could be started
    /// or the monitor is already running. May be called again after stop().
    bool start(LineProvider& lines, const std::vector<std::string>& requested);

    /// Stop and join all watchers.
    void stop();

    std::size_t line_count() const noexcept { return lines_.size(); }

private:
    std::vector<std::shared_ptr<InputLine>> lines_;
    std::vector<std::thread>                threads_;
    std::unique_ptr<StopSignal>             stop_;

    static void watch(InputLine& line, const StopSignal& stop);
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_PIN_MONITOR_HPP
