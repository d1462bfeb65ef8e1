#ifndef WIEGAND_RX_GPIOD_LINE_HPP
#define WIEGAND_RX_GPIOD_LINE_HPP

#include <memory>
#include <string>
#include <vector>

#include <gpiod.hpp>

#include "input_line.hpp"

namespace wiegand::rx {

/// InputLine backed by a Linux GPIO character device line (libgpiod).
class GpiodLine : public InputLine {
public:
    explicit GpiodLine(gpiod::line line);
    ~GpiodLine() override;

    GpiodLine(const GpiodLine&) = delete;
    GpiodLine& operator=(const GpiodLine&) = delete;

    const std::string& name() const override { return name_; }

    bool request(const LineRequest& req) override;
    bool wait_for_edge(std::chrono::milliseconds timeout) override;
    Level read() override;

    /// Release the line back to the kernel.
    void release();

private:
    gpiod::line line_;
    std::string name_;
    bool        requested_    = false;

    // Level implied by the last consumed edge event, valid until read().
    bool        edge_pending_ = false;
    Level       edge_level_   = Level::High;
};

/// LineProvider over every gpiochip on the system.
class GpiodLineProvider : public LineProvider {
public:
    std::shared_ptr<InputLine> find(const std::string& name) override;
    std::vector<LineInfo> list() override;
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_GPIOD_LINE_HPP
