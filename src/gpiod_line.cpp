#include "gpiod_line.hpp"

#include <cstdio>
#include <system_error>
#include <utility>

namespace wiegand::rx {

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

GpiodLine::GpiodLine(gpiod::line line)
    : line_(std::move(line)), name_(line_.name()) {}

GpiodLine::~GpiodLine() { release(); }

bool GpiodLine::request(const LineRequest& req) {
    gpiod::line_request config;
    config.consumer = req.consumer;

    switch (req.edge) {
        case EdgeMode::Falling:
            config.request_type = gpiod::line_request::EVENT_FALLING_EDGE;
            break;
        case EdgeMode::Rising:
            config.request_type = gpiod::line_request::EVENT_RISING_EDGE;
            break;
        case EdgeMode::Both:
            config.request_type = gpiod::line_request::EVENT_BOTH_EDGES;
            break;
    }

    switch (req.bias) {
        case Bias::Disabled:
            config.flags = gpiod::line_request::FLAG_BIAS_DISABLE;
            break;
        case Bias::PullUp:
            config.flags = gpiod::line_request::FLAG_BIAS_PULL_UP;
            break;
        case Bias::PullDown:
            config.flags = gpiod::line_request::FLAG_BIAS_PULL_DOWN;
            break;
    }

    try {
        line_.request(config);
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] request of %s failed: %s\n",
                     name_.c_str(), e.what());
        return false;
    }
    requested_ = true;
    return true;
}

void GpiodLine::release() {
    if (!requested_) return;
    try {
        line_.release();
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] release of %s failed: %s\n",
                     name_.c_str(), e.what());
    }
    requested_ = false;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

bool GpiodLine::wait_for_edge(std::chrono::milliseconds timeout) {
    if (!requested_) return false;

    try {
        if (!line_.event_wait(timeout)) return false;

        // Drain the event; its type tells us where the line settled, which
        // a later get_value() could miss on a pulse of a few microseconds.
        gpiod::line_event ev = line_.event_read();
        edge_level_ = (ev.event_type == gpiod::line_event::FALLING_EDGE)
                          ? Level::Low
                          : Level::High;
        edge_pending_ = true;
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] event wait on %s failed: %s\n",
                     name_.c_str(), e.what());
        return false;
    }
    return true;
}

Level GpiodLine::read() {
    if (edge_pending_) {
        edge_pending_ = false;
        return edge_level_;
    }
    try {
        return line_.get_value() ? Level::High : Level::Low;
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] read of %s failed: %s\n",
                     name_.c_str(), e.what());
    }
    // Idle level: an unreadable line never produces a bit.
    return Level::High;
}

// ---------------------------------------------------------------------------
// Provider
// ---------------------------------------------------------------------------

std::shared_ptr<InputLine> GpiodLineProvider::find(const std::string& name) {
    try {
        gpiod::line line = gpiod::find_line(name);
        if (!line) return nullptr;
        return std::make_shared<GpiodLine>(std::move(line));
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] lookup of %s failed: %s\n",
                     name.c_str(), e.what());
    }
    return nullptr;
}

std::vector<LineInfo> GpiodLineProvider::list() {
    std::vector<LineInfo> out;
    try {
        for (auto& chip : gpiod::make_chip_iter()) {
            for (auto& line : gpiod::line_iter(chip)) {
                std::string name = line.name();
                if (name.empty()) continue;   // unnamed lines cannot be found
                out.push_back({name, line.consumer(), line.is_used()});
            }
        }
    } catch (const std::system_error& e) {
        std::fprintf(stderr, "[gpio] chip enumeration failed: %s\n", e.what());
    }
    return out;
}

} // namespace wiegand::rx
