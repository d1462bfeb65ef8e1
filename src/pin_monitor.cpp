#include "pin_monitor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace wiegand::rx {

PinMonitor::~PinMonitor() { stop(); }

const std::set<std::string>& PinMonitor::reserved_lines() {
    static const std::set<std::string> reserved = {
        "GPIO0",  "GPIO1",                      // ID_SD / ID_SC (HAT EEPROM)
        "GPIO2",  "GPIO3",                      // I2C1 SDA / SCL
        "GPIO7",  "GPIO8",  "GPIO9",            // SPI0 CE1 / CE0 / MISO
        "GPIO10", "GPIO11",                     // SPI0 MOSI / SCLK
        "GPIO14", "GPIO15",                     // UART0 TXD / RXD
    };
    return reserved;
}

std::vector<std::string> PinMonitor::parse_list(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = std::find_if_not(item.begin(), item.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto last  = std::find_if_not(item.rbegin(), item.rend(),
                                      [](unsigned char c) { return std::isspace(c); }).base();
        if (first < last) out.emplace_back(first, last);
    }
    return out;
}

std::vector<std::string> PinMonitor::select(const std::vector<LineInfo>& available,
                                            const std::vector<std::string>& requested) {
    std::vector<std::string> out;

    if (requested.empty()) {
        const auto& reserved = reserved_lines();
        for (const auto& info : available) {
            if (reserved.count(info.name)) {
                std::printf("[pins] skipping reserved line %s\n", info.name.c_str());
                continue;
            }
            if (info.used) {
                std::printf("[pins] skipping line %s in use by %s\n",
                            info.name.c_str(),
                            info.consumer.empty() ? "unknown" : info.consumer.c_str());
                continue;
            }
            out.push_back(info.name);
        }
        return out;
    }

    for (const auto& name : requested) {
        auto it = std::find_if(available.begin(), available.end(),
                               [&](const LineInfo& info) { return info.name == name; });
        if (it == available.end()) {
            std::fprintf(stderr, "[pins] invalid line: %s\n", name.c_str());
            continue;
        }
        std::printf("[pins] selected line %s (consumer: %s)\n", name.c_str(),
                    it->consumer.empty() ? "none" : it->consumer.c_str());
        out.push_back(name);
    }
    return out;
}

bool PinMonitor::start(LineProvider& lines, const std::vector<std::string>& requested) {
    if (!threads_.empty()) {
        std::fprintf(stderr, "[pins] monitor already running\n");
        return false;
    }

    std::vector<std::string> names = select(lines.list(), requested);
    if (names.empty()) {
        std::fprintf(stderr, "[pins] no lines to monitor\n");
        return false;
    }

    LineRequest req;
    req.consumer = "wiegand-rx-pins";
    req.bias     = Bias::PullDown;
    req.edge     = EdgeMode::Both;

    std::string monitored;
    for (const auto& name : names) {
        auto line = lines.find(name);
        if (!line || !line->request(req)) {
            std::fprintf(stderr, "[pins] failed to configure line %s\n", name.c_str());
            continue;
        }
        std::printf("[pins] %s initial state: %s\n", name.c_str(),
                    level_name(line->read()));
        lines_.push_back(line);
        if (!monitored.empty()) monitored += ", ";
        monitored += name;
    }

    if (lines_.empty()) {
        std::fprintf(stderr, "[pins] no lines could be configured\n");
        return false;
    }
    std::printf("[pins] monitoring: %s\n", monitored.c_str());

    stop_ = std::make_unique<StopSignal>();
    StopSignal* stop = stop_.get();
    for (const auto& line : lines_) {
        InputLine* l = line.get();
        threads_.emplace_back([l, stop] { watch(*l, *stop); });
    }
    return true;
}

void PinMonitor::stop() {
    if (stop_) stop_->request_stop();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    lines_.clear();
}

void PinMonitor::watch(InputLine& line, const StopSignal& stop) {
    while (!stop.stop_requested()) {
        if (paced_wait_for_edge(line, std::chrono::milliseconds(100))) {
            std::printf("[pins] edge on %s: %s\n", line.name().c_str(),
                        level_name(line.read()));
        }
    }
}

} // namespace wiegand::rx
