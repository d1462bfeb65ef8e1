#include "simulated_line.hpp"

#include <chrono>
#include <utility>

namespace wiegand::rx {

SimulatedLine::SimulatedLine(std::string name, Level initial)
    : name_(std::move(name)), level_(initial) {}

bool SimulatedLine::request(const LineRequest& req) {
    std::lock_guard<std::mutex> lock(mu_);
    if (fail_requests_) return false;
    edge_      = req.edge;
    requested_ = true;
    return true;
}

void SimulatedLine::fail_requests(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_requests_ = fail;
}

bool SimulatedLine::requested() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requested_;
}

bool SimulatedLine::wait_for_edge(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mu_);
    for (;;) {
        if (!cv_.wait_until(lock, deadline, [this] { return !edges_.empty(); })) {
            return false;
        }
        Level next = edges_.front();
        edges_.pop_front();
        level_ = next;

        bool selected = edge_ == EdgeMode::Both ||
                        (next == Level::Low ? edge_ == EdgeMode::Falling
                                            : edge_ == EdgeMode::Rising);
        if (selected) return true;
    }
}

Level SimulatedLine::read() {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void SimulatedLine::inject_edge(Level level) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        edges_.push_back(level);
    }
    cv_.notify_all();
}

void SimulatedLine::pulse() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        edges_.push_back(Level::Low);
        edges_.push_back(Level::High);
    }
    cv_.notify_all();
}

std::size_t SimulatedLine::pending_edges() const {
    std::lock_guard<std::mutex> lock(mu_);
    return edges_.size();
}

// ---------------------------------------------------------------------------
// Provider
// ---------------------------------------------------------------------------

std::shared_ptr<SimulatedLine> SimulatedLineProvider::add(const std::string& name,
                                                          Level initial) {
    auto line = std::make_shared<SimulatedLine>(name, initial);
    lines_[name] = line;
    return line;
}

std::shared_ptr<InputLine> SimulatedLineProvider::find(const std::string& name) {
    auto it = lines_.find(name);
    if (it == lines_.end()) return nullptr;
    return it->second;
}

std::vector<LineInfo> SimulatedLineProvider::list() {
    std::vector<LineInfo> out;
    for (const auto& [name, line] : lines_) {
        LineInfo info{name, {}, false};
        auto c = consumers_.find(name);
        if (c != consumers_.end()) {
            info.consumer = c->second;
            info.used     = true;
        }
        out.push_back(info);
    }
    return out;
}

void SimulatedLineProvider::set_consumer(const std::string& name,
                                         const std::string& consumer) {
    consumers_[name] = consumer;
}

} // namespace wiegand::rx
