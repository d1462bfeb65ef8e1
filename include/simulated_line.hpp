#ifndef WIEGAND_RX_SIMULATED_LINE_HPP
#define WIEGAND_RX_SIMULATED_LINE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "input_line.hpp"

namespace wiegand::rx {

/// In-memory input line. Edges are injected by the caller and handed to
/// the waiter in injection order.
class SimulatedLine : public InputLine {
public:
    explicit SimulatedLine(std::string name, Level initial = Level::High);

    const std::string& name() const override { return name_; }

    bool request(const LineRequest& req) override;
    bool wait_for_edge(std::chrono::milliseconds timeout) override;
    Level read() override;

    /// Queue a transition to `level`. Transitions the requested edge mode
    /// does not select still change the level but never wake a waiter.
    void inject_edge(Level level);

    /// Queue a Low then High transition (one Wiegand pulse).
    void pulse();

    /// Make the next request() fail.
    void fail_requests(bool fail);

    bool requested() const;

    /// Number of injected edges not yet consumed by a waiter.
    std::size_t pending_edges() const;

private:
    std::string             name_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Level>       edges_;
    Level                   level_;
    EdgeMode                edge_          = EdgeMode::Both;
    bool                    requested_     = false;
    bool                    fail_requests_ = false;
};

/// LineProvider that hands out SimulatedLines created with add().
class SimulatedLineProvider : public LineProvider {
public:
    /// Register a line under `name` and return it for edge injection.
    std::shared_ptr<SimulatedLine> add(const std::string& name,
                                       Level initial = Level::High);

    std::shared_ptr<InputLine> find(const std::string& name) override;
    std::vector<LineInfo> list() override;

    /// Mark a line as claimed by another consumer in list().
    void set_consumer(const std::string& name, const std::string& consumer);

private:
    std::map<std::string, std::shared_ptr<SimulatedLine>> lines_;
    std::map<std::string, std::string>                    consumers_;
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_SIMULATED_LINE_HPP
