#ifndef WIEGAND_RX_INPUT_LINE_HPP
#define WIEGAND_RX_INPUT_LINE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace wiegand::rx {

/// Electrical level of a digital input line.
enum class Level { Low, High };

/// Idle bias applied to a line when it is requested as input.
enum class Bias { Disabled, PullUp, PullDown };

/// Transitions that wake a waiter.
enum class EdgeMode { Falling, Rising, Both };

/// Parameters for requesting a line as an edge-triggered input.
struct LineRequest {
    std::string consumer = "wiegand-rx";
    Bias        bias     = Bias::PullUp;
    EdgeMode    edge     = EdgeMode::Falling;
};

/// Description of a line as reported by a provider's enumeration.
struct LineInfo {
    std::string name;
    std::string consumer;   // empty if unclaimed
    bool        used = false;
};

/// One digital input line capable of edge detection.
class InputLine {
public:
    virtual ~InputLine() = default;

    virtual const std::string& name() const = 0;

    /// Configure the line as input. Returns false on failure.
    virtual bool request(const LineRequest& req) = 0;

    /// Block for up to `timeout` waiting for the next edge.
    /// Returns true if an edge occurred; the edge is consumed.
    virtual bool wait_for_edge(std::chrono::milliseconds timeout) = 0;

    /// Level of the line right after the most recently consumed edge,
    /// or the current level when no edge is pending.
    virtual Level read() = 0;
};

/// Resolves line names to InputLine instances.
class LineProvider {
public:
    virtual ~LineProvider() = default;

    /// Look up a line by name. Returns nullptr if no such line exists.
    virtual std::shared_ptr<InputLine> find(const std::string& name) = 0;

    /// List every line the provider knows about.
    virtual std::vector<LineInfo> list() = 0;
};

const char* level_name(Level level);

/// wait_for_edge() that always takes at least `interval` when no edge
/// arrives, so a backend failing immediately cannot turn the caller's
/// loop into a busy spin.
bool paced_wait_for_edge(InputLine& line, std::chrono::milliseconds interval);

} // namespace wiegand::rx

#endif // WIEGAND_RX_INPUT_LINE_HPP
