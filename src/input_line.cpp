#include "input_line.hpp"

#include <thread>

namespace wiegand::rx {

const char* level_name(Level level) {
    switch (level) {
        case Level::Low:  return "Low";
        case Level::High: return "High";
    }
    return "unknown";
}

bool paced_wait_for_edge(InputLine& line, std::chrono::milliseconds interval) {
    auto started = std::chrono::steady_clock::now();
    if (line.wait_for_edge(interval)) return true;

    auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed < interval) std::this_thread::sleep_for(interval - elapsed);
    return false;
}

} // namespace wiegand::rx
