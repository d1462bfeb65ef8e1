#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "pin_monitor.hpp"
#include "simulated_line.hpp"

using namespace wiegand::rx;

TEST(PinMonitor, ParseListTrimsAndDropsEmptyEntries) {
    EXPECT_EQ(PinMonitor::parse_list(" GPIO4, GPIO17 ,,GPIO27 "),
              (std::vector<std::string>{"GPIO4", "GPIO17", "GPIO27"}));
    EXPECT_TRUE(PinMonitor::parse_list("").empty());
    EXPECT_TRUE(PinMonitor::parse_list(" , ").empty());
}

TEST(PinMonitor, SelectsFreeLinesWhenNoneRequested) {
    std::vector<LineInfo> available = {
        {"GPIO2", {}, false},            // reserved: I2C1 SDA
        {"GPIO4", {}, false},
        {"GPIO14", {}, false},           // reserved: UART0 TXD
        {"GPIO17", {}, false},
        {"GPIO18", "spi1 CS0", true},    // claimed by a kernel driver
    };
    EXPECT_EQ(PinMonitor::select(available, {}),
              (std::vector<std::string>{"GPIO4", "GPIO17"}));
}

TEST(PinMonitor, SelectsOnlyExistingRequestedLines) {
    std::vector<LineInfo> available = {
        {"GPIO2", {}, false},
        {"GPIO4", {}, false},
    };
    // Explicit requests may name reserved lines.
    EXPECT_EQ(PinMonitor::select(available, {"GPIO2", "NOPE", "GPIO4"}),
              (std::vector<std::string>{"GPIO2", "GPIO4"}));
}

TEST(PinMonitor, StartRequestsLinesAndStopJoins) {
    SimulatedLineProvider lines;
    auto a = lines.add("GPIO5");
    auto b = lines.add("GPIO6");
    lines.add("GPIO9");   // reserved
    lines.set_consumer("GPIO6", "w1-gpio");

    PinMonitor monitor;
    ASSERT_TRUE(monitor.start(lines, {}));
    EXPECT_EQ(monitor.line_count(), 1u);
    EXPECT_TRUE(a->requested());
    EXPECT_FALSE(b->requested());

    a->pulse();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (a->pending_edges() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(a->pending_edges(), 0u);

    monitor.stop();
    EXPECT_EQ(monitor.line_count(), 0u);
}

TEST(PinMonitor, StartFailsWithNothingToMonitor) {
    SimulatedLineProvider lines;
    lines.add("GPIO0");
    PinMonitor monitor;
    EXPECT_FALSE(monitor.start(lines, {}));
    EXPECT_FALSE(monitor.start(lines, {"GPIO99"}));
}

TEST(PinMonitor, StartSkipsLinesThatFailToConfigure) {
    SimulatedLineProvider lines;
    lines.add("GPIO5")->fail_requests(true);
    auto ok = lines.add("GPIO6");

    PinMonitor monitor;
    ASSERT_TRUE(monitor.start(lines, {"GPIO5", "GPIO6"}));
    EXPECT_EQ(monitor.line_count(), 1u);
    EXPECT_TRUE(ok->requested());
}

TEST(PinMonitor, RestartsAfterStop) {
    SimulatedLineProvider lines;
    auto a = lines.add("GPIO5");

    PinMonitor monitor;
    ASSERT_TRUE(monitor.start(lines, {"GPIO5"}));
    EXPECT_FALSE(monitor.start(lines, {"GPIO5"}));   // already running
    monitor.stop();

    ASSERT_TRUE(monitor.start(lines, {"GPIO5"}));
    EXPECT_EQ(monitor.line_count(), 1u);

    // Watchers of the second run are alive and draining edges.
    a->pulse();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (a->pending_edges() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(a->pending_edges(), 0u);
    monitor.stop();
}
