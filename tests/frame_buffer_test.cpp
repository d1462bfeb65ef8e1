#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "frame_buffer.hpp"

using namespace wiegand::rx;
using namespace std::chrono_literals;

namespace {

void append_now(FrameBuffer& buffer, uint8_t bit) {
    buffer.append({bit, Clock::now()});
}

} // namespace

TEST(FrameBuffer, StartsIdle) {
    FrameBuffer buffer(26);
    EXPECT_EQ(buffer.state(), FrameBuffer::State::Idle);
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(FrameBuffer, ReturnsBitsInOrderAfterSilence) {
    FrameBuffer buffer(26);
    StopSignal stop;

    append_now(buffer, 1);
    append_now(buffer, 0);
    append_now(buffer, 1);
    EXPECT_EQ(buffer.state(), FrameBuffer::State::Accumulating);

    Boundary b = buffer.wait_for_boundary(20ms, stop);
    ASSERT_EQ(b.outcome, BoundaryOutcome::Frame);
    EXPECT_EQ(b.bits, (Frame{1, 0, 1}));
    EXPECT_EQ(buffer.state(), FrameBuffer::State::Idle);
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(FrameBuffer, NewBitRestartsTheSilenceTimer) {
    FrameBuffer buffer(26);
    StopSignal stop;

    append_now(buffer, 1);
    std::thread late([&] {
        std::this_thread::sleep_for(30ms);
        append_now(buffer, 0);
    });

    Boundary b = buffer.wait_for_boundary(200ms, stop);
    Clock::time_point returned = Clock::now();
    late.join();

    ASSERT_EQ(b.outcome, BoundaryOutcome::Frame);
    EXPECT_EQ(b.bits, (Frame{1, 0}));
    EXPECT_GE(returned, buffer.last_bit_time() + 200ms);
}

TEST(FrameBuffer, LastBitTimeNeverMovesBack) {
    FrameBuffer buffer(26);
    Clock::time_point early = Clock::now();
    Clock::time_point late  = early + 5ms;

    // The second producer stamped first but took the lock last.
    buffer.append({1, late});
    buffer.append({0, early});
    EXPECT_EQ(buffer.last_bit_time(), late);
    EXPECT_EQ(buffer.size(), 2u);
}

TEST(FrameBuffer, OverflowIsDiscarded) {
    FrameBuffer buffer(4);
    StopSignal stop;

    for (int i = 0; i < 6; ++i) append_now(buffer, 1);
    EXPECT_EQ(buffer.size(), 6u);

    Boundary b = buffer.wait_for_boundary(10ms, stop);
    EXPECT_EQ(b.outcome, BoundaryOutcome::Overflow);
    EXPECT_TRUE(b.bits.empty());
    EXPECT_EQ(b.dropped, 6u);
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.state(), FrameBuffer::State::Idle);
}

TEST(FrameBuffer, ExactlyMaxBitsIsAFrame) {
    FrameBuffer buffer(4);
    StopSignal stop;

    for (int i = 0; i < 4; ++i) append_now(buffer, 0);

    Boundary b = buffer.wait_for_boundary(10ms, stop);
    EXPECT_EQ(b.outcome, BoundaryOutcome::Frame);
    EXPECT_EQ(b.bits.size(), 4u);
}

TEST(FrameBuffer, StopWakesAnIdleWaiter) {
    FrameBuffer buffer(26);
    StopSignal stop;

    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
        buffer.wake();
    });

    Boundary b = buffer.wait_for_boundary(100ms, stop);
    stopper.join();
    EXPECT_EQ(b.outcome, BoundaryOutcome::Stopped);
}

TEST(FrameBuffer, StopAbandonsAPartialFrame) {
    FrameBuffer buffer(26);
    StopSignal stop;

    append_now(buffer, 1);
    std::thread stopper([&] {
        std::this_thread::sleep_for(10ms);
        stop.request_stop();
        buffer.wake();
    });

    Boundary b = buffer.wait_for_boundary(10s, stop);
    stopper.join();
    EXPECT_EQ(b.outcome, BoundaryOutcome::Stopped);
    EXPECT_TRUE(b.bits.empty());
}
