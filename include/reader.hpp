#ifndef WIEGAND_RX_READER_HPP
#define WIEGAND_RX_READER_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "frame_buffer.hpp"
#include "frame_decoder.hpp"
#include "input_line.hpp"
#include "stop_signal.hpp"

namespace wiegand::rx {

/// Default silence that ends a frame.
constexpr std::chrono::milliseconds kDefaultTimeout{100};

/// Default maximum number of bits per frame.
constexpr int kDefaultMaxBits = 26;

/// Configuration for a Wiegand reader.
struct ReaderConfig {
    std::string d0_line;    // line carrying 0 bits (e.g. "GPIO4")
    std::string d1_line;    // line carrying 1 bits (e.g. "GPIO17")

    /// Receives the tag of every valid frame as a decimal string.
    std::function<void(const std::string&)> callback;

    /// Optional; receives site code, tag and bit count of every valid frame.
    std::function<void(const DecodedResult&)> on_decoded;

    std::chrono::milliseconds timeout  = kDefaultTimeout;   // <= 0 -> default
    int                       max_bits = kDefaultMaxBits;   // <= 0 -> default

    /// How often monitors wake to check for close().
    std::chrono::milliseconds poll_interval{100};

    /// Consumer label shown for the requested lines.
    std::string consumer = "wiegand-rx";
};

/// A running Wiegand reader on one D0/D1 line pair.
///
/// open() resolves and requests both lines, then starts three threads:
/// one monitor per line and a boundary detector. Every valid frame is
/// delivered to the callbacks on a detached thread; close() never waits
/// for a callback to finish.
class Reader {
public:
    Reader();
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    /// Validate `cfg`, request both lines from `lines` and start reading.
    /// On failure nothing is started and error() describes the cause.
    bool open(const ReaderConfig& cfg, LineProvider& lines);

    /// Stop all threads. No callback is dispatched after this returns.
    void close();

    bool is_open() const noexcept { return running_; }

    const std::string& error() const noexcept { return error_; }

    /// Effective configuration after defaults were applied.
    const ReaderConfig& config() const noexcept { return cfg_; }

    /// Bits buffered since the last frame boundary.
    std::size_t pending_bits() const;

private:
    ReaderConfig                    cfg_;
    std::string                     error_;
    std::shared_ptr<InputLine>      d0_;
    std::shared_ptr<InputLine>      d1_;
    std::unique_ptr<FrameBuffer>    buffer_;
    std::unique_ptr<StopSignal>     stop_;
    std::vector<std::thread>        threads_;
    bool                            running_ = false;

    bool fail(std::string message);
    void dispatch(const DecodedResult& card) const;
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_READER_HPP
