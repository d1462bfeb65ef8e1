#include "reader.hpp"

#include <cstdio>
#include <system_error>
#include <utility>

#include "boundary_detector.hpp"
#include "line_monitor.hpp"

namespace wiegand::rx {

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Reader::Reader() = default;

Reader::~Reader() { close(); }

bool Reader::fail(std::string message) {
    error_ = std::move(message);
    std::fprintf(stderr, "[reader] %s\n", error_.c_str());
    d0_.reset();
    d1_.reset();
    return false;
}

bool Reader::open(const ReaderConfig& cfg, LineProvider& lines) {
    if (running_) {
        error_ = "reader already open";
        return false;
    }

    cfg_ = cfg;
    error_.clear();

    if (cfg_.d0_line.empty() || cfg_.d1_line.empty()) {
        return fail("D0 and D1 lines must be specified");
    }
    if (!cfg_.callback) {
        return fail("callback function must be provided");
    }
    if (cfg_.timeout.count() <= 0)       cfg_.timeout = kDefaultTimeout;
    if (cfg_.max_bits <= 0)              cfg_.max_bits = kDefaultMaxBits;
    if (cfg_.poll_interval.count() <= 0) cfg_.poll_interval = std::chrono::milliseconds(100);

    d0_ = lines.find(cfg_.d0_line);
    d1_ = lines.find(cfg_.d1_line);
    if (!d0_ || !d1_) {
        return fail("invalid input lines: D0=" + cfg_.d0_line +
                    ", D1=" + cfg_.d1_line);
    }

    // Wiegand data lines idle high and pulse low.
    LineRequest req;
    req.consumer = cfg_.consumer;
    req.bias     = Bias::PullUp;
    req.edge     = EdgeMode::Falling;

    if (!d0_->request(req)) {
        return fail("failed to configure D0 line " + cfg_.d0_line);
    }
    if (!d1_->request(req)) {
        return fail("failed to configure D1 line " + cfg_.d1_line);
    }

    buffer_ = std::make_unique<FrameBuffer>(static_cast<std::size_t>(cfg_.max_bits));
    stop_   = std::make_unique<StopSignal>();

    // Set before spawning so close() joins whatever did start.
    running_ = true;

    InputLine*   d0     = d0_.get();
    InputLine*   d1     = d1_.get();
    FrameBuffer* buffer = buffer_.get();
    StopSignal*  stop   = stop_.get();
    auto         poll   = cfg_.poll_interval;

    try {
        threads_.emplace_back([d0, buffer, stop, poll] {
            LineMonitor(*d0, 0, *buffer, poll).run(*stop);
        });
        threads_.emplace_back([d1, buffer, stop, poll] {
            LineMonitor(*d1, 1, *buffer, poll).run(*stop);
        });
        threads_.emplace_back([this, buffer, stop] {
            BoundaryDetector detector(*buffer, cfg_.timeout,
                                      [this](const DecodedResult& card) { dispatch(card); });
            detector.run(*stop);
        });
    } catch (const std::system_error& e) {
        close();
        return fail(std::string("failed to start reader threads: ") + e.what());
    }

    std::printf("[reader] listening on D0=%s D1=%s (timeout %lld ms, max %d bits)\n",
                cfg_.d0_line.c_str(), cfg_.d1_line.c_str(),
                static_cast<long long>(cfg_.timeout.count()), cfg_.max_bits);
    return true;
}

void Reader::close() {
    if (!running_) return;

    stop_->request_stop();
    buffer_->wake();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    d0_.reset();
    d1_.reset();
    running_ = false;
}

std::size_t Reader::pending_bits() const {
    return buffer_ ? buffer_->size() : 0;
}

// ---------------------------------------------------------------------------
// Callback dispatch
// ---------------------------------------------------------------------------

void Reader::dispatch(const DecodedResult& card) const {
    // Detached: the decode loop never waits on application code, and
    // close() does not wait for a callback already in flight.
    std::thread([callback = cfg_.callback, on_decoded = cfg_.on_decoded, card] {
        if (on_decoded) on_decoded(card);
        callback(card.tag);
    }).detach();
}

} // namespace wiegand::rx
