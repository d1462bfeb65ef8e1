#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "frame_decoder.hpp"
#include "gpiod_line.hpp"
#include "pin_monitor.hpp"
#include "reader.hpp"
#include "simulated_line.hpp"

namespace {

std::atomic<bool> g_running{true};

void on_signal(int sig) {
    if (sig == SIGINT || sig == SIGTERM) g_running.store(false);
}

void wait_for_signal() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void print_usage() {
    std::puts(
        "wiegand-rx v1.0.0\n"
        "Usage:\n"
        "  wiegand-rx read <d0>:<d1> [<d0>:<d1> ...] [timeout_ms] [max_bits]\n"
        "                                    Read cards until interrupted\n"
        "  wiegand-rx pins [name,name,...]   Print edges on GPIO lines\n"
        "  wiegand-rx decode <bits>          Decode a frame given as 0/1 text\n"
        "  wiegand-rx replay <bits>          Feed a frame through simulated lines\n"
    );
}

} // namespace

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_read(int argc, char* argv[]) {
    using namespace wiegand::rx;

    std::vector<std::pair<std::string, std::string>> pairs;
    std::vector<int> numbers;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto colon = arg.find(':');
        if (colon != std::string::npos) {
            pairs.emplace_back(arg.substr(0, colon), arg.substr(colon + 1));
        } else {
            try {
                numbers.push_back(std::stoi(arg));
            } catch (const std::exception&) {
                std::fprintf(stderr, "error: expected <d0>:<d1> or a number, got '%s'\n",
                             arg.c_str());
                return 1;
            }
        }
    }
    if (pairs.empty()) {
        print_usage();
        return 1;
    }

    GpiodLineProvider lines;
    std::vector<std::unique_ptr<Reader>> readers;

    for (std::size_t i = 0; i < pairs.size(); ++i) {
        ReaderConfig cfg;
        cfg.d0_line = pairs[i].first;
        cfg.d1_line = pairs[i].second;
        if (numbers.size() > 0) cfg.timeout  = std::chrono::milliseconds(numbers[0]);
        if (numbers.size() > 1) cfg.max_bits = numbers[1];

        std::size_t index = i + 1;
        cfg.callback = [index](const std::string& tag) {
            std::printf("[read] reader %zu: tag %s\n", index, tag.c_str());
            std::fflush(stdout);
        };
        cfg.on_decoded = [index](const DecodedResult& card) {
            std::printf("[read] reader %zu: site %s (%zu-bit card)\n",
                        index, card.site_code.c_str(), card.bit_count);
        };

        auto reader = std::make_unique<Reader>();
        if (!reader->open(cfg, lines)) {
            std::fprintf(stderr, "error: failed to start reader %zu: %s\n",
                         index, reader->error().c_str());
            return 1;
        }
        readers.push_back(std::move(reader));
    }

    wait_for_signal();

    for (auto& reader : readers) reader->close();
    std::puts("[read] shutting down");
    return 0;
}

static int cmd_pins(int argc, char* argv[]) {
    using namespace wiegand::rx;

    std::vector<std::string> requested;
    if (argc >= 3) requested = PinMonitor::parse_list(argv[2]);

    GpiodLineProvider lines;
    PinMonitor monitor;
    if (!monitor.start(lines, requested)) {
        std::fprintf(stderr, "error: no GPIO lines to monitor\n");
        return 1;
    }

    wait_for_signal();

    monitor.stop();
    std::puts("[pins] shutting down");
    return 0;
}

static int cmd_decode(const char* text) {
    using namespace wiegand::rx;

    std::vector<uint8_t> bits;
    if (!FrameDecoder::parse_bits(text, bits)) {
        std::fprintf(stderr, "error: bits must be 0 or 1\n");
        return 1;
    }

    DecodeResult result = FrameDecoder::decode(bits);
    if (!result.ok()) {
        std::fprintf(stderr, "[decode] %zu-bit frame rejected (%s): %s\n",
                     bits.size(), status_name(result.status), result.error.c_str());
        return 1;
    }
    std::printf("[decode] %zu-bit frame: site %s, tag %s\n", bits.size(),
                result.card.site_code.c_str(), result.card.tag.c_str());
    return 0;
}

static int cmd_replay(const char* text) {
    using namespace wiegand::rx;

    std::vector<uint8_t> bits;
    if (!FrameDecoder::parse_bits(text, bits) || bits.empty()) {
        std::fprintf(stderr, "error: bits must be 0 or 1\n");
        return 1;
    }

    SimulatedLineProvider lines;
    auto d0 = lines.add("SIM_D0");
    auto d1 = lines.add("SIM_D1");

    // Shared with the detached callback thread.
    struct Received {
        std::mutex              mu;
        std::condition_variable cv;
        std::vector<std::string> tags;
    };
    auto received = std::make_shared<Received>();

    ReaderConfig cfg;
    cfg.d0_line       = "SIM_D0";
    cfg.d1_line       = "SIM_D1";
    cfg.timeout       = std::chrono::milliseconds(20);
    cfg.max_bits      = static_cast<int>(bits.size());
    cfg.poll_interval = std::chrono::milliseconds(10);
    cfg.callback      = [received](const std::string& tag) {
        std::lock_guard<std::mutex> lock(received->mu);
        received->tags.push_back(tag);
        received->cv.notify_all();
    };

    Reader reader;
    if (!reader.open(cfg, lines)) {
        std::fprintf(stderr, "error: %s\n", reader.error().c_str());
        return 1;
    }

    // One pulse at a time so bit order survives the two monitor threads.
    for (std::size_t i = 0; i < bits.size(); ++i) {
        (bits[i] ? d1 : d0)->pulse();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (reader.pending_bits() < i + 1 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    bool got = false;
    {
        std::unique_lock<std::mutex> lock(received->mu);
        got = received->cv.wait_for(lock, std::chrono::seconds(1),
                                    [&] { return !received->tags.empty(); });
        if (got) std::printf("[replay] callback tag: %s\n", received->tags.front().c_str());
    }
    reader.close();

    if (!got) {
        std::fprintf(stderr, "[replay] no tag received\n");
        return 1;
    }
    return 0;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const char* cmd = argv[1];
    int rc = 1;

    if (std::strcmp(cmd, "read") == 0 && argc >= 3) {
        rc = cmd_read(argc, argv);
    } else if (std::strcmp(cmd, "pins") == 0) {
        rc = cmd_pins(argc, argv);
    } else if (std::strcmp(cmd, "decode") == 0 && argc >= 3) {
        rc = cmd_decode(argv[2]);
    } else if (std::strcmp(cmd, "replay") == 0 && argc >= 3) {
        rc = cmd_replay(argv[2]);
    } else {
        print_usage();
    }

    return rc;
}
