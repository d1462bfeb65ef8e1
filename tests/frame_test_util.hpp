#ifndef WIEGAND_RX_TESTS_FRAME_TEST_UTIL_HPP
#define WIEGAND_RX_TESTS_FRAME_TEST_UTIL_HPP

#include <cstdint>
#include <vector>

#include "frame_decoder.hpp"

namespace wiegand::rx::test {

inline void put_field(std::vector<uint8_t>& bits, const BitRange& range,
                      uint64_t value) {
    for (std::size_t i = 0; i < range.length; ++i) {
        bits[range.end() - 1 - i] = static_cast<uint8_t>((value >> i) & 1u);
    }
}

inline std::size_t count_ones(const std::vector<uint8_t>& bits,
                              std::size_t start, std::size_t end) {
    std::size_t ones = 0;
    for (std::size_t i = start; i < end; ++i) ones += bits[i];
    return ones;
}

/// Frame in `layout` carrying `site` and `tag` with both parity bits set.
inline std::vector<uint8_t> make_frame(const FrameLayout& layout,
                                       uint64_t site, uint64_t tag) {
    std::vector<uint8_t> bits(layout.bit_count, 0);
    put_field(bits, layout.site_code, site);
    put_field(bits, layout.tag, tag);

    const auto& even = layout.even_parity;
    bits[even.start] = static_cast<uint8_t>(
        count_ones(bits, even.start + 1, even.end()) % 2);

    const auto& odd = layout.odd_parity;
    bits[odd.end() - 1] = static_cast<uint8_t>(
        count_ones(bits, odd.start, odd.end() - 1) % 2 == 0 ? 1 : 0);
    return bits;
}

} // namespace wiegand::rx::test

#endif // WIEGAND_RX_TESTS_FRAME_TEST_UTIL_HPP
