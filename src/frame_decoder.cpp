#include "frame_decoder.hpp"

#include <cctype>

namespace wiegand::rx {

namespace {

// Ordered by bit count. Parity ranges include their own parity bit.
const std::vector<FrameLayout> kLayouts = {
    // bits  even parity  odd parity   site code    tag
    {26,     {0, 13},     {13, 13},    {1, 8},      {9, 16}},
    {34,     {0, 17},     {17, 17},    {1, 16},     {17, 16}},
    {37,     {0, 19},     {19, 18},    {1, 16},     {17, 19}},
};

constexpr std::size_t kMaxFieldBits = 64;

} // namespace

const char* status_name(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:              return "ok";
        case DecodeStatus::UnknownLength:   return "unknown_length";
        case DecodeStatus::ParityError:     return "parity_error";
        case DecodeStatus::InvalidBitValue: return "invalid_bit_value";
        case DecodeStatus::RangeError:      return "range_error";
    }
    return "unknown";
}

bool is_contract_violation(DecodeStatus status) {
    return status == DecodeStatus::InvalidBitValue ||
           status == DecodeStatus::RangeError;
}

const std::vector<FrameLayout>& FrameDecoder::layouts() { return kLayouts; }

const FrameLayout* FrameDecoder::layout_for(std::size_t bit_count) {
    for (const auto& layout : kLayouts) {
        if (layout.bit_count == bit_count) return &layout;
    }
    return nullptr;
}

bool FrameDecoder::check_parity(const std::vector<uint8_t>& bits,
                                std::size_t start, std::size_t length,
                                bool even) {
    if (start > bits.size() || length > bits.size() - start) return false;

    std::size_t ones = 0;
    for (std::size_t i = start; i < start + length; ++i) {
        if (bits[i] == 1) ++ones;
    }
    return even ? (ones % 2 == 0) : (ones % 2 == 1);
}

FieldResult FrameDecoder::decode_bits(const std::vector<uint8_t>& bits,
                                      std::size_t site_start, std::size_t site_length,
                                      std::size_t tag_start, std::size_t tag_length) {
    FieldResult result;

    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] > 1) {
            result.status = DecodeStatus::InvalidBitValue;
            result.error  = "invalid bit value " + std::to_string(bits[i]) +
                            " at position " + std::to_string(i);
            return result;
        }
    }

    auto in_range = [&](std::size_t start, std::size_t length) {
        return start <= bits.size() && length <= bits.size() - start &&
               length <= kMaxFieldBits;
    };

    if (!in_range(site_start, site_length)) {
        result.status = DecodeStatus::RangeError;
        result.error  = "site code range [" + std::to_string(site_start) + ", " +
                        std::to_string(site_start + site_length) +
                        ") outside " + std::to_string(bits.size()) + "-bit frame";
        return result;
    }
    if (!in_range(tag_start, tag_length)) {
        result.status = DecodeStatus::RangeError;
        result.error  = "tag range [" + std::to_string(tag_start) + ", " +
                        std::to_string(tag_start + tag_length) +
                        ") outside " + std::to_string(bits.size()) + "-bit frame";
        return result;
    }

    // Big-endian: first selected bit is the most significant.
    auto field = [&](std::size_t start, std::size_t length) {
        uint64_t value = 0;
        for (std::size_t i = start; i < start + length; ++i) {
            value = (value << 1) | bits[i];
        }
        return std::to_string(value);
    };

    result.site_code = field(site_start, site_length);
    result.tag       = field(tag_start, tag_length);
    return result;
}

DecodeResult FrameDecoder::decode(const std::vector<uint8_t>& bits) {
    DecodeResult result;
    result.card.bit_count = bits.size();

    const FrameLayout* layout = layout_for(bits.size());
    if (!layout) {
        result.status = DecodeStatus::UnknownLength;
        result.error  = "unrecognized " + std::to_string(bits.size()) +
                        "-bit frame";
        return result;
    }

    // Field extraction first: it also validates every bit value, which the
    // parity count would otherwise silently misread.
    FieldResult fields = decode_bits(bits,
                                     layout->site_code.start, layout->site_code.length,
                                     layout->tag.start, layout->tag.length);
    if (!fields.ok()) {
        result.status = fields.status;
        result.error  = fields.error;
        return result;
    }

    bool leading  = check_parity(bits, layout->even_parity.start,
                                 layout->even_parity.length, true);
    bool trailing = check_parity(bits, layout->odd_parity.start,
                                 layout->odd_parity.length, false);
    if (!leading || !trailing) {
        result.status = DecodeStatus::ParityError;
        result.error  = std::string("invalid ") +
                        (!leading ? "leading (even)" : "trailing (odd)") +
                        " parity for " + std::to_string(bits.size()) +
                        "-bit tag " + fields.tag;
        return result;
    }

    result.card.site_code = fields.site_code;
    result.card.tag       = fields.tag;
    return result;
}

bool FrameDecoder::parse_bits(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    for (char c : text) {
        if (c == '0' || c == '1') {
            out.push_back(static_cast<uint8_t>(c - '0'));
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string FrameDecoder::format_bits(const std::vector<uint8_t>& bits) {
    std::string s;
    s.reserve(bits.size());
    for (uint8_t b : bits) {
        s += (b == 0) ? '0' : (b == 1) ? '1' : '?';
    }
    return s;
}

} // namespace wiegand::rx
