#ifndef WIEGAND_RX_FRAME_DECODER_HPP
#define WIEGAND_RX_FRAME_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wiegand::rx {

/// Outcome of decoding a frame.
///
/// UnknownLength and ParityError are protocol rejections (line noise,
/// partial swipes). InvalidBitValue and RangeError mean a caller passed
/// arguments that no layout should ever produce.
enum class DecodeStatus {
    Ok,
    UnknownLength,
    ParityError,
    InvalidBitValue,
    RangeError
};

const char* status_name(DecodeStatus status);

/// True for statuses that indicate a defect rather than a bad frame.
bool is_contract_violation(DecodeStatus status);

/// Half-open bit range [start, start + length).
struct BitRange {
    std::size_t start  = 0;
    std::size_t length = 0;

    std::size_t end() const { return start + length; }
};

/// Bit layout of one Wiegand frame format.
struct FrameLayout {
    std::size_t bit_count;
    BitRange    even_parity;   // leading range, count of ones must be even
    BitRange    odd_parity;    // trailing range, count of ones must be odd
    BitRange    site_code;
    BitRange    tag;
};

/// Decoded card data.
struct DecodedResult {
    std::string tag;
    std::string site_code;
    std::size_t bit_count = 0;
};

/// Result of extracting the site and tag fields.
struct FieldResult {
    DecodeStatus status = DecodeStatus::Ok;
    std::string  site_code;
    std::string  tag;
    std::string  error;

    bool ok() const { return status == DecodeStatus::Ok; }
};

/// Result of a full frame decode.
struct DecodeResult {
    DecodeStatus  status = DecodeStatus::Ok;
    DecodedResult card;
    std::string   error;

    bool ok() const { return status == DecodeStatus::Ok; }
};

/// Stateless Wiegand frame decoder driven by a table of known layouts.
///
/// Supported formats:
///   26 bits  P | 8 site | 16 tag | P
///   34 bits  P | 16 site | 16 tag | P
///   37 bits  P | 16 site | 19 tag | P
/// The leading parity bit makes its range even, the trailing one makes
/// its range odd. Each parity range includes its own parity bit.
class FrameDecoder {
public:
    /// Layout for a frame of `bit_count` bits, or nullptr if unsupported.
    static const FrameLayout* layout_for(std::size_t bit_count);

    /// All supported layouts, ordered by bit count.
    static const std::vector<FrameLayout>& layouts();

    /// Decode a frame: select the layout, check both parity ranges and
    /// extract the fields.
    static DecodeResult decode(const std::vector<uint8_t>& bits);

    /// Extract site code and tag as big-endian unsigned decimal strings.
    /// Fails with InvalidBitValue if any element is not 0 or 1 and with
    /// RangeError if either range leaves the frame or exceeds 64 bits.
    static FieldResult decode_bits(const std::vector<uint8_t>& bits,
                                   std::size_t site_start, std::size_t site_length,
                                   std::size_t tag_start, std::size_t tag_length);

    /// True if the count of ones in [start, start + length) has the
    /// requested parity. False if the range leaves the frame.
    static bool check_parity(const std::vector<uint8_t>& bits,
                             std::size_t start, std::size_t length, bool even);

    /// Parse a string of '0'/'1' characters. Returns false on any other
    /// character (whitespace is skipped).
    static bool parse_bits(const std::string& text, std::vector<uint8_t>& out);

    /// Render bits as a '0'/'1' string.
    static std::string format_bits(const std::vector<uint8_t>& bits);
};

} // namespace wiegand::rx

#endif // WIEGAND_RX_FRAME_DECODER_HPP
