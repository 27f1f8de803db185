#include <fusion/bitstream/formats.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <format>
#include <limits>
#include <string_view>
#include <utility>

namespace fusion {

namespace {

constexpr std::size_t CHUNK_BITS = 8;

// Reverses the order of 8-bit chunks. On read the short chunk sits at the end of the raw
// field, on write it leads the logical value, so the two directions are exact inverses.
std::vector<bool> swap_chunks(const std::vector<bool>& bits, bool partial_first) {
    const std::size_t n = bits.size();
    const std::size_t rem = n % CHUNK_BITS;

    std::vector<std::pair<std::size_t, std::size_t>> chunks;
    std::size_t pos = 0;
    if (partial_first && rem != 0) {
        chunks.emplace_back(0, rem);
        pos = rem;
    }
    while (pos + CHUNK_BITS <= n) {
        chunks.emplace_back(pos, CHUNK_BITS);
        pos += CHUNK_BITS;
    }
    if (pos < n) chunks.emplace_back(pos, n - pos);

    std::vector<bool> out;
    out.reserve(n);
    for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
        auto first = bits.begin() + static_cast<std::ptrdiff_t>(it->first);
        out.insert(out.end(), first, first + static_cast<std::ptrdiff_t>(it->second));
    }
    return out;
}

std::vector<bool> read_ordered(BitStream& s, std::size_t width, Endian endian) {
    auto raw = s.read_raw(width);
    return endian == Endian::Little ? swap_chunks(raw, false) : raw;
}

void write_ordered(BitStream& s, const std::vector<bool>& logical, Endian endian) {
    s.write_raw(endian == Endian::Little ? swap_chunks(logical, true) : logical);
}

uint64_t to_uint(const std::vector<bool>& bits) {
    uint64_t v = 0;
    for (bool b : bits) v = (v << 1) | (b ? 1u : 0u);
    return v;
}

std::vector<bool> from_uint(uint64_t v, std::size_t width) {
    std::vector<bool> out(width);
    for (std::size_t i = 0; i < width; ++i) {
        out[width - 1 - i] = ((v >> i) & 1u) != 0;
    }
    return out;
}

constexpr uint64_t low_mask(unsigned width) {
    return width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
}

int64_t sign_extend(uint64_t raw, unsigned width) {
    if (width < 64 && ((raw >> (width - 1)) & 1u) != 0) raw |= ~low_mask(width);
    return static_cast<int64_t>(raw);
}

void check_width(unsigned width, std::string_view format) {
    if (width == 0 || width > 64) {
        throw FormatError(std::format("{} width must be between 1 and 64 bits, got {}", format, width));
    }
}

uint8_t read_byte(BitStream& s) {
    return static_cast<uint8_t>(to_uint(s.read_raw(8)));
}

void write_byte(BitStream& s, uint8_t b) {
    s.write_raw(from_uint(b, 8));
}

struct FloatLayout {
    unsigned exp_bits;
    unsigned mant_bits;
    int bias;
};

FloatLayout float_layout(unsigned width) {
    switch (width) {
        case 16: return {5, 10, 16};
        case 32: return {8, 23, 127};
        case 64: return {11, 52, 1023};
        default: throw FormatError(std::format("Unsupported float width {}", width));
    }
}

} // namespace

// --- Bit / Byte ---

bool Bit::decode(BitStream& s) const {
    return s.read_raw_bit();
}

void Bit::encode(BitStream& s, bool value) const {
    s.write_raw_bit(value);
}

uint8_t Byte::decode(BitStream& s) const {
    return read_byte(s);
}

void Byte::encode(BitStream& s, uint8_t value) const {
    write_byte(s, value);
}

// --- Bitfields ---

uint64_t UB::decode(BitStream& s) const {
    check_width(width, "UB");
    return to_uint(read_ordered(s, width, endian));
}

void UB::encode(BitStream& s, uint64_t value) const {
    unsigned w = width;
    if (w == 0) {
        w = value == 0 ? 1u : static_cast<unsigned>(std::bit_width(value));
        if (endian == Endian::Little) w = (w + 7) / 8 * 8;
    }
    check_width(w, "UB");
    if ((value & ~low_mask(w)) != 0) {
        throw FormatError(std::format("Value {} does not fit in UB[{}]", value, w));
    }
    write_ordered(s, from_uint(value, w), endian);
}

int64_t SB::decode(BitStream& s) const {
    check_width(width, "SB");
    return sign_extend(to_uint(read_ordered(s, width, endian)), width);
}

void SB::encode(BitStream& s, int64_t value) const {
    unsigned w = width;
    if (w == 0) {
        const auto magnitude = static_cast<uint64_t>(value < 0 ? ~value : value);
        w = static_cast<unsigned>(std::bit_width(magnitude)) + 1;
        if (endian == Endian::Little) w = (w + 7) / 8 * 8;
    }
    check_width(w, "SB");
    if (w < 64) {
        const int64_t lo = -(int64_t{1} << (w - 1));
        const int64_t hi = (int64_t{1} << (w - 1)) - 1;
        if (value < lo || value > hi) {
            throw FormatError(std::format("Value {} does not fit in SB[{}]", value, w));
        }
    }
    write_ordered(s, from_uint(static_cast<uint64_t>(value) & low_mask(w), w), endian);
}

// --- Strings ---

std::string ByteString::decode(BitStream& s) const {
    if (count == 0) throw FormatError("ByteString needs a byte count to be read");
    std::string out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) out.push_back(static_cast<char>(read_byte(s)));
    if (endian == Endian::Little) std::reverse(out.begin(), out.end());
    return out;
}

void ByteString::encode(BitStream& s, const std::string& value) const {
    if (count != 0 && value.size() != count) {
        throw FormatError(std::format("ByteString[{}] cannot hold {} bytes", count, value.size()));
    }
    if (endian == Endian::Little) {
        for (auto it = value.rbegin(); it != value.rend(); ++it) write_byte(s, static_cast<uint8_t>(*it));
    } else {
        for (char c : value) write_byte(s, static_cast<uint8_t>(c));
    }
}

std::string CString::decode(BitStream& s) const {
    std::string out;
    while (true) {
        if (s.bits_available() < 8) {
            throw FormatError("CString is missing its zero terminator");
        }
        const uint8_t b = read_byte(s);
        if (b == 0) break;
        out.push_back(static_cast<char>(b));
    }
    return out;
}

void CString::encode(BitStream& s, const std::string& value) const {
    if (value.find('\0') != std::string::npos) {
        throw FormatError("CString value contains a zero byte");
    }
    for (char c : value) write_byte(s, static_cast<uint8_t>(c));
    write_byte(s, 0);
}

void Zero::decode(BitStream& s) const {
    const auto bits = s.read_raw(count);
    if (std::find(bits.begin(), bits.end(), true) != bits.end()) {
        throw FormatError(std::format("Expected {} zero bits", count));
    }
}

void Zero::encode(BitStream& s) const {
    s.write_raw(std::vector<bool>(count, false));
}

// --- Floating point ---

double Float::decode(BitStream& s) const {
    const auto layout = float_layout(width);
    const uint64_t raw = to_uint(read_ordered(s, width, endian));

    const bool negative = ((raw >> (width - 1)) & 1u) != 0;
    const uint64_t exp = (raw >> layout.mant_bits) & low_mask(layout.exp_bits);
    const uint64_t mant = raw & low_mask(layout.mant_bits);
    const uint64_t exp_max = low_mask(layout.exp_bits);

    double v = 0.0;
    if (exp == exp_max) {
        v = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
    } else if (exp == 0) {
        v = std::ldexp(static_cast<double>(mant), 1 - layout.bias - static_cast<int>(layout.mant_bits));
    } else {
        const double significand = static_cast<double>(mant | (uint64_t{1} << layout.mant_bits));
        v = std::ldexp(significand, static_cast<int>(exp) - layout.bias - static_cast<int>(layout.mant_bits));
    }
    return negative ? -v : v;
}

void Float::encode(BitStream& s, double value) const {
    const auto layout = float_layout(width);
    const uint64_t exp_max = low_mask(layout.exp_bits);
    const uint64_t inf_pattern = exp_max << layout.mant_bits;
    const int mant_bits = static_cast<int>(layout.mant_bits);

    uint64_t pattern = 0;
    if (std::isnan(value)) {
        pattern = inf_pattern | (uint64_t{1} << (layout.mant_bits - 1));
    } else if (std::isinf(value)) {
        pattern = inf_pattern;
    } else if (value != 0.0) {
        const double mag = std::fabs(value);
        int e = 0;
        std::frexp(mag, &e);
        const int biased = e - 1 + layout.bias;
        if (biased <= 0) {
            pattern = static_cast<uint64_t>(std::nearbyint(std::ldexp(mag, mant_bits + layout.bias - 1)));
        } else if (static_cast<uint64_t>(biased) >= exp_max) {
            pattern = inf_pattern;
        } else {
            const double scaled = std::nearbyint(std::ldexp(mag, mant_bits - (e - 1)));
            const uint64_t mant = static_cast<uint64_t>(scaled) - (uint64_t{1} << layout.mant_bits);
            // A rounding carry out of the mantissa bumps the exponent
            pattern = (static_cast<uint64_t>(biased) << layout.mant_bits) + mant;
        }
        pattern = std::min(pattern, inf_pattern);
    }
    if (std::signbit(value)) pattern |= uint64_t{1} << (width - 1);
    write_ordered(s, from_uint(pattern, width), endian);
}

// --- Fixed point ---

double Fixed::decode(BitStream& s) const {
    const unsigned w = int_bits + frac_bits;
    check_width(w, "Fixed");
    const uint64_t raw = to_uint(read_ordered(s, w, endian));
    if (is_signed) {
        return std::ldexp(static_cast<double>(sign_extend(raw, w)), -static_cast<int>(frac_bits));
    }
    return std::ldexp(static_cast<double>(raw), -static_cast<int>(frac_bits));
}

void Fixed::encode(BitStream& s, double value) const {
    const unsigned w = int_bits + frac_bits;
    check_width(w, "Fixed");
    const double scaled = std::nearbyint(std::ldexp(value, static_cast<int>(frac_bits)));
    const double lo = is_signed ? -std::ldexp(1.0, static_cast<int>(w) - 1) : 0.0;
    // Exclusive bound: 2^w - 1 is not representable as a double once w reaches 64.
    const double hi = is_signed ? std::ldexp(1.0, static_cast<int>(w) - 1) : std::ldexp(1.0, static_cast<int>(w));
    if (!std::isfinite(scaled) || scaled < lo || scaled >= hi) {
        throw FormatError(std::format("Value {} does not fit in {}.{} fixed point", value, int_bits, frac_bits));
    }
    const uint64_t raw = is_signed ? static_cast<uint64_t>(static_cast<int64_t>(scaled))
                                   : static_cast<uint64_t>(scaled);
    write_ordered(s, from_uint(raw & low_mask(w), w), endian);
}

// --- Raw bits ---

BitStream Bits::decode(BitStream& s) const {
    return BitStream(read_ordered(s, count, endian));
}

void Bits::encode(BitStream& s, const BitStream& value) const {
    if (count != 0 && value.size() != count) {
        throw FormatError(std::format("Bits[{}] cannot hold {} bits", count, value.size()));
    }
    write_ordered(s, value.bits(), endian);
}

// --- AVM2 variable-length integers ---

int64_t VarU32::decode(BitStream& s) const {
    uint64_t result = 0;
    for (int i = 0; i < 5; ++i) {
        if (s.bits_available() < 8) {
            throw EndOfStreamError("Variable-length integer runs past the end of the stream");
        }
        const uint8_t b = read_byte(s);
        result |= static_cast<uint64_t>(b & 0x7F) << (7 * i);
        if ((b & 0x80) == 0) break;
    }
    const auto u32 = static_cast<uint32_t>(result & 0xFFFFFFFFu);
    if (is_signed) return static_cast<int32_t>(u32);
    return u32;
}

void VarU32::encode(BitStream& s, int64_t value) const {
    if (value < min_value || value > max_value) {
        throw FormatError(std::format("Value {} is out of range for a variable-length u32", value));
    }
    auto u = static_cast<uint32_t>(static_cast<uint64_t>(value) & 0xFFFFFFFFu);
    do {
        uint8_t b = u & 0x7F;
        u >>= 7;
        if (u != 0) b |= 0x80;
        write_byte(s, b);
    } while (u != 0);
}

} // namespace fusion
