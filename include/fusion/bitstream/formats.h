#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <fusion/bitstream/bit_stream.h>

namespace fusion {

struct Bit {
    using value_type = bool;
    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return 1; }
    bool decode(BitStream& s) const;
    void encode(BitStream& s, bool value) const;
};

struct Byte {
    using value_type = uint8_t;
    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return 8; }
    uint8_t decode(BitStream& s) const;
    void encode(BitStream& s, uint8_t value) const;
};

// Unsigned bitfield, 1..64 bits. A width of 0 is inferred from the value on write.
struct UB {
    using value_type = uint64_t;
    unsigned width = 0;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return width; }
    uint64_t decode(BitStream& s) const;
    void encode(BitStream& s, uint64_t value) const;
};

// Two's-complement bitfield, 1..64 bits.
struct SB {
    using value_type = int64_t;
    unsigned width = 0;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return width; }
    int64_t decode(BitStream& s) const;
    void encode(BitStream& s, int64_t value) const;
};

// `count` whole bytes. Little reverses the byte sequence. A count of 0 writes the value as is.
struct ByteString {
    using value_type = std::string;
    std::size_t count = 0;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return count * 8; }
    std::string decode(BitStream& s) const;
    void encode(BitStream& s, const std::string& value) const;
};

// Bytes up to a zero byte; the terminator is consumed but not returned.
struct CString {
    using value_type = std::string;
    std::string decode(BitStream& s) const;
    void encode(BitStream& s, const std::string& value) const;
};

struct Zero {
    using value_type = void;
    std::size_t count = 8;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return count; }
    void decode(BitStream& s) const;
    void encode(BitStream& s) const;
};

// IEEE-style binary float. 16 bits is the SWF half float (exponent bias 16).
struct Float {
    using value_type = double;
    unsigned width = 32;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return width; }
    double decode(BitStream& s) const;
    void encode(BitStream& s, double value) const;
};

inline constexpr Float Float16{16};
inline constexpr Float Float32{32};
inline constexpr Float Float64{64};

struct Fixed {
    using value_type = double;
    unsigned int_bits = 16;
    unsigned frac_bits = 16;
    bool is_signed = true;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return int_bits + frac_bits; }
    double decode(BitStream& s) const;
    void encode(BitStream& s, double value) const;
};

// SWF FIXED (16.16) and FIXED8 (8.8).
inline constexpr Fixed Fixed16{16, 16, true, Endian::Little};
inline constexpr Fixed Fixed8{8, 8, true, Endian::Little};

// A raw block of bits. A count of 0 writes the value as is.
struct Bits {
    using value_type = BitStream;
    std::size_t count = 0;
    Endian endian = Endian::Big;

    [[nodiscard]] constexpr std::size_t bit_width() const noexcept { return count; }
    BitStream decode(BitStream& s) const;
    void encode(BitStream& s, const BitStream& value) const;
};

// AVM2 variable-length integer: 7 data bits per byte, low group first, high bit continues.
// At most 5 bytes; negative values are stored as their 32-bit two's-complement pattern.
struct VarU32 {
    using value_type = int64_t;
    bool is_signed = false;

    static constexpr int64_t min_value = -(int64_t{1} << 31);
    static constexpr int64_t max_value = (int64_t{1} << 32) - 1;

    int64_t decode(BitStream& s) const;
    void encode(BitStream& s, int64_t value) const;
};

} // namespace fusion
