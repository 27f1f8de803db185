#include <fusion/bitstream/bit_stream.h>
#include <fusion/bitstream/formats.h>

#include <bit>
#include <cctype>
#include <format>

namespace fusion {

BitStream::BitStream(std::string_view literal) {
    bits_.reserve(literal.size());
    for (char c : literal) {
        if (c == '0' || c == '1') {
            bits_.push_back(c == '1');
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            throw FormatError(std::format("Invalid character '{}' in bit literal", c));
        }
    }
}

BitStream BitStream::from_bytes(std::span<const uint8_t> bytes) {
    BitStream out;
    out.bits_.reserve(bytes.size() * 8);
    for (uint8_t b : bytes) {
        for (int i = 7; i >= 0; --i) out.bits_.push_back(((b >> i) & 1) != 0);
    }
    return out;
}

// --- Inferred formats ---

void BitStream::write(bool value) {
    write(value, Bit{});
}

void BitStream::write(std::string_view bytes) {
    write(std::string(bytes), ByteString{});
}

void BitStream::write(const std::vector<bool>& bits) {
    write_raw(bits);
}

void BitStream::write(const BitStream& other) {
    write_raw(other.bits_);
}

void BitStream::write_unsigned(uint64_t value) {
    const unsigned width = value == 0 ? 1u : static_cast<unsigned>(std::bit_width(value));
    write(value, UB{width});
}

void BitStream::write_signed(int64_t value) {
    if (value >= 0) {
        write_unsigned(static_cast<uint64_t>(value));
        return;
    }
    const auto magnitude = static_cast<uint64_t>(~value);
    write(value, SB{static_cast<unsigned>(std::bit_width(magnitude)) + 1});
}

BitStream BitStream::read_bits(std::size_t count) {
    return read(Bits{count});
}

uint64_t BitStream::read_int_value(std::size_t width) {
    return read(UB{static_cast<unsigned>(width)});
}

// --- Raw access ---

void BitStream::require(std::size_t count) const {
    if (count > bits_available()) {
        throw EndOfStreamError(std::format(
            "Cannot read {} bits at position {}: only {} available", count, cursor_, bits_available()));
    }
}

bool BitStream::read_raw_bit() {
    require(1);
    return bits_[cursor_++];
}

std::vector<bool> BitStream::read_raw(std::size_t count) {
    require(count);
    std::vector<bool> out(bits_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                          bits_.begin() + static_cast<std::ptrdiff_t>(cursor_ + count));
    cursor_ += count;
    return out;
}

void BitStream::write_raw_bit(bool bit) {
    if (cursor_ < bits_.size()) {
        bits_[cursor_] = bit;
    } else {
        bits_.push_back(bit);
    }
    ++cursor_;
}

void BitStream::write_raw(const std::vector<bool>& bits) {
    for (bool b : bits) write_raw_bit(b);
}

// --- Cursor ---

void BitStream::seek(std::ptrdiff_t offset, Whence whence) {
    std::ptrdiff_t target = offset;
    switch (whence) {
        case Whence::Set: target = offset; break;
        case Whence::Cur: target = static_cast<std::ptrdiff_t>(cursor_) + offset; break;
        case Whence::End: target = static_cast<std::ptrdiff_t>(bits_.size()) - offset; break;
    }
    if (target < 0 || target > static_cast<std::ptrdiff_t>(bits_.size())) {
        throw EndOfStreamError(std::format("Seek target {} outside of stream of {} bits", target, bits_.size()));
    }
    cursor_ = static_cast<std::size_t>(target);
}

void BitStream::set_cursor(std::size_t pos) {
    if (pos > bits_.size()) {
        throw EndOfStreamError(std::format("Cursor {} outside of stream of {} bits", pos, bits_.size()));
    }
    cursor_ = pos;
}

void BitStream::flush() {
    const std::size_t rem = bits_.size() % 8;
    if (rem != 0) bits_.resize(bits_.size() + (8 - rem), false);
    cursor_ = bits_.size();
}

// --- Inspection ---

std::string BitStream::to_string() const {
    std::string out;
    out.reserve(bits_.size());
    for (bool b : bits_) out.push_back(b ? '1' : '0');
    return out;
}

std::vector<uint8_t> BitStream::to_bytes() const {
    std::vector<uint8_t> out((bits_.size() + 7) / 8, 0);
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) out[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
    }
    return out;
}

} // namespace fusion
