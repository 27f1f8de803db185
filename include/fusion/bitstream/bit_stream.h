#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fusion/bitstream/errors.h>

namespace fusion {

class BitStream;

enum class Whence : uint8_t { Set, Cur, End };

// Byte order of a multi-byte field. Little reverses whole 8-bit chunks, never the bits inside one.
enum class Endian : uint8_t { Big, Little };

// --- Format concepts ---
// A format names the decoded type as `value_type` and knows how to move it through a stream.
template <typename F>
concept Format = requires { typename F::value_type; };

template <typename F>
concept ReadableFormat = Format<F> && requires(const F& f, BitStream& s) { f.decode(s); };

template <typename F>
concept WritableFormat = Format<F> && !std::is_void_v<typename F::value_type> &&
    requires(const F& f, BitStream& s, const typename F::value_type& v) { f.encode(s, v); };

// Formats that carry no value (padding, alignment).
template <typename F>
concept MarkerFormat = Format<F> && std::is_void_v<typename F::value_type> &&
    requires(const F& f, BitStream& s) { f.encode(s); };

// Formats whose bit count is known before touching the stream.
template <typename F>
concept SizedFormat = requires(const F& f) {
    { f.bit_width() } -> std::convertible_to<std::size_t>;
};

class BitStream {
    std::vector<bool> bits_;
    std::size_t cursor_ = 0;

public:
    BitStream() = default;
    // Parses a literal of '0' and '1'; whitespace is ignored.
    explicit BitStream(std::string_view literal);
    explicit BitStream(std::vector<bool> bits) : bits_(std::move(bits)) {}

    // MSB-first, one byte after the other.
    [[nodiscard]] static BitStream from_bytes(std::span<const uint8_t> bytes);

    // --- Typed access ---
    // Reads are atomic: on failure the cursor is left where it was.
    template <ReadableFormat F>
    decltype(auto) read(const F& fmt) {
        const std::size_t start = cursor_;
        if constexpr (SizedFormat<F>) require(fmt.bit_width());
        try {
            return fmt.decode(*this);
        } catch (const BitStreamError&) {
            cursor_ = start;
            throw;
        }
    }

    template <WritableFormat F>
    void write(const typename F::value_type& value, const F& fmt) {
        fmt.encode(*this, value);
    }

    template <MarkerFormat F>
    void write(const F& fmt) {
        fmt.encode(*this);
    }

    // Format inferred from the value.
    void write(bool value);
    void write(std::string_view bytes);
    void write(const char* bytes) { write(std::string_view(bytes)); }
    void write(const std::vector<bool>& bits);
    void write(const BitStream& other);

    template <std::integral T>
    requires (!std::same_as<T, bool>)
    void write(T value) {
        if constexpr (std::is_signed_v<T>) {
            write_signed(static_cast<int64_t>(value));
        } else {
            write_unsigned(static_cast<uint64_t>(value));
        }
    }

    [[nodiscard]] BitStream read_bits(std::size_t count);
    [[nodiscard]] uint64_t read_int_value(std::size_t width);

    // --- Raw access used by formats ---
    void require(std::size_t count) const;
    [[nodiscard]] bool read_raw_bit();
    [[nodiscard]] std::vector<bool> read_raw(std::size_t count);
    void write_raw_bit(bool bit);
    void write_raw(const std::vector<bool>& bits);

    // --- Cursor ---
    void seek(std::ptrdiff_t offset, Whence whence = Whence::Set);
    void rewind() noexcept { cursor_ = 0; }
    void skip_to_end() noexcept { cursor_ = bits_.size(); }
    void set_cursor(std::size_t pos);
    [[nodiscard]] std::size_t cursor() const noexcept { return cursor_; }
    [[nodiscard]] std::size_t bits_available() const noexcept { return bits_.size() - cursor_; }

    // Pads with zeros from the end to a byte boundary and moves the cursor to the end.
    void flush();

    // --- Inspection ---
    [[nodiscard]] std::size_t size() const noexcept { return bits_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bits_.empty(); }
    [[nodiscard]] bool operator[](std::size_t i) const { return bits_[i]; }
    [[nodiscard]] const std::vector<bool>& bits() const noexcept { return bits_; }
    [[nodiscard]] std::string to_string() const;
    // A trailing partial byte is zero-padded; the stream itself is not modified.
    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    bool operator==(const BitStream& other) const noexcept { return bits_ == other.bits_; }
    bool operator==(const std::vector<bool>& other) const noexcept { return bits_ == other; }

private:
    void write_unsigned(uint64_t value);
    void write_signed(int64_t value);
};

} // namespace fusion

template <>
struct std::formatter<fusion::BitStream> : std::formatter<std::string> {
    auto format(const fusion::BitStream& bits, std::format_context& ctx) const {
        return std::formatter<std::string>::format(bits.to_string(), ctx);
    }
};
