#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace fusion::avm2 {

inline constexpr int64_t U32_MAX = 0xFFFFFFFFLL;
inline constexpr int64_t S32_MAX = 0x7FFFFFFFLL;
inline constexpr int64_t S32_MIN = -0x80000000LL;

// AVM2 variable-length encoding of a u30/u32/s32 value. Throws FormatError outside [S32_MIN, U32_MAX].
[[nodiscard]] std::vector<uint8_t> serialize_u32(int64_t value);

// Decodes one value from the front of `bytes`. `consumed`, when given, receives the byte count.
[[nodiscard]] int64_t parse_u32(std::span<const uint8_t> bytes, bool is_signed = false, std::size_t* consumed = nullptr);

} // namespace fusion::avm2
