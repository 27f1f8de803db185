#include <fusion/avm2/util.h>

#include <fusion/bitstream/bit_stream.h>
#include <fusion/bitstream/formats.h>

namespace fusion::avm2 {

std::vector<uint8_t> serialize_u32(int64_t value) {
    BitStream bits;
    bits.write(value, VarU32{});
    return bits.to_bytes();
}

int64_t parse_u32(std::span<const uint8_t> bytes, bool is_signed, std::size_t* consumed) {
    BitStream bits = BitStream::from_bytes(bytes);
    const int64_t value = bits.read(VarU32{is_signed});
    if (consumed) *consumed = bits.cursor() / 8;
    return value;
}

} // namespace fusion::avm2
