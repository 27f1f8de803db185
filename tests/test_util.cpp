#include <fusion/avm2/util.h>
#include <fusion/bitstream/errors.h>

#include <cstdint>
#include <vector>

#include "check.h"

using namespace fusion;
using namespace fusion::avm2;

using Bytes = std::vector<uint8_t>;

void test_serialize_u32() {
    test::section("serialize u32");
    bool one_byte = true;
    for (int64_t i = 0; i < (1 << 7); ++i) {
        one_byte = one_byte && serialize_u32(i) == Bytes{static_cast<uint8_t>(i)};
    }
    CHECK(one_byte);

    bool two_bytes = true;
    for (int64_t i = 1 << 7; i < (1 << 14); ++i) {
        const Bytes expected{static_cast<uint8_t>(0x80 | (i & 0x7F)), static_cast<uint8_t>(i >> 7)};
        two_bytes = two_bytes && serialize_u32(i) == expected;
    }
    CHECK(two_bytes);

    bool three_bytes = true;
    for (int64_t i = 1 << 14; i < (1 << 16); ++i) {
        const Bytes expected{static_cast<uint8_t>(0x80 | (i & 0x7F)), static_cast<uint8_t>(0x80 | ((i >> 7) & 0x7F)),
                             static_cast<uint8_t>(i >> 14)};
        three_bytes = three_bytes && serialize_u32(i) == expected;
    }
    CHECK(three_bytes);

    for (int64_t i = int64_t{1} << 35; i < (int64_t{1} << 35) + 5; ++i) {
        CHECK_THROWS(FormatError, serialize_u32(i));
    }
    CHECK(serialize_u32(U32_MAX).size() == 5);
    CHECK_THROWS(FormatError, serialize_u32(U32_MAX + 1));
}

void test_serialize_u32_signed() {
    test::section("serialize s32");
    bool all = true;
    for (int64_t i = -1; i > -(1 << 16); --i) {
        const auto j = static_cast<uint32_t>(i);
        const Bytes expected{static_cast<uint8_t>((j & 0x7F) | 0x80), static_cast<uint8_t>(((j >> 7) & 0x7F) | 0x80),
                             static_cast<uint8_t>(((j >> 14) & 0x7F) | 0x80),
                             static_cast<uint8_t>(((j >> 21) & 0x7F) | 0x80), static_cast<uint8_t>((j >> 28) & 0x7F)};
        all = all && serialize_u32(i) == expected;
    }
    CHECK(all);
    CHECK(serialize_u32(S32_MIN).size() == 5);
    CHECK_THROWS(FormatError, serialize_u32(S32_MIN - 1));
    CHECK_THROWS(FormatError, serialize_u32(-(int64_t{1} << 35)));
}

void test_parse_u32() {
    test::section("parse u32");
    CHECK(parse_u32(Bytes{0x05}) == 5);

    std::size_t used = 0;
    CHECK(parse_u32(Bytes{0xAC, 0x02, 0xFF}, false, &used) == 300);
    CHECK(used == 2);

    const Bytes minus_one = serialize_u32(-1);
    CHECK(parse_u32(minus_one) == U32_MAX);
    CHECK(parse_u32(minus_one, true) == -1);
    CHECK(parse_u32(serialize_u32(S32_MAX), true) == S32_MAX);

    CHECK_THROWS(EndOfStreamError, parse_u32(Bytes{0x80, 0x80}));
    CHECK_THROWS(EndOfStreamError, parse_u32(Bytes{}));
}

int main() {
    test_serialize_u32();
    test_serialize_u32_signed();
    test_parse_u32();
    return test::summary("util");
}
