#include <fusion/bitstream/bit_stream.h>
#include <fusion/bitstream/formats.h>

#include <format>
#include <vector>

#include "check.h"

using namespace fusion;

void test_constructor() {
    test::section("constructor");
    BitStream bits("10");
    CHECK(bits.bits() == (std::vector<bool>{true, false}));

    bits = BitStream("10101100");
    CHECK(bits.bits() == (std::vector<bool>{true, false, true, false, true, true, false, false}));

    bits = BitStream("  1  ");
    CHECK(bits.size() == 1);

    bits = BitStream(std::vector<bool>{true, false, true, false});
    CHECK(bits.to_string() == "1010");
    CHECK(std::format("{}", bits) == "1010");

    CHECK_THROWS(FormatError, BitStream("10x1"));
}

void test_read_bit() {
    test::section("read bit");
    BitStream bits("1001");
    CHECK(bits.read(Bit{}) == true);
    CHECK(bits.read(Bit{}) == false);
    CHECK(bits.read(Bit{}) == false);
    CHECK(bits.read(Bit{}) == true);
    CHECK(bits.bits_available() == 0);
    CHECK_THROWS(EndOfStreamError, bits.read(Bit{}));
}

void test_write_bit() {
    test::section("write bit");
    BitStream bits;
    bits.write(true);
    bits.write(false);
    bits.write(1, Bit{});
    bits.write(0, Bit{});
    CHECK(bits.to_string() == "1010");
    CHECK(bits.bits_available() == 0);
}

void test_cursor() {
    test::section("cursor");
    BitStream bits("01001101");
    CHECK(bits.cursor() == 0);
    bits.seek(1, Whence::End);
    CHECK(bits.bits_available() == 1);
    CHECK(bits.read(Bit{}) == true);
    CHECK_THROWS(EndOfStreamError, bits.read(Bit{}));

    bits.rewind();
    CHECK(bits.bits_available() == 8);
    CHECK(bits.read(Bit{}) == false);
    CHECK(bits.read(Bits{2}) == (std::vector<bool>{true, false}));

    bits.seek(1, Whence::Cur);
    CHECK(bits.bits_available() == 4);
    CHECK(bits.read(Bits{2}) == (std::vector<bool>{true, true}));

    bits.skip_to_end();
    CHECK(bits.cursor() == bits.size());

    bits.set_cursor(0);
    CHECK(bits.read(Bits{8}).to_string() == bits.to_string());

    CHECK_THROWS(EndOfStreamError, bits.seek(9));
    CHECK_THROWS(EndOfStreamError, bits.seek(-1, Whence::Set));
    CHECK_THROWS(EndOfStreamError, bits.set_cursor(9));
    CHECK(bits.cursor() == 8);
}

void test_read_bits() {
    test::section("read bits");
    BitStream bits("1011001");
    CHECK(bits.read_bits(4) == (std::vector<bool>{true, false, true, true}));
    CHECK(bits.bits_available() == 3);
    CHECK_THROWS(EndOfStreamError, bits.read(Bits{4}));
    CHECK(bits.bits_available() == 3);

    bits = BitStream();
    bits.write("SWF", ByteString{});
    bits.rewind();
    BitStream swapped = bits.read(Bits{24, Endian::Little});
    CHECK(swapped.read(ByteString{3}) == "FWS");
    CHECK(bits.bits_available() == 0);
}

void test_write_bits() {
    test::section("write bits");
    const std::vector<bool> pattern{true, false, true, false};

    BitStream bits;
    bits.write(pattern);
    CHECK(bits.to_string() == "1010");

    // Overwrites in place, then extends
    bits = BitStream("11");
    bits.write(pattern);
    CHECK(bits.to_string() == "1010");

    bits = BitStream();
    bits.write(BitStream("0"), Bits{1});
    bits.write(BitStream("1"), Bits{1});
    CHECK(bits.to_string() == "01");
    CHECK_THROWS(FormatError, bits.write(BitStream("11"), Bits{1}));

    BitStream swf;
    swf.write("SWF", ByteString{});
    bits = BitStream();
    bits.write(swf, Bits{0, Endian::Little});
    bits.rewind();
    CHECK(bits.read(ByteString{3}) == "FWS");
    CHECK(bits.bits_available() == 0);
}

void test_overwrite_in_middle() {
    test::section("overwrite");
    BitStream bits("00000000");
    bits.seek(2);
    bits.write(BitStream("111"));
    CHECK(bits.to_string() == "00111000");
    CHECK(bits.cursor() == 5);
    CHECK(bits.size() == 8);
}

void test_flush() {
    test::section("flush");
    BitStream bits("11");
    bits.flush();
    CHECK(bits.to_string() == "11000000");
    CHECK(bits.bits_available() == 0);

    bits = BitStream("1111");
    bits.flush();
    CHECK(bits.to_string() == "11110000");
    CHECK(bits.bits_available() == 0);

    bits = BitStream("111111");
    bits.flush();
    CHECK(bits.to_string() == "11111100");
    CHECK(bits.bits_available() == 0);

    bits = BitStream("11111111");
    bits.flush();
    CHECK(bits.to_string() == "11111111");
    CHECK(bits.bits_available() == 0);

    // Pads from the end, not from the cursor
    bits = BitStream("1010101011");
    bits.rewind();
    bits.flush();
    CHECK(bits.size() == 16);
    CHECK(bits.to_string() == "1010101011000000");
    CHECK(bits.bits_available() == 0);
}

void test_bytes() {
    test::section("bytes");
    const std::vector<uint8_t> data{0x46, 0x57, 0x53, 0x0A};
    BitStream bits = BitStream::from_bytes(data);
    CHECK(bits.size() == 32);
    CHECK(bits.read(ByteString{3}) == "FWS");
    CHECK(bits.read(Byte{}) == 10);
    CHECK(bits.to_bytes() == data);

    BitStream partial("1");
    CHECK(partial.to_bytes() == (std::vector<uint8_t>{0x80}));
    CHECK(partial.size() == 1);
}

int main() {
    test_constructor();
    test_read_bit();
    test_write_bit();
    test_cursor();
    test_read_bits();
    test_write_bits();
    test_overwrite_in_middle();
    test_flush();
    test_bytes();
    return test::summary("bitstream");
}
