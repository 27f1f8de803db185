#include <chrono>
#include <cstdint>
#include <print>
#include <string>

#include <fusion/bitstream/bit_stream.h>
#include <fusion/bitstream/formats.h>
#include <fusion/config.h>

using namespace fusion;

const int LIMIT = 200'000;

template <typename Func>
double measure(const std::string& name, Func func) {
    std::print("Running {}... ", name);
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    std::println("{:.2f} ms", ms);
    return ms;
}

int main() {
    std::println("FUSION BITSTREAM BENCHMARK (v{})", FUSION_VERSION_STR);
    std::println("Scenario: {} values per format\n", LIMIT);

    BitStream varints;
    int64_t checksum = 0;

    double t_varint_write = measure("VarU32 encode", [&]() {
        for (int64_t i = 0; i < LIMIT; ++i) varints.write(i * 37, VarU32{});
    });
    double t_varint_read = measure("VarU32 decode", [&]() {
        varints.rewind();
        for (int i = 0; i < LIMIT; ++i) checksum += varints.read(VarU32{});
    });

    BitStream fields;
    double t_ub = measure("UB[13] round trip", [&]() {
        for (int i = 0; i < LIMIT; ++i) fields.write(static_cast<uint64_t>(i & 0x1FFF), UB{13});
        fields.rewind();
        for (int i = 0; i < LIMIT; ++i) checksum += static_cast<int64_t>(fields.read(UB{13}));
    });

    BitStream floats;
    double t_float = measure("Float32 round trip", [&]() {
        for (int i = 0; i < LIMIT; ++i) floats.write(i * 0.5, Float32);
        floats.rewind();
        for (int i = 0; i < LIMIT; ++i) checksum += static_cast<int64_t>(floats.read(Float32));
    });

    std::println("\nRESULT (checksum {}):", checksum);
    std::println("VarU32 encode: {:.2f} ms ({} bytes)", t_varint_write, varints.size() / 8);
    std::println("VarU32 decode: {:.2f} ms", t_varint_read);
    std::println("UB[13]:        {:.2f} ms", t_ub);
    std::println("Float32:       {:.2f} ms", t_float);
    return 0;
}
