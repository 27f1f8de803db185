#pragma once

#include <cstdint>
#include <vector>

#include <fusion/avm2/instruction.h>

namespace fusion::avm2 {

// --- Configuration ---
enum class OptFlags : uint32_t {
    None      = 0,
    DeadCode  = 1 << 0, // NOPs and code no branch can reach
    Peephole  = 1 << 1, // jump-to-next-label, dup+pop

    // Presets
    O0        = None,
    O1        = DeadCode | Peephole,
    All       = 0xFFFFFFFF
};

[[nodiscard]] constexpr OptFlags operator|(OptFlags a, OptFlags b) { return (OptFlags)((uint32_t)a | (uint32_t)b); }
[[nodiscard]] constexpr OptFlags operator&(OptFlags a, OptFlags b) { return (OptFlags)((uint32_t)a & (uint32_t)b); }
[[nodiscard]] constexpr bool has_flag(OptFlags mask, OptFlags flag) { return (mask & flag) == flag; }

struct OptConfig {
    OptFlags flags = OptFlags::O1;
    int max_rounds = 5;
};

class Optimizer {
public:
    Optimizer(std::vector<Instruction>& code, OptConfig config) : code_(code), config_(config) {}

    // Returns the number of instructions removed.
    std::size_t run();

private:
    std::vector<Instruction>& code_;
    OptConfig config_;

    // --- Passes ---
    // Each returns true if it changed the code
    bool pass_dead_code();
    bool pass_peephole();
};

std::size_t optimize_code(std::vector<Instruction>& code, OptConfig config = {});

} // namespace fusion::avm2
