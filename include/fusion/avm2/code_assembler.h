#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <meow_flat_map.h>

#include <fusion/avm2/instruction.h>

namespace fusion::avm2 {

class ConstantPool;

// The instruction list of one method body plus its register table.
class CodeAssembler {
public:
    CodeAssembler(ConstantPool* pool, const std::vector<std::string>& initial_locals);

    void add_instruction(Instruction inst);
    void add_instructions(std::vector<Instruction> insts);

    [[nodiscard]] const std::vector<Instruction>& instructions() const noexcept { return instructions_; }
    [[nodiscard]] std::vector<Instruction>& instructions() noexcept { return instructions_; }

    // Removes everything after the first `keep` instructions and hands it back.
    [[nodiscard]] std::vector<Instruction> detach_after(std::size_t keep);
    void reattach(std::vector<Instruction> tail);

    // --- Registers ---
    uint32_t set_local(std::string_view name);
    uint32_t kill_local(std::string_view name);
    [[nodiscard]] uint32_t get_local(std::string_view name) const;
    [[nodiscard]] bool has_local(std::string_view name) const;
    [[nodiscard]] uint32_t next_free_local() const noexcept;
    // Highest register count ever in use.
    [[nodiscard]] uint32_t local_count() const noexcept { return static_cast<uint32_t>(used_.size()); }

    // Patches the owning frames' exception tables from the try/catch markers.
    void resolve_exception_offsets();

private:
    void intern_operand(Instruction& inst);

    ConstantPool* pool_;
    std::vector<Instruction> instructions_;
    meow::flat_map<std::string, uint32_t> locals_;
    std::vector<bool> used_;
};

} // namespace fusion::avm2
