#pragma once

#include <string>
#include <vector>

#include <fusion/avm2/instruction.h>

namespace fusion::avm2 {

struct AbcMethodBodyInfo;

// "pushstring       "hi" [3]": lowercase mnemonic, operands, constant pool slot if any.
[[nodiscard]] std::string disassemble_instruction(const Instruction& inst);
[[nodiscard]] std::string disassemble_code(const std::vector<Instruction>& code);
[[nodiscard]] std::string disassemble_body(const AbcMethodBodyInfo& body);

} // namespace fusion::avm2
