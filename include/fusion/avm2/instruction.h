#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <meow_variant.h>

#include <fusion/avm2/op_codes.h>
#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

class MethodContext;

using Operand = meow::variant<int64_t, double, std::string, QName>;

struct Instruction {
    Op op = Op::NOP;
    std::vector<Operand> operands;
    // Constant pool slot of operand 0, filled in when the instruction is appended to a method.
    uint32_t pool_index = 0;
    // Method frame whose exception table a BEGINTRY/ENDTRY/ADDEXCINFO patches.
    MethodContext* owner = nullptr;

    [[nodiscard]] int64_t int_operand(std::size_t i = 0) const;
    [[nodiscard]] double double_operand(std::size_t i = 0) const;
    [[nodiscard]] const std::string& string_operand(std::size_t i = 0) const;
    [[nodiscard]] const QName& name_operand(std::size_t i = 0) const;
};

// --- Instruction factories ---
namespace ins {

[[nodiscard]] Instruction make(Op op, std::vector<Operand> operands = {});

[[nodiscard]] Instruction getlocal(uint32_t reg);
[[nodiscard]] Instruction setlocal(uint32_t reg);
[[nodiscard]] Instruction kill(uint32_t reg);
[[nodiscard]] Instruction getscopeobject(uint32_t index);
[[nodiscard]] Instruction getslot(uint32_t slot);
[[nodiscard]] Instruction setslot(uint32_t slot);

[[nodiscard]] Instruction pushbyte(int64_t v);
[[nodiscard]] Instruction pushint(int64_t v);
[[nodiscard]] Instruction pushuint(int64_t v);
[[nodiscard]] Instruction pushdouble(double v);
[[nodiscard]] Instruction pushstring(std::string s);

[[nodiscard]] Instruction newarray(uint32_t count);
[[nodiscard]] Instruction newobject(uint32_t count);
[[nodiscard]] Instruction newclass(uint32_t index);
[[nodiscard]] Instruction newcatch(uint32_t index);
[[nodiscard]] Instruction constructsuper(uint32_t argc);

[[nodiscard]] Instruction label(std::string name);
[[nodiscard]] Instruction branch(Op op, std::string label);

// Ops whose only operand is a multiname (getlex, coerce, istype, ...)
[[nodiscard]] Instruction named(Op op, QName name);
// Ops taking a multiname and an argument count (callproperty, constructprop, ...)
[[nodiscard]] Instruction call(Op op, QName name, uint32_t argc);

[[nodiscard]] Instruction begintry(MethodContext* owner);
[[nodiscard]] Instruction endtry(MethodContext* owner);
[[nodiscard]] Instruction addexcinfo(MethodContext* owner, uint32_t exception_index);
[[nodiscard]] Instruction begincatch(MethodContext* owner, uint32_t exception_index);

} // namespace ins

} // namespace fusion::avm2
