#include <fusion/avm2/instruction.h>

#include <format>
#include <stdexcept>

#include <meow_enum.h>

namespace fusion::avm2 {

namespace {

template <typename T>
const T& operand_as(const Instruction& inst, std::size_t i) {
    if (i >= inst.operands.size() || !inst.operands[i].holds<T>()) {
        throw std::runtime_error(std::format("{} has no operand {} of the requested type",
                                             meow::enum_name(inst.op), i));
    }
    return inst.operands[i].get<T>();
}

} // namespace

int64_t Instruction::int_operand(std::size_t i) const { return operand_as<int64_t>(*this, i); }
double Instruction::double_operand(std::size_t i) const { return operand_as<double>(*this, i); }
const std::string& Instruction::string_operand(std::size_t i) const { return operand_as<std::string>(*this, i); }
const QName& Instruction::name_operand(std::size_t i) const { return operand_as<QName>(*this, i); }

namespace ins {

Instruction make(Op op, std::vector<Operand> operands) {
    Instruction inst;
    inst.op = op;
    inst.operands = std::move(operands);
    return inst;
}

static Instruction with_int(Op op, int64_t v) {
    return make(op, {Operand(v)});
}

Instruction getlocal(uint32_t reg) {
    if (reg < 4) return make(static_cast<Op>(static_cast<uint8_t>(Op::GETLOCAL_0) + reg));
    return with_int(Op::GETLOCAL, reg);
}

Instruction setlocal(uint32_t reg) {
    if (reg < 4) return make(static_cast<Op>(static_cast<uint8_t>(Op::SETLOCAL_0) + reg));
    return with_int(Op::SETLOCAL, reg);
}

Instruction kill(uint32_t reg) { return with_int(Op::KILL, reg); }
Instruction getscopeobject(uint32_t index) { return with_int(Op::GETSCOPEOBJECT, index); }
Instruction getslot(uint32_t slot) { return with_int(Op::GETSLOT, slot); }
Instruction setslot(uint32_t slot) { return with_int(Op::SETSLOT, slot); }

Instruction pushbyte(int64_t v) { return with_int(Op::PUSHBYTE, v); }
Instruction pushint(int64_t v) { return with_int(Op::PUSHINT, v); }
Instruction pushuint(int64_t v) { return with_int(Op::PUSHUINT, v); }
Instruction pushdouble(double v) { return make(Op::PUSHDOUBLE, {Operand(v)}); }
Instruction pushstring(std::string s) { return make(Op::PUSHSTRING, {Operand(std::move(s))}); }

Instruction newarray(uint32_t count) { return with_int(Op::NEWARRAY, count); }
Instruction newobject(uint32_t count) { return with_int(Op::NEWOBJECT, count); }
Instruction newclass(uint32_t index) { return with_int(Op::NEWCLASS, index); }
Instruction newcatch(uint32_t index) { return with_int(Op::NEWCATCH, index); }
Instruction constructsuper(uint32_t argc) { return with_int(Op::CONSTRUCTSUPER, argc); }

Instruction label(std::string name) { return make(Op::LABEL, {Operand(std::move(name))}); }

Instruction branch(Op op, std::string label) {
    if (!get_op_info(op).branch) {
        throw std::invalid_argument(std::format("{} is not a branch", meow::enum_name(op)));
    }
    return make(op, {Operand(std::move(label))});
}

Instruction named(Op op, QName name) { return make(op, {Operand(std::move(name))}); }

Instruction call(Op op, QName name, uint32_t argc) {
    return make(op, {Operand(std::move(name)), Operand(static_cast<int64_t>(argc))});
}

Instruction begintry(MethodContext* owner) {
    Instruction inst = make(Op::BEGINTRY);
    inst.owner = owner;
    return inst;
}

Instruction endtry(MethodContext* owner) {
    Instruction inst = make(Op::ENDTRY);
    inst.owner = owner;
    return inst;
}

Instruction addexcinfo(MethodContext* owner, uint32_t exception_index) {
    Instruction inst = with_int(Op::ADDEXCINFO, exception_index);
    inst.owner = owner;
    return inst;
}

Instruction begincatch(MethodContext* owner, uint32_t exception_index) {
    Instruction inst = with_int(Op::BEGINCATCH, exception_index);
    inst.owner = owner;
    return inst;
}

} // namespace ins

} // namespace fusion::avm2
