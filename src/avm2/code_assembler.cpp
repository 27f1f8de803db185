#include <fusion/avm2/code_assembler.h>

#include <algorithm>
#include <format>
#include <optional>
#include <utility>

#include <meow_enum.h>

#include <fusion/avm2/constant_pool.h>
#include <fusion/avm2/context.h>
#include <fusion/avm2/errors.h>

namespace fusion::avm2 {

CodeAssembler::CodeAssembler(ConstantPool* pool, const std::vector<std::string>& initial_locals)
    : pool_(pool) {
    for (const auto& name : initial_locals) set_local(name);
}

void CodeAssembler::intern_operand(Instruction& inst) {
    if (!pool_ || inst.operands.empty()) return;
    switch (get_op_info(inst.op).pool) {
        case PoolKind::String:
            inst.pool_index = pool_->string_index(inst.string_operand());
            break;
        case PoolKind::Int:
            inst.pool_index = pool_->int_index(static_cast<int32_t>(inst.int_operand()));
            break;
        case PoolKind::UInt:
            inst.pool_index = pool_->uint_index(static_cast<uint32_t>(inst.int_operand()));
            break;
        case PoolKind::Double:
            inst.pool_index = pool_->double_index(inst.double_operand());
            break;
        case PoolKind::Multiname:
            inst.pool_index = pool_->multiname_index(inst.name_operand());
            break;
        case PoolKind::None:
            break;
    }
}

void CodeAssembler::add_instruction(Instruction inst) {
    intern_operand(inst);
    instructions_.push_back(std::move(inst));
}

void CodeAssembler::add_instructions(std::vector<Instruction> insts) {
    for (auto& inst : insts) add_instruction(std::move(inst));
}

std::vector<Instruction> CodeAssembler::detach_after(std::size_t keep) {
    if (keep >= instructions_.size()) return {};
    const auto first = instructions_.begin() + static_cast<std::ptrdiff_t>(keep);
    std::vector<Instruction> tail(std::make_move_iterator(first), std::make_move_iterator(instructions_.end()));
    instructions_.erase(first, instructions_.end());
    return tail;
}

void CodeAssembler::reattach(std::vector<Instruction> tail) {
    instructions_.insert(instructions_.end(), std::make_move_iterator(tail.begin()),
                         std::make_move_iterator(tail.end()));
}

// --- Registers ---

uint32_t CodeAssembler::next_free_local() const noexcept {
    const auto it = std::find(used_.begin(), used_.end(), false);
    return static_cast<uint32_t>(it - used_.begin());
}

uint32_t CodeAssembler::set_local(std::string_view name) {
    const std::string key(name);
    if (const uint32_t* reg = locals_.find(key)) return *reg;

    const uint32_t reg = next_free_local();
    if (reg == used_.size()) used_.push_back(true);
    else used_[reg] = true;
    locals_.try_emplace(key, reg);
    return reg;
}

uint32_t CodeAssembler::kill_local(std::string_view name) {
    const std::string key(name);
    const uint32_t* reg = locals_.find(key);
    if (!reg) throw LocalNotFoundError(name);
    const uint32_t freed = *reg;
    used_[freed] = false;
    locals_.erase(key);
    return freed;
}

uint32_t CodeAssembler::get_local(std::string_view name) const {
    const uint32_t* reg = locals_.find(std::string(name));
    if (!reg) throw LocalNotFoundError(name);
    return *reg;
}

bool CodeAssembler::has_local(std::string_view name) const {
    return locals_.contains(std::string(name));
}

// --- Exceptions ---

void CodeAssembler::resolve_exception_offsets() {
    struct Region { int64_t from; int64_t to; };

    std::vector<int64_t> open;
    std::optional<Region> closed;
    int64_t position = 0;

    for (const auto& inst : instructions_) {
        if (!is_pseudo(inst.op)) {
            ++position;
            continue;
        }
        if (!inst.owner) {
            throw CodegenError(std::format("{} marker has no owning method", meow::enum_name(inst.op)));
        }
        switch (inst.op) {
            case Op::BEGINTRY:
                open.push_back(position);
                break;
            case Op::ENDTRY:
                if (open.empty()) throw CodegenError("endtry without a matching begintry");
                closed = Region{open.back(), position};
                open.pop_back();
                break;
            case Op::ADDEXCINFO: {
                if (!closed) throw CodegenError("catch block without a preceding try block");
                auto& table = inst.owner->exceptions();
                const auto index = static_cast<std::size_t>(inst.int_operand());
                if (index >= table.size()) {
                    throw CodegenError(std::format("exception index {} out of range", index));
                }
                table[index].from = closed->from;
                table[index].to = closed->to;
                table[index].target = position;
                break;
            }
            default:
                break;
        }
    }
}

} // namespace fusion::avm2
