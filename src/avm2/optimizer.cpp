#include <fusion/avm2/optimizer.h>

#include <algorithm>
#include <array>

#include <fusion/diagnostics/log.h>

namespace fusion::avm2 {

std::size_t optimize_code(std::vector<Instruction>& code, OptConfig config) {
    if (code.empty()) return 0;
    Optimizer opt(code, config);
    return opt.run();
}

// --- MAIN PIPELINE ---

std::size_t Optimizer::run() {
    struct PassDesc {
        OptFlags required_flag;
        bool (Optimizer::*func)();
    };

    static constexpr std::array pipeline = {
        PassDesc{OptFlags::DeadCode, &Optimizer::pass_dead_code},
        PassDesc{OptFlags::Peephole, &Optimizer::pass_peephole},
    };

    const std::size_t before = code_.size();
    bool changed = true;
    int rounds = 0;

    while (changed && rounds < config_.max_rounds) {
        changed = false;
        for (const auto& pass : pipeline) {
            if (has_flag(config_.flags, pass.required_flag)) {
                if ((this->*pass.func)()) changed = true;
            }
        }
        rounds++;
    }

    const std::size_t removed = before - code_.size();
    log_debug("OPT", "{} rounds, {} -> {} instructions", rounds, before, code_.size());
    return removed;
}

// --- PASS: Dead Code Elimination ---
// Labels and try/catch markers are entry points; everything else after a terminator is unreachable.
bool Optimizer::pass_dead_code() {
    bool reachable = true;
    auto it = std::remove_if(code_.begin(), code_.end(), [&](const Instruction& inst) {
        if (inst.op == Op::LABEL || is_pseudo(inst.op)) {
            reachable = true;
            return false;
        }
        if (!reachable || inst.op == Op::NOP) return true;
        if (get_op_info(inst.op).terminator) reachable = false;
        return false;
    });
    if (it == code_.end()) return false;
    code_.erase(it, code_.end());
    return true;
}

// --- PASS: Peephole Optimization ---
bool Optimizer::pass_peephole() {
    bool changed = false;
    std::vector<Instruction> next;
    next.reserve(code_.size());

    for (std::size_t i = 0; i < code_.size(); ++i) {
        const auto& inst = code_[i];
        if (i + 1 < code_.size()) {
            const auto& following = code_[i + 1];

            // jump L; label L
            if (inst.op == Op::JUMP && following.op == Op::LABEL &&
                inst.string_operand() == following.string_operand()) {
                changed = true;
                continue;
            }
            // dup; pop
            if (inst.op == Op::DUP && following.op == Op::POP) {
                changed = true;
                ++i;
                continue;
            }
        }
        next.push_back(inst);
    }
    if (changed) code_ = std::move(next);
    return changed;
}

} // namespace fusion::avm2
