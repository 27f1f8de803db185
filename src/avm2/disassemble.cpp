#include <fusion/avm2/disassemble.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <type_traits>

#include <meow_enum.h>

#include <fusion/avm2/abc_file.h>
#include <fusion/avm2/code_assembler.h>

namespace fusion::avm2 {

namespace {

std::string mnemonic(Op op) {
    std::string name(meow::enum_name(op));
    if (name.empty()) return std::format("op_{:02x}", static_cast<unsigned>(op));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string operand_to_string(const Operand& operand) {
    return operand.visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, int64_t>) return std::to_string(v);
        else if constexpr (std::is_same_v<T, double>) return std::format("{:.6g}", v);
        else if constexpr (std::is_same_v<T, std::string>) return std::format("\"{}\"", v);
        else return v.full_name();
    });
}

} // namespace

std::string disassemble_instruction(const Instruction& inst) {
    std::string line;
    line.reserve(48);
    std::format_to(std::back_inserter(line), "{:<16}", mnemonic(inst.op));

    for (std::size_t i = 0; i < inst.operands.size(); ++i) {
        if (i > 0) line += ", ";
        line += operand_to_string(inst.operands[i]);
    }
    if (get_op_info(inst.op).pool != PoolKind::None && inst.pool_index != 0) {
        std::format_to(std::back_inserter(line), " [{}]", inst.pool_index);
    }
    while (!line.empty() && line.back() == ' ') line.pop_back();
    return line;
}

std::string disassemble_code(const std::vector<Instruction>& code) {
    std::string out;
    for (std::size_t i = 0; i < code.size(); ++i) {
        std::format_to(std::back_inserter(out), "{:04} {}\n", i, disassemble_instruction(code[i]));
    }
    return out;
}

std::string disassemble_body(const AbcMethodBodyInfo& body) {
    std::string out = std::format("method '{}' ({} locals, {} exceptions)\n",
                                  body.method ? body.method->name : std::string{},
                                  body.code ? body.code->local_count() : 0u, body.exceptions.size());
    if (body.code) out += disassemble_code(body.code->instructions());
    for (const auto& exc : body.exceptions) {
        std::format_to(std::back_inserter(out), "  catch {} from {} to {} target {}\n",
                       exc.type, exc.from, exc.to, exc.target);
    }
    return out;
}

} // namespace fusion::avm2
