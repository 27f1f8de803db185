#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <meow_flat_map.h>

#include <fusion/avm2/abc_file.h>
#include <fusion/avm2/instruction.h>
#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

class CodeGenerator;
class CodeAssembler;
class ScriptContext;
class ClassContext;
class MethodContext;

enum class ContextType : uint8_t { Global, Script, Class, Method };

[[nodiscard]] constexpr std::string_view context_type_name(ContextType type) noexcept {
    switch (type) {
        case ContextType::Global: return "global";
        case ContextType::Script: return "script";
        case ContextType::Class:  return "class";
        case ContextType::Method: return "method";
    }
    return "unknown";
}

enum class MethodKind : uint8_t { Method, Getter, Setter };

// (type, name) of one declared parameter.
struct Param {
    QName type;
    std::string name;
};
using ParamList = std::vector<Param>;

// --- Base ---
class Context {
public:
    Context(CodeGenerator& gen, Context* parent) : gen_(gen), parent_(parent) {}
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    virtual ~Context() = default;

    [[nodiscard]] virtual ContextType type() const noexcept = 0;

    // Commits this frame's state and returns the frame that becomes current.
    virtual Context* exit() = 0;

    [[nodiscard]] Context* parent() const noexcept { return parent_; }
    [[nodiscard]] CodeGenerator& generator() const noexcept { return gen_; }

protected:
    CodeGenerator& gen_;
    Context* parent_;
};

class GlobalContext final : public Context {
public:
    static constexpr ContextType kind = ContextType::Global;

    explicit GlobalContext(CodeGenerator& gen) : Context(gen, nullptr) {}

    [[nodiscard]] ContextType type() const noexcept override { return kind; }
    Context* exit() override { return nullptr; }

    ScriptContext& new_script();
};

// Scripts and classes: frames that own traits and can open methods.
class MethodOwner : public Context {
public:
    using Context::Context;

    MethodContext& new_method(const QName& name, ParamList params = {}, QName rettype = QName("void"),
                              MethodKind kind = MethodKind::Method, bool is_static = false,
                              bool is_override = false, std::optional<bool> optimize = std::nullopt);

    void add_slot(const QName& name, const QName& type, bool is_static = false, bool is_const = false);

    virtual void add_instance_trait(AbcTrait trait) = 0;
    virtual void add_static_trait(AbcTrait trait) = 0;
    // Whether a method `name` at this level already exists up the superclass chain.
    [[nodiscard]] virtual bool overridden(bool is_static, const QName& name) const = 0;

protected:
    [[nodiscard]] static std::shared_ptr<AbcMethodInfo> new_method_info(std::string name, const ParamList& params,
                                                                       const QName& rettype);
};

// --- Script ---
class ScriptContext final : public MethodOwner {
public:
    static constexpr ContextType kind = ContextType::Script;

    ScriptContext(CodeGenerator& gen, Context* parent) : MethodOwner(gen, parent) {}

    [[nodiscard]] ContextType type() const noexcept override { return kind; }
    Context* exit() override;

    MethodContext& make_init(std::optional<bool> optimize = std::nullopt);
    // Re-entering a class that is still pending in this script returns the same frame.
    ClassContext& new_class(const QName& name, std::optional<QName> super_name = std::nullopt,
                            std::optional<std::vector<QName>> bases = std::nullopt);

    void add_instance_trait(AbcTrait trait) override { traits_.push_back(std::move(trait)); }
    void add_static_trait(AbcTrait trait) override { traits_.push_back(std::move(trait)); }
    [[nodiscard]] bool overridden(bool, const QName&) const override { return false; }

    [[nodiscard]] ClassContext* pending_class(const QName& name) const;
    [[nodiscard]] const std::vector<QName>& pending_order() const noexcept { return order_; }
    [[nodiscard]] const std::vector<AbcTrait>& traits() const noexcept { return traits_; }
    [[nodiscard]] MethodContext* init() const noexcept { return init_; }
    [[nodiscard]] const std::shared_ptr<AbcScriptInfo>& record() const noexcept { return record_; }
    [[nodiscard]] bool done() const noexcept { return done_; }

private:
    struct PendingClass {
        ClassContext* context = nullptr;
        std::optional<std::vector<QName>> bases;  // none: walk the superclass chain
    };

    void emit_class_setup(MethodContext& init, const PendingClass& pending);

    meow::flat_map<QName, PendingClass> pending_;
    std::vector<QName> order_;
    std::vector<AbcTrait> traits_;
    MethodContext* init_ = nullptr;
    std::shared_ptr<AbcScriptInfo> record_;
    bool done_ = false;
};

// --- Class ---
class ClassContext final : public MethodOwner {
public:
    static constexpr ContextType kind = ContextType::Class;

    ClassContext(CodeGenerator& gen, Context* parent, QName name, std::optional<QName> super_name);

    [[nodiscard]] ContextType type() const noexcept override { return kind; }
    Context* exit() override;

    MethodContext& make_cinit(std::optional<bool> optimize = std::nullopt);
    MethodContext& make_iinit(ParamList params = {}, std::optional<bool> optimize = std::nullopt);

    void add_instance_trait(AbcTrait trait) override { instance_traits_.push_back(std::move(trait)); }
    void add_static_trait(AbcTrait trait) override { static_traits_.push_back(std::move(trait)); }
    [[nodiscard]] bool overridden(bool is_static, const QName& name) const override;

    // A method, getter or setter trait of this name at the given level.
    [[nodiscard]] bool declares_method(const QName& name, bool is_static) const;

    [[nodiscard]] const QName& name() const noexcept { return name_; }
    [[nodiscard]] const QName& super_name() const noexcept { return super_name_; }
    [[nodiscard]] const std::vector<AbcTrait>& instance_traits() const noexcept { return instance_traits_; }
    [[nodiscard]] const std::vector<AbcTrait>& static_traits() const noexcept { return static_traits_; }
    [[nodiscard]] MethodContext* cinit() const noexcept { return cinit_; }
    [[nodiscard]] MethodContext* iinit() const noexcept { return iinit_; }
    [[nodiscard]] const std::shared_ptr<AbcInstanceInfo>& instance() const noexcept { return instance_; }
    [[nodiscard]] const std::shared_ptr<AbcClassInfo>& class_info() const noexcept { return class_info_; }
    // Position in the instance table; valid once the class has exited.
    [[nodiscard]] uint32_t index() const noexcept { return index_; }

private:
    [[nodiscard]] const ScriptContext* script() const noexcept;

    QName name_;
    QName super_name_;
    std::vector<AbcTrait> instance_traits_;
    std::vector<AbcTrait> static_traits_;
    MethodContext* cinit_ = nullptr;
    MethodContext* iinit_ = nullptr;
    std::shared_ptr<AbcInstanceInfo> instance_;
    std::shared_ptr<AbcClassInfo> class_info_;
    uint32_t index_ = 0;
};

// --- Method ---
// Catch blocks are overlays on the method frame: each adds one scope level and a register
// holding the caught value. Exiting with an overlay open only pops the overlay.
class MethodContext final : public Context {
public:
    static constexpr ContextType kind = ContextType::Method;

    MethodContext(CodeGenerator& gen, Context* parent, std::shared_ptr<AbcMethodInfo> method, ParamList params,
                  bool optimize);

    [[nodiscard]] ContextType type() const noexcept override { return kind; }
    Context* exit() override;

    void add_instruction(Instruction inst);
    void add_instructions(std::vector<Instruction> insts);

    // "__prefix_0", "__prefix_1", ...
    [[nodiscard]] std::string next_label(std::string_view prefix = "label");

    std::size_t add_activation_trait(AbcTrait trait);
    // Appends an unresolved exception record and its addexcinfo marker; returns the record index.
    uint32_t add_exception(const QName& type);

    // getlocal0/pushscope, then the scope object of every open catch block.
    void restore_scopes();

    // --- Catch overlays ---
    const std::string& enter_catch();
    [[nodiscard]] bool in_catch() const noexcept { return !overlays_.empty(); }
    [[nodiscard]] uint32_t scope_nest() const noexcept { return overlays_.empty() ? 0 : overlays_.back().scope_nest; }
    [[nodiscard]] const std::string& catch_local() const;

    // --- Registers (no code emitted) ---
    uint32_t set_local(std::string_view name);
    uint32_t kill_local(std::string_view name);
    [[nodiscard]] uint32_t get_local(std::string_view name) const;
    [[nodiscard]] bool has_local(std::string_view name) const;
    [[nodiscard]] uint32_t next_free_local() const noexcept;
    [[nodiscard]] bool is_argument(std::string_view name) const;

    [[nodiscard]] const std::shared_ptr<AbcMethodInfo>& method() const noexcept { return method_; }
    [[nodiscard]] const std::shared_ptr<AbcMethodBodyInfo>& body() const noexcept { return body_; }
    [[nodiscard]] CodeAssembler& assembler() const noexcept { return *asm_; }
    [[nodiscard]] const ParamList& params() const noexcept { return params_; }
    [[nodiscard]] std::vector<AbcException>& exceptions() noexcept { return body_->exceptions; }
    [[nodiscard]] const std::vector<AbcException>& exceptions() const noexcept { return body_->exceptions; }

    [[nodiscard]] bool is_constructor() const noexcept { return constructor_; }
    void set_constructor(bool value) noexcept { constructor_ = value; }
    // Whether `this; constructsuper 0` has been emitted into a constructor.
    [[nodiscard]] bool super_called() const noexcept { return super_called_; }
    void set_super_called() noexcept { super_called_ = true; }

private:
    struct CatchOverlay {
        uint32_t scope_nest;
        std::string local;
    };

    std::shared_ptr<AbcMethodInfo> method_;
    std::shared_ptr<CodeAssembler> asm_;
    std::shared_ptr<AbcMethodBodyInfo> body_;
    ParamList params_;
    meow::flat_map<std::string, uint32_t> label_counters_;
    std::vector<CatchOverlay> overlays_;
    bool constructor_ = false;
    bool super_called_ = false;
};

} // namespace fusion::avm2
