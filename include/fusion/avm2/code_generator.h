#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fusion/avm2/abc_file.h>
#include <fusion/avm2/context.h>
#include <fusion/avm2/errors.h>
#include <fusion/avm2/instruction.h>
#include <fusion/avm2/library.h>
#include <fusion/avm2/loadable.h>
#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

struct GeneratorOptions {
    bool make_script = true;  // open a first script at construction
    bool optimize = true;     // default for methods that do not say
};

// Whether a call leaves its result on the stack.
enum class ResultUse : uint8_t { Keep, Discard };

// A class found either in the native registry or among the current script's pending classes.
struct ClassLookup {
    QName name;
    std::optional<QName> super_name;
    std::shared_ptr<const ClassDesc> native;
    const ClassContext* pending = nullptr;

    [[nodiscard]] bool defines(const QName& method, bool is_static) const;
};

template <typename Ctx>
class ScopedConstruct;

using ScopedClass = ScopedConstruct<ClassContext>;
using ScopedMethod = ScopedConstruct<MethodContext>;

class CodeGenerator {
public:
    explicit CodeGenerator(TypeRegistry types = {}, GeneratorOptions options = {},
                           std::shared_ptr<AbcFile> abc = nullptr);
    CodeGenerator(const CodeGenerator&) = delete;
    CodeGenerator& operator=(const CodeGenerator&) = delete;

    [[nodiscard]] AbcFile& abc() noexcept { return *abc_; }
    [[nodiscard]] const AbcFile& abc() const noexcept { return *abc_; }
    [[nodiscard]] const std::shared_ptr<AbcFile>& abc_ptr() const noexcept { return abc_; }
    [[nodiscard]] ConstantPool& constants() noexcept { return abc_->constants; }
    [[nodiscard]] const TypeRegistry& types() const noexcept { return types_; }
    [[nodiscard]] const GeneratorOptions& options() const noexcept { return options_; }

    [[nodiscard]] Context* context() const noexcept { return context_; }
    [[nodiscard]] GlobalContext& global() const noexcept { return *global_; }
    [[nodiscard]] ScriptContext* script0() const noexcept { return script0_; }

    // Every context lives as long as the generator.
    template <typename T, typename... Args>
    T& make_context(Args&&... args) {
        auto ctx = std::make_unique<T>(*this, std::forward<Args>(args)...);
        T& ref = *ctx;
        contexts_.push_back(std::move(ctx));
        return ref;
    }

    // --- Context stack ---
    void enter_context(Context& ctx);
    // Finalizes the current frame; returns the frame that was exited.
    Context* exit_context();
    void exit_until_type(ContextType type);
    void exit_until(const Context& target);
    void finish();

    [[nodiscard]] ClassContext* current_class() const noexcept;
    [[nodiscard]] MethodContext& current_method(std::string_view operation) const;
    [[nodiscard]] ScriptContext* current_script() const noexcept;

    [[nodiscard]] std::optional<ClassLookup> find_class(const QName& name, const ScriptContext* script = nullptr) const;
    // Superclass chain starting at `super_name`, innermost first, always ending with Object.
    [[nodiscard]] std::vector<QName> ancestors_of(const QName& super_name, const ScriptContext* script = nullptr) const;

    // --- Constructs ---
    ScriptContext& begin_script();
    ClassContext& begin_class(const QName& name, std::optional<QName> super_name = std::nullopt,
                              std::optional<std::vector<QName>> bases = std::nullopt);
    Context* end_class();
    MethodContext& begin_method(const QName& name, ParamList params = {}, QName rettype = QName("void"),
                                MethodKind kind = MethodKind::Method, bool is_static = false,
                                bool is_override = false, std::optional<bool> optimize = std::nullopt);
    Context* end_method();
    MethodContext& begin_constructor(ParamList params = {}, std::optional<bool> optimize = std::nullopt);
    Context* end_constructor();

    // begin_* now, the matching end_* when the guard leaves scope.
    [[nodiscard]] ScopedClass scoped_class(const QName& name, std::optional<QName> super_name = std::nullopt,
                                           std::optional<std::vector<QName>> bases = std::nullopt);
    [[nodiscard]] ScopedMethod scoped_method(const QName& name, ParamList params = {}, QName rettype = QName("void"),
                                             MethodKind kind = MethodKind::Method, bool is_static = false,
                                             bool is_override = false, std::optional<bool> optimize = std::nullopt);
    [[nodiscard]] ScopedMethod scoped_constructor(ParamList params = {}, std::optional<bool> optimize = std::nullopt);

    // --- Instructions ---
    void emit(Instruction inst);
    void emit(Op op);
    void emit(std::vector<Instruction> insts);

    uint32_t set_local(std::string_view name);
    uint32_t get_local(std::string_view name);
    // Emits kill and frees the register for reuse.
    uint32_t kill_local(std::string_view name);
    [[nodiscard]] bool has_local(std::string_view name) const;

    void pop() { emit(Op::POP); }
    void dup() { emit(Op::DUP); }
    void swap() { emit(Op::SWAP); }
    void throw_exception() { emit(Op::THROW); }
    void return_value() { emit(Op::RETURNVALUE); }
    void return_void() { emit(Op::RETURNVOID); }

    // --- Labels and branches ---
    [[nodiscard]] std::string next_label(std::string_view prefix = "label");
    void set_label(std::string name);
    void branch_unconditionally(std::string label);
    void branch_conditionally(bool if_true, std::string label);
    void branch_if_true(std::string label) { emit(ins::branch(Op::IFTRUE, std::move(label))); }
    void branch_if_false(std::string label) { emit(ins::branch(Op::IFFALSE, std::move(label))); }
    void branch_if_equal(std::string label) { emit(ins::branch(Op::IFEQ, std::move(label))); }
    void branch_if_strict_equal(std::string label) { emit(ins::branch(Op::IFSTRICTEQ, std::move(label))); }
    void branch_if_not_equal(std::string label) { emit(ins::branch(Op::IFNE, std::move(label))); }
    void branch_if_strict_not_equal(std::string label) { emit(ins::branch(Op::IFSTRICTNE, std::move(label))); }
    void branch_if_greater_than(std::string label) { emit(ins::branch(Op::IFGT, std::move(label))); }
    void branch_if_greater_equals(std::string label) { emit(ins::branch(Op::IFGE, std::move(label))); }
    void branch_if_less_than(std::string label) { emit(ins::branch(Op::IFLT, std::move(label))); }
    void branch_if_less_equals(std::string label) { emit(ins::branch(Op::IFLE, std::move(label))); }
    void branch_if_not_greater_than(std::string label) { emit(ins::branch(Op::IFNGT, std::move(label))); }
    void branch_if_not_greater_equals(std::string label) { emit(ins::branch(Op::IFNGE, std::move(label))); }
    void branch_if_not_less_than(std::string label) { emit(ins::branch(Op::IFNLT, std::move(label))); }
    void branch_if_not_less_equals(std::string label) { emit(ins::branch(Op::IFNLE, std::move(label))); }

    // --- Values ---
    // Named values (anything with multiname()) become getlex; everything else goes through LoadTraits.
    template <typename... Ts>
    void load(const Ts&... values) {
        (load_value(values), ...);
    }

    void push_this() { get_local("this"); }
    void push_var(std::string_view name) { get_local(name); }
    void push_arg(std::string_view name);
    void push_true() { emit(Op::PUSHTRUE); }
    void push_false() { emit(Op::PUSHFALSE); }
    void push_undefined() { emit(Op::PUSHUNDEFINED); }
    void push_null() { emit(Op::PUSHNULL); }
    void store_var(std::string_view name) { set_local(name); }

    template <typename Range>
    void init_array(const Range& members) {
        uint32_t count = 0;
        for (const auto& m : members) {
            load(m);
            ++count;
        }
        emit(ins::newarray(count));
    }

    template <typename Range>
    void init_object(const Range& members) {
        uint32_t count = 0;
        for (const auto& [key, value] : members) {
            load(key, value);
            ++count;
        }
        emit(ins::newobject(count));
    }

    // new Array(length)
    void newarray(uint32_t length = 1);

    // --- Calls and properties ---
    template <typename... Args>
    void call_function_constargs(const QName& name, ResultUse use, const Args&... args) {
        emit(ins::named(Op::FINDPROPSTRICT, name));
        call_method_constargs(name, use, args...);
    }

    template <typename... Args>
    void call_method_constargs(const QName& name, ResultUse use, const Args&... args) {
        load(args...);
        const Op op = use == ResultUse::Discard ? Op::CALLPROPVOID : Op::CALLPROPERTY;
        emit(ins::call(op, name, static_cast<uint32_t>(sizeof...(Args))));
    }

    void call_function(const QName& name, uint32_t argc);
    void call_method(const QName& name, uint32_t argc, const std::optional<QName>& type = std::nullopt);
    void set_field(const QName& name, const std::optional<QName>& type = std::nullopt);
    void get_field(const QName& name, const std::optional<QName>& type = std::nullopt);
    void downcast(const QName& type);
    void is_instance(const QName& type);
    // Replaces the top of the stack with its constructor.
    void get_type();

    // --- Exceptions ---
    void begin_try();
    void end_try();
    // Returns the exception record index.
    uint32_t begin_catch(const QName& type);
    void push_exception(std::optional<uint32_t> nest = std::nullopt);
    void end_catch();

private:
    template <typename T>
    void load_value(const T& value) {
        if constexpr (Named<T>) {
            emit(ins::named(Op::GETLEX, QName(value.multiname())));
        } else {
            LoadTraits<std::remove_cvref_t<T>>::load(*this, value);
        }
    }

    [[nodiscard]] Context& current(std::string_view operation) const;

    std::shared_ptr<AbcFile> abc_;
    TypeRegistry types_;
    GeneratorOptions options_;
    std::vector<std::unique_ptr<Context>> contexts_;
    GlobalContext* global_ = nullptr;
    ScriptContext* script0_ = nullptr;
    Context* context_ = nullptr;
};

// Closes a construct opened by one of the scoped_* helpers. When the scope is left by an
// exception the construct stays open; end_* is skipped so it cannot throw during unwinding.
template <typename Ctx>
class ScopedConstruct {
public:
    using EndFn = Context* (CodeGenerator::*)();

    ScopedConstruct(CodeGenerator& gen, Ctx& ctx, EndFn end) noexcept
        : gen_(&gen), ctx_(&ctx), end_(end), uncaught_(std::uncaught_exceptions()) {}
    ScopedConstruct(const ScopedConstruct&) = delete;
    ScopedConstruct& operator=(const ScopedConstruct&) = delete;
    ScopedConstruct(ScopedConstruct&& other) noexcept
        : gen_(std::exchange(other.gen_, nullptr)), ctx_(other.ctx_), end_(other.end_), uncaught_(other.uncaught_) {}
    ScopedConstruct& operator=(ScopedConstruct&&) = delete;

    ~ScopedConstruct() noexcept(false) {
        if (gen_ && std::uncaught_exceptions() <= uncaught_) close();
    }

    [[nodiscard]] Ctx& context() const noexcept { return *ctx_; }
    Ctx* operator->() const noexcept { return ctx_; }
    Ctx& operator*() const noexcept { return *ctx_; }
    [[nodiscard]] bool is_open() const noexcept { return gen_ != nullptr; }

    // Ends the construct early; the destructor then does nothing.
    Context* close() {
        if (!gen_) return nullptr;
        CodeGenerator* gen = std::exchange(gen_, nullptr);
        return (gen->*end_)();
    }

private:
    CodeGenerator* gen_;
    Ctx* ctx_;
    EndFn end_;
    int uncaught_;
};

} // namespace fusion::avm2
