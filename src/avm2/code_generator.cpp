#include <fusion/avm2/code_generator.h>

#include <algorithm>
#include <format>

#include <fusion/avm2/code_assembler.h>
#include <fusion/diagnostics/log.h>

namespace fusion::avm2 {

namespace {

constexpr std::string_view TAG = "CODEGEN";

// Casts with a dedicated opcode.
std::optional<Op> fast_cast(const QName& type) {
    if (!type.ns.empty()) return std::nullopt;
    if (type.name == "String")  return Op::COERCE_S;
    if (type.name == "Array")   return Op::COERCE_A;
    if (type.name == "uint")    return Op::CONVERT_U;
    if (type.name == "int")     return Op::CONVERT_I;
    if (type.name == "Number")  return Op::CONVERT_D;
    if (type.name == "Object")  return Op::CONVERT_O;
    if (type.name == "Boolean") return Op::CONVERT_B;
    return std::nullopt;
}

} // namespace

bool ClassLookup::defines(const QName& method, bool is_static) const {
    if (pending) return pending->declares_method(method, is_static);
    if (!native) return false;
    if (native->has_method(method, is_static)) return true;
    const auto& props = is_static ? native->static_properties : native->properties;
    return std::ranges::any_of(props, [&](const PropertyDesc& p) { return p.name == method; });
}

CodeGenerator::CodeGenerator(TypeRegistry types, GeneratorOptions options, std::shared_ptr<AbcFile> abc)
    : abc_(abc ? std::move(abc) : std::make_shared<AbcFile>()),
      types_(std::move(types)),
      options_(options) {
    global_ = &make_context<GlobalContext>();
    context_ = global_;
    if (options_.make_script) script0_ = &global_->new_script();
}

// --- Context stack ---

Context& CodeGenerator::current(std::string_view operation) const {
    if (!context_) {
        throw CodegenError(std::format("You called '{}' after the generator finished.", operation));
    }
    return *context_;
}

void CodeGenerator::enter_context(Context& ctx) {
    log_debug(TAG, "enter {}", context_type_name(ctx.type()));
    context_ = &ctx;
}

Context* CodeGenerator::exit_context() {
    Context* ctx = &current("exit_context");
    log_debug(TAG, "exit {}", context_type_name(ctx->type()));
    context_ = ctx->exit();
    return ctx;
}

void CodeGenerator::exit_until_type(ContextType type) {
    const Context* probe = context_;
    while (probe && probe->type() != type) probe = probe->parent();
    if (!probe) {
        throw CodegenError(std::format("No enclosing {} context to exit to.", context_type_name(type)));
    }
    while (context_->type() != type) exit_context();
}

void CodeGenerator::exit_until(const Context& target) {
    const Context* probe = context_;
    while (probe && probe != &target) probe = probe->parent();
    if (!probe) {
        throw CodegenError(std::format("The {} context to exit to is not on the stack.",
                                       context_type_name(target.type())));
    }
    while (context_ != &target) exit_context();
}

void CodeGenerator::finish() {
    while (context_) exit_context();
    log_info(TAG, "finished: {} scripts, {} classes, {} methods", abc_->scripts.size(), abc_->instances.size(),
             abc_->methods.size());
}

ClassContext* CodeGenerator::current_class() const noexcept {
    for (Context* ctx = context_; ctx; ctx = ctx->parent()) {
        if (ctx->type() == ContextType::Class) return static_cast<ClassContext*>(ctx);
    }
    return nullptr;
}

ScriptContext* CodeGenerator::current_script() const noexcept {
    for (Context* ctx = context_; ctx; ctx = ctx->parent()) {
        if (ctx->type() == ContextType::Script) return static_cast<ScriptContext*>(ctx);
    }
    return nullptr;
}

MethodContext& CodeGenerator::current_method(std::string_view operation) const {
    Context& ctx = current(operation);
    if (ctx.type() != ContextType::Method) throw WrongContextError(operation, context_type_name(ctx.type()));
    return static_cast<MethodContext&>(ctx);
}

std::optional<ClassLookup> CodeGenerator::find_class(const QName& name, const ScriptContext* script) const {
    if (auto desc = types_.find_type(name)) {
        return ClassLookup{desc->full_name, desc->base_type, desc, nullptr};
    }
    if (!script) script = current_script();
    if (script) {
        if (const ClassContext* cls = script->pending_class(name)) {
            return ClassLookup{cls->name(), cls->super_name(), nullptr, cls};
        }
    }
    return std::nullopt;
}

std::vector<QName> CodeGenerator::ancestors_of(const QName& super_name, const ScriptContext* script) const {
    std::vector<QName> chain;
    auto found = find_class(super_name, script);
    while (found) {
        if (std::ranges::find(chain, found->name) != chain.end()) {
            throw CodegenError(std::format("Inheritance cycle through '{}'.", found->name));
        }
        chain.push_back(found->name);
        if (!found->super_name) break;
        found = find_class(*found->super_name, script);
    }
    if (std::ranges::find(chain, QName("Object")) == chain.end()) chain.push_back(QName("Object"));
    return chain;
}

// --- Constructs ---

ScriptContext& CodeGenerator::begin_script() {
    Context& ctx = current("begin_script");
    if (ctx.type() != ContextType::Global) throw WrongContextError("begin_script", context_type_name(ctx.type()));
    return static_cast<GlobalContext&>(ctx).new_script();
}

ClassContext& CodeGenerator::begin_class(const QName& name, std::optional<QName> super_name,
                                         std::optional<std::vector<QName>> bases) {
    Context& ctx = current("begin_class");
    if (ctx.type() != ContextType::Script) throw WrongContextError("begin_class", context_type_name(ctx.type()));
    return static_cast<ScriptContext&>(ctx).new_class(name, std::move(super_name), std::move(bases));
}

Context* CodeGenerator::end_class() {
    Context& ctx = current("end_class");
    if (ctx.type() != ContextType::Class) throw WrongContextError("end_class", context_type_name(ctx.type()));
    return exit_context();
}

MethodContext& CodeGenerator::begin_method(const QName& name, ParamList params, QName rettype, MethodKind kind,
                                           bool is_static, bool is_override, std::optional<bool> optimize) {
    Context& ctx = current("begin_method");
    if (ctx.type() != ContextType::Class && ctx.type() != ContextType::Script) {
        throw WrongContextError("begin_method", context_type_name(ctx.type()));
    }
    return static_cast<MethodOwner&>(ctx).new_method(name, std::move(params), std::move(rettype), kind, is_static,
                                                     is_override, optimize);
}

Context* CodeGenerator::end_method() {
    MethodContext& method = current_method("end_method");
    if (method.is_constructor()) throw WrongContextError("end_method", "constructor");
    return exit_context();
}

MethodContext& CodeGenerator::begin_constructor(ParamList params, std::optional<bool> optimize) {
    Context& ctx = current("begin_constructor");
    if (ctx.type() != ContextType::Class) {
        throw WrongContextError("begin_constructor", context_type_name(ctx.type()));
    }
    return static_cast<ClassContext&>(ctx).make_iinit(std::move(params), optimize);
}

Context* CodeGenerator::end_constructor() {
    Context& ctx = current("end_constructor");
    if (ctx.type() != ContextType::Method) throw WrongContextError("end_constructor", context_type_name(ctx.type()));
    if (!static_cast<MethodContext&>(ctx).is_constructor()) throw WrongContextError("end_constructor", "method");
    return exit_context();
}

ScopedClass CodeGenerator::scoped_class(const QName& name, std::optional<QName> super_name,
                                        std::optional<std::vector<QName>> bases) {
    return ScopedClass(*this, begin_class(name, std::move(super_name), std::move(bases)), &CodeGenerator::end_class);
}

ScopedMethod CodeGenerator::scoped_method(const QName& name, ParamList params, QName rettype, MethodKind kind,
                                          bool is_static, bool is_override, std::optional<bool> optimize) {
    MethodContext& method = begin_method(name, std::move(params), std::move(rettype), kind, is_static, is_override,
                                         optimize);
    return ScopedMethod(*this, method, &CodeGenerator::end_method);
}

ScopedMethod CodeGenerator::scoped_constructor(ParamList params, std::optional<bool> optimize) {
    return ScopedMethod(*this, begin_constructor(std::move(params), optimize), &CodeGenerator::end_constructor);
}

// --- Instructions ---

void CodeGenerator::emit(Instruction inst) {
    current_method("emit").add_instruction(std::move(inst));
}

void CodeGenerator::emit(Op op) {
    emit(ins::make(op));
}

void CodeGenerator::emit(std::vector<Instruction> insts) {
    current_method("emit").add_instructions(std::move(insts));
}

uint32_t CodeGenerator::set_local(std::string_view name) {
    MethodContext& method = current_method("set_local");
    const uint32_t reg = method.set_local(name);
    method.add_instruction(ins::setlocal(reg));
    return reg;
}

uint32_t CodeGenerator::get_local(std::string_view name) {
    MethodContext& method = current_method("get_local");
    const uint32_t reg = method.get_local(name);
    method.add_instruction(ins::getlocal(reg));
    return reg;
}

uint32_t CodeGenerator::kill_local(std::string_view name) {
    MethodContext& method = current_method("kill_local");
    const uint32_t reg = method.kill_local(name);
    method.add_instruction(ins::kill(reg));
    return reg;
}

bool CodeGenerator::has_local(std::string_view name) const {
    return current_method("has_local").has_local(name);
}

std::string CodeGenerator::next_label(std::string_view prefix) {
    return current_method("next_label").next_label(prefix);
}

void CodeGenerator::set_label(std::string name) {
    emit(ins::label(std::move(name)));
}

void CodeGenerator::branch_unconditionally(std::string label) {
    emit(ins::branch(Op::JUMP, std::move(label)));
}

void CodeGenerator::branch_conditionally(bool if_true, std::string label) {
    if (if_true) branch_if_true(std::move(label));
    else branch_if_false(std::move(label));
}

// --- Values ---

void CodeGenerator::push_arg(std::string_view name) {
    if (!current_method("push_arg").is_argument(name)) throw NotAnArgumentError(name);
    get_local(name);
}

void CodeGenerator::newarray(uint32_t length) {
    emit(Op::GETGLOBALSCOPE);
    load(length);
    emit(ins::call(Op::CONSTRUCTPROP, QName("Array"), 1));
}

// --- Calls and properties ---

void CodeGenerator::call_function(const QName& name, uint32_t argc) {
    emit(ins::named(Op::FINDPROPSTRICT, name));
    emit(ins::call(Op::CALLPROPERTY, name, argc));
}

void CodeGenerator::call_method(const QName& name, uint32_t argc, const std::optional<QName>& type) {
    emit(ins::call(Op::CALLPROPERTY, name, argc));
    if (type) downcast(*type);
}

void CodeGenerator::set_field(const QName& name, const std::optional<QName>& type) {
    if (type) downcast(*type);
    emit(ins::named(Op::SETPROPERTY, name));
}

void CodeGenerator::get_field(const QName& name, const std::optional<QName>& type) {
    emit(ins::named(Op::GETPROPERTY, name));
    if (type) downcast(*type);
}

void CodeGenerator::downcast(const QName& type) {
    if (auto op = fast_cast(type)) emit(*op);
    else emit(ins::named(Op::COERCE, type));
}

void CodeGenerator::is_instance(const QName& type) {
    emit(ins::named(Op::ISTYPE, type));
}

void CodeGenerator::get_type() {
    get_field(QName("prototype"));
    get_field(QName("constructor"));
}

// --- Exceptions ---

void CodeGenerator::begin_try() {
    MethodContext& method = current_method("begin_try");
    method.add_instruction(ins::begintry(&method));
}

void CodeGenerator::end_try() {
    MethodContext& method = current_method("end_try");
    method.add_instruction(ins::endtry(&method));
}

uint32_t CodeGenerator::begin_catch(const QName& type) {
    MethodContext& method = current_method("begin_catch");
    const uint32_t index = method.add_exception(type);
    method.restore_scopes();
    const std::string local = method.enter_catch();
    log_debug(TAG, "catch {} at scope {}", type, method.scope_nest());

    method.add_instruction(ins::begincatch(&method, index));
    method.add_instruction(ins::newcatch(index));
    dup();
    store_var(local);
    dup();
    emit(Op::PUSHSCOPE);
    swap();
    emit(ins::setslot(1));
    return index;
}

void CodeGenerator::push_exception(std::optional<uint32_t> nest) {
    MethodContext& method = current_method("push_exception");
    emit(ins::getscopeobject(nest.value_or(method.scope_nest())));
    emit(ins::getslot(1));
}

void CodeGenerator::end_catch() {
    MethodContext& method = current_method("end_catch");
    const std::string local = method.catch_local();
    emit(Op::POPSCOPE);
    kill_local(local);
    exit_context();
}

} // namespace fusion::avm2
