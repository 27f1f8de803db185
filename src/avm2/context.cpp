#include <fusion/avm2/context.h>

#include <algorithm>
#include <format>
#include <ranges>

#include <fusion/avm2/code_assembler.h>
#include <fusion/avm2/code_generator.h>
#include <fusion/avm2/errors.h>
#include <fusion/avm2/optimizer.h>
#include <fusion/diagnostics/log.h>

namespace fusion::avm2 {

namespace {

constexpr std::string_view TAG = "CODEGEN";

// getlocal0, pushscope
constexpr std::size_t PROLOGUE_SIZE = 2;

TraitKind trait_kind(MethodKind kind) {
    switch (kind) {
        case MethodKind::Getter: return TraitKind::Getter;
        case MethodKind::Setter: return TraitKind::Setter;
        case MethodKind::Method: break;
    }
    return TraitKind::Method;
}

} // namespace

// --- Global ---

ScriptContext& GlobalContext::new_script() {
    auto& ctx = gen_.make_context<ScriptContext>(this);
    gen_.enter_context(ctx);
    return ctx;
}

// --- MethodOwner ---

std::shared_ptr<AbcMethodInfo> MethodOwner::new_method_info(std::string name, const ParamList& params,
                                                            const QName& rettype) {
    auto info = std::make_shared<AbcMethodInfo>();
    info->name = std::move(name);
    info->return_type = rettype;
    for (const auto& p : params) {
        info->param_types.push_back(p.type);
        info->param_names.push_back(p.name);
    }
    return info;
}

MethodContext& MethodOwner::new_method(const QName& name, ParamList params, QName rettype, MethodKind kind,
                                       bool is_static, bool is_override, std::optional<bool> optimize) {
    auto info = new_method_info(name.full_name(), params, rettype);
    const bool override_flag = is_override || overridden(is_static, name);
    auto trait = AbcTrait::make_method(name, trait_kind(kind), info, override_flag);
    if (is_static) add_static_trait(std::move(trait));
    else add_instance_trait(std::move(trait));

    auto& ctx = gen_.make_context<MethodContext>(this, std::move(info), std::move(params),
                                                 optimize.value_or(gen_.options().optimize));
    gen_.enter_context(ctx);
    return ctx;
}

void MethodOwner::add_slot(const QName& name, const QName& type, bool is_static, bool is_const) {
    auto trait = AbcTrait::make_slot(name, type, is_const);
    if (is_static) add_static_trait(std::move(trait));
    else add_instance_trait(std::move(trait));
}

// --- Script ---

MethodContext& ScriptContext::make_init(std::optional<bool> optimize) {
    if (!init_) {
        auto info = new_method_info("", {}, QName::any());
        init_ = &gen_.make_context<MethodContext>(this, std::move(info), ParamList{},
                                                  optimize.value_or(gen_.options().optimize));
    }
    gen_.enter_context(*init_);
    return *init_;
}

ClassContext& ScriptContext::new_class(const QName& name, std::optional<QName> super_name,
                                       std::optional<std::vector<QName>> bases) {
    if (const PendingClass* pending = pending_.find(name)) {
        log_info(TAG, "re-entering pending class {}", name);
        gen_.enter_context(*pending->context);
        return *pending->context;
    }
    auto& ctx = gen_.make_context<ClassContext>(this, name, std::move(super_name));
    pending_.try_emplace(name, PendingClass{&ctx, std::move(bases)});
    order_.push_back(name);
    gen_.enter_context(ctx);
    return ctx;
}

ClassContext* ScriptContext::pending_class(const QName& name) const {
    const PendingClass* pending = pending_.find(name);
    return pending ? pending->context : nullptr;
}

void ScriptContext::emit_class_setup(MethodContext& init, const PendingClass& pending) {
    const ClassContext& cls = *pending.context;
    if (!cls.class_info()) {
        throw CodegenError(std::format("Class '{}' was never finished.", cls.name()));
    }
    const std::vector<QName> ancestors = pending.bases ? *pending.bases : gen_.ancestors_of(cls.super_name(), this);

    init.add_instruction(ins::getscopeobject(0));
    for (const auto& ancestor : ancestors | std::views::reverse) {
        init.add_instruction(ins::named(Op::GETLEX, ancestor));
        init.add_instruction(ins::make(Op::PUSHSCOPE));
    }
    init.add_instruction(ins::named(Op::GETLEX, cls.super_name()));
    init.add_instruction(ins::newclass(cls.index()));
    for (std::size_t i = 0; i < ancestors.size(); ++i) init.add_instruction(ins::make(Op::POPSCOPE));
    init.add_instruction(ins::named(Op::INITPROPERTY, cls.name()));

    traits_.push_back(AbcTrait::make_class(cls.name(), cls.class_info()));
}

Context* ScriptContext::exit() {
    if (done_) return parent_;
    done_ = true;

    MethodContext& init = make_init();
    // Class setup goes between the prologue and the code already in init.
    auto tail = init.assembler().detach_after(PROLOGUE_SIZE);
    for (const auto& name : order_) {
        emit_class_setup(init, *pending_.find(name));
    }
    init.assembler().reattach(std::move(tail));

    record_ = std::make_shared<AbcScriptInfo>();
    record_->init = init.method();
    record_->traits = traits_;
    gen_.abc().scripts.index_for(record_);

    gen_.exit_context();
    return parent_;
}

// --- Class ---

ClassContext::ClassContext(CodeGenerator& gen, Context* parent, QName name, std::optional<QName> super_name)
    : MethodOwner(gen, parent), name_(std::move(name)), super_name_(super_name.value_or(QName("Object"))) {}

const ScriptContext* ClassContext::script() const noexcept {
    if (parent_ && parent_->type() == ContextType::Script) return static_cast<const ScriptContext*>(parent_);
    return nullptr;
}

bool ClassContext::declares_method(const QName& name, bool is_static) const {
    const auto& traits = is_static ? static_traits_ : instance_traits_;
    return std::ranges::any_of(traits, [&](const AbcTrait& t) {
        return t.name == name &&
               (t.kind == TraitKind::Method || t.kind == TraitKind::Getter || t.kind == TraitKind::Setter);
    });
}

bool ClassContext::overridden(bool is_static, const QName& name) const {
    std::vector<QName> seen;
    auto found = gen_.find_class(super_name_, script());
    while (found) {
        if (found->defines(name, is_static)) return true;
        if (std::ranges::find(seen, found->name) != seen.end()) break;
        seen.push_back(found->name);
        if (!found->super_name) break;
        found = gen_.find_class(*found->super_name, script());
    }
    return false;
}

MethodContext& ClassContext::make_cinit(std::optional<bool> optimize) {
    if (!cinit_) {
        auto info = new_method_info("", {}, QName::any());
        cinit_ = &gen_.make_context<MethodContext>(this, std::move(info), ParamList{},
                                                   optimize.value_or(gen_.options().optimize));
    }
    gen_.enter_context(*cinit_);
    return *cinit_;
}

MethodContext& ClassContext::make_iinit(ParamList params, std::optional<bool> optimize) {
    if (iinit_) {
        if (!params.empty()) {
            throw RedefinitionError(std::format("The constructor parameters of '{}' cannot be redefined.", name_));
        }
    } else {
        auto info = new_method_info("", params, QName("void"));
        iinit_ = &gen_.make_context<MethodContext>(this, std::move(info), std::move(params),
                                                   optimize.value_or(gen_.options().optimize));
        iinit_->set_constructor(true);
    }
    gen_.enter_context(*iinit_);

    if (!iinit_->super_called()) {
        gen_.push_this();
        gen_.emit(ins::constructsuper(0));
        iinit_->set_super_called();
    }
    return *iinit_;
}

Context* ClassContext::exit() {
    if (!script()) {
        throw CodegenError(std::format("Class '{}' must be declared directly inside a script.", name_));
    }
    if (!iinit_) {
        log_debug(TAG, "synthesizing constructor for {}", name_);
        make_iinit();
        gen_.end_constructor();
    }
    if (!cinit_) {
        log_debug(TAG, "synthesizing class initializer for {}", name_);
        make_cinit();
        gen_.end_method();
    }

    if (!instance_) instance_ = std::make_shared<AbcInstanceInfo>();
    instance_->name = name_;
    instance_->super_name = super_name_;
    instance_->iinit = iinit_->method();
    instance_->traits = instance_traits_;

    if (!class_info_) class_info_ = std::make_shared<AbcClassInfo>();
    class_info_->cinit = cinit_->method();
    class_info_->traits = static_traits_;

    index_ = gen_.abc().instances.index_for(instance_);
    gen_.abc().classes.index_for(class_info_);
    return parent_;
}

// --- Method ---

namespace {

std::vector<std::string> initial_locals(const ParamList& params) {
    std::vector<std::string> names{"this"};
    for (const auto& p : params) names.push_back(p.name);
    return names;
}

} // namespace

MethodContext::MethodContext(CodeGenerator& gen, Context* parent, std::shared_ptr<AbcMethodInfo> method,
                             ParamList params, bool optimize)
    : Context(gen, parent),
      method_(std::move(method)),
      asm_(std::make_shared<CodeAssembler>(&gen.constants(), initial_locals(params))),
      body_(std::make_shared<AbcMethodBodyInfo>()),
      params_(std::move(params)) {
    body_->method = method_;
    body_->code = asm_;
    body_->optimize = optimize;
    restore_scopes();
}

Context* MethodContext::exit() {
    if (!overlays_.empty()) {
        overlays_.pop_back();
        return this;
    }
    if (body_->optimize) optimize_code(asm_->instructions());
    asm_->resolve_exception_offsets();

    gen_.abc().methods.index_for(method_);
    gen_.abc().bodies.index_for(body_);
    return parent_;
}

void MethodContext::add_instruction(Instruction inst) {
    asm_->add_instruction(std::move(inst));
}

void MethodContext::add_instructions(std::vector<Instruction> insts) {
    asm_->add_instructions(std::move(insts));
}

std::string MethodContext::next_label(std::string_view prefix) {
    uint32_t& counter = label_counters_[std::string(prefix)];
    return std::format("__{}_{}", prefix, counter++);
}

std::size_t MethodContext::add_activation_trait(AbcTrait trait) {
    body_->activation_traits.push_back(std::move(trait));
    return body_->activation_traits.size();
}

uint32_t MethodContext::add_exception(const QName& type) {
    AbcException exc;
    exc.type = type;
    body_->exceptions.push_back(std::move(exc));
    const auto index = static_cast<uint32_t>(body_->exceptions.size() - 1);
    asm_->add_instruction(ins::addexcinfo(this, index));
    return index;
}

void MethodContext::restore_scopes() {
    asm_->add_instruction(ins::getlocal(0));
    asm_->add_instruction(ins::make(Op::PUSHSCOPE));
    for (const auto& overlay : overlays_) {
        asm_->add_instruction(ins::getlocal(asm_->get_local(overlay.local)));
        asm_->add_instruction(ins::make(Op::PUSHSCOPE));
    }
}

const std::string& MethodContext::enter_catch() {
    const uint32_t nest = scope_nest() + 1;
    overlays_.push_back(CatchOverlay{nest, std::format("MF::ExceptionLocal{}", nest)});
    return overlays_.back().local;
}

const std::string& MethodContext::catch_local() const {
    if (overlays_.empty()) throw CodegenError("Not inside a catch block.");
    return overlays_.back().local;
}

uint32_t MethodContext::set_local(std::string_view name) { return asm_->set_local(name); }
uint32_t MethodContext::kill_local(std::string_view name) { return asm_->kill_local(name); }
uint32_t MethodContext::get_local(std::string_view name) const { return asm_->get_local(name); }
bool MethodContext::has_local(std::string_view name) const { return asm_->has_local(name); }
uint32_t MethodContext::next_free_local() const noexcept { return asm_->next_free_local(); }

bool MethodContext::is_argument(std::string_view name) const {
    return std::ranges::any_of(params_, [&](const Param& p) { return p.name == name; });
}

} // namespace fusion::avm2
