#include <fusion/avm2/code_assembler.h>
#include <fusion/avm2/code_generator.h>
#include <fusion/avm2/errors.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "check.h"

using namespace fusion;
using namespace fusion::avm2;

namespace {

std::vector<Op> ops_of(const MethodContext& m) {
    std::vector<Op> ops;
    for (const auto& inst : m.assembler().instructions()) ops.push_back(inst.op);
    return ops;
}

const AbcTrait* find_trait(const std::vector<AbcTrait>& traits, const QName& name) {
    auto it = std::ranges::find_if(traits, [&](const AbcTrait& t) { return t.name == name; });
    return it == traits.end() ? nullptr : &*it;
}

// Object <- flash.display::DisplayObject <- flash.display::Sprite
std::shared_ptr<Library> display_library() {
    ClassDesc object;
    object.full_name = QName("Object");
    object.methods = {MethodDesc{QName("toString"), {}, QName("String")}};

    ClassDesc display;
    display.full_name = QName("flash.display", "DisplayObject");
    display.base_type = QName("Object");
    display.methods = {MethodDesc{QName("hitTest"), {QName("Object")}, QName("Boolean")}};
    display.properties = {PropertyDesc{QName("x"), QName("Number"), true, true}};

    ClassDesc sprite;
    sprite.full_name = QName("flash.display", "Sprite");
    sprite.base_type = display.full_name;
    sprite.methods = {MethodDesc{QName("startDrag")}};
    sprite.static_methods = {MethodDesc{QName("create")}};

    return Library::from_descs("playerglobal", {object, display, sprite});
}

} // namespace

void test_nested_declarations() {
    test::section("nested declarations");
    CodeGenerator gen;
    CHECK(gen.context() == gen.script0());

    ClassContext& foo = gen.begin_class("Foo", QName("Bar"));
    CHECK(gen.context() == &foo);
    MethodContext& baz = gen.begin_method("baz");
    CHECK(gen.context() == &baz);
    CHECK(gen.current_class() == &foo);

    bool wrong_context = false;
    try {
        gen.end_class();
    } catch (const WrongContextError& e) {
        wrong_context = e.operation() == "end_class" && e.context() == "method";
    }
    CHECK(wrong_context);
    CHECK(gen.context() == &baz);

    gen.return_void();
    gen.end_method();
    gen.end_class();
    gen.finish();
    CHECK(gen.context() == nullptr);

    const AbcFile& abc = gen.abc();
    CHECK(abc.scripts.size() == 1);
    CHECK(abc.instances.size() == 1);
    CHECK(abc.classes.size() == 1);
    // baz, the synthesized iinit and cinit, and the script init
    CHECK(abc.methods.size() == 4);
    CHECK(abc.bodies.size() == 4);

    const auto& inst = *abc.instances[0];
    CHECK(inst.name == QName("Foo"));
    CHECK(inst.super_name == QName("Bar"));
    const AbcTrait* trait = find_trait(inst.traits, QName("baz"));
    CHECK(trait != nullptr);
    CHECK(trait && trait->kind == TraitKind::Method);
    CHECK(trait && !trait->is_override);

    const auto& script = *abc.scripts[0];
    CHECK(script.traits.size() == 1);
    CHECK(script.traits[0].kind == TraitKind::Class);
    CHECK(script.traits[0].class_info == abc.classes[0]);
}

void test_scoped_constructs() {
    test::section("scoped constructs");
    CodeGenerator gen;
    {
        auto foo = gen.scoped_class("Foo", QName("Bar"));
        CHECK(gen.context() == &foo.context());
        {
            auto ctor = gen.scoped_constructor({{"int", "z"}});
            CHECK(ctor->is_constructor());
            gen.push_arg("z");
            gen.pop();
        }
        CHECK(gen.context() == &foo.context());
        {
            auto baz = gen.scoped_method("baz");
            CHECK(gen.context() == &baz.context());
            gen.return_void();
        }
        CHECK(gen.context() == &foo.context());
    }
    CHECK(gen.context() == gen.script0());
    gen.finish();

    const AbcFile& abc = gen.abc();
    CHECK(abc.scripts.size() == 1);
    CHECK(abc.instances.size() == 1);
    CHECK(abc.classes.size() == 1);
    CHECK(abc.methods.size() == 4);
    const auto& inst = *abc.instances[0];
    CHECK(inst.name == QName("Foo"));
    CHECK(inst.super_name == QName("Bar"));
    CHECK(find_trait(inst.traits, QName("baz")) != nullptr);
}

void test_scoped_construct_early_close() {
    test::section("scoped construct closed early");
    CodeGenerator gen;
    auto foo = gen.scoped_class("Foo");
    CHECK(foo.is_open());
    CHECK(foo.close() == gen.script0());
    CHECK(!foo.is_open());
    CHECK(foo.close() == nullptr);
    CHECK(gen.context() == gen.script0());
}

void test_scoped_construct_unwinding() {
    test::section("scoped construct unwinding");
    CodeGenerator gen;
    MethodContext* run = nullptr;
    bool caught = false;
    try {
        auto foo = gen.scoped_class("Foo");
        auto m = gen.scoped_method("run");
        run = &m.context();
        throw std::runtime_error("abandoned");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    CHECK(caught);
    // Nothing was ended while unwinding.
    CHECK(gen.context() == run);

    // A failing end at a normal scope exit propagates.
    CodeGenerator other;
    bool failed = false;
    try {
        auto bad = other.scoped_method("bad");
        other.end_try();
    } catch (const CodegenError&) {
        failed = true;
    }
    CHECK(failed);
}

void test_wrong_contexts() {
    test::section("wrong contexts");
    CodeGenerator gen;
    CHECK_THROWS(WrongContextError, gen.emit(Op::NOP));
    CHECK_THROWS(WrongContextError, gen.begin_constructor());
    CHECK_THROWS(WrongContextError, gen.end_method());
    CHECK_THROWS(WrongContextError, gen.begin_script());

    gen.begin_class("Foo");
    CHECK_THROWS(WrongContextError, gen.begin_class("Nested"));
    CHECK_THROWS(WrongContextError, gen.set_local("x"));

    gen.begin_method("run");
    CHECK_THROWS(WrongContextError, gen.begin_method("inner"));
    CHECK_THROWS(WrongContextError, gen.end_constructor());
    gen.end_method();

    gen.begin_constructor();
    bool wrong_end = false;
    try {
        gen.end_method();
    } catch (const WrongContextError& e) {
        wrong_end = e.operation() == "end_method" && e.context() == "constructor";
    }
    CHECK(wrong_end);
    gen.end_constructor();
    gen.end_class();

    gen.finish();
    CHECK_THROWS(CodegenError, gen.emit(Op::NOP));
    CHECK_THROWS(CodegenError, gen.exit_context());
}

void test_constructor_redefinition() {
    test::section("constructor redefinition");
    CodeGenerator gen;
    ClassContext& cls = gen.begin_class("Point");

    MethodContext& ctor = gen.begin_constructor({{"Number", "x"}, {"Number", "y"}});
    CHECK(ctor.is_constructor());
    CHECK(ctor.super_called());
    // getlocal0, pushscope, getlocal0, constructsuper 0
    CHECK((ops_of(ctor) == std::vector<Op>{Op::GETLOCAL_0, Op::PUSHSCOPE, Op::GETLOCAL_0, Op::CONSTRUCTSUPER}));
    CHECK(ctor.is_argument("x"));
    gen.end_constructor();

    CHECK_THROWS(RedefinitionError, (gen.begin_constructor({{"int", "z"}})));
    CHECK(gen.context() == &cls);

    // Re-entering without parameters continues the same body.
    MethodContext& again = gen.begin_constructor();
    CHECK(&again == &ctor);
    CHECK(ops_of(again).size() == 4);
    gen.end_constructor();
    gen.end_class();

    CHECK(cls.instance()->iinit == ctor.method());
    CHECK(ctor.method()->param_names == (std::vector<std::string>{"x", "y"}));
}

void test_script_exit_is_idempotent() {
    test::section("script exit is idempotent");
    CodeGenerator gen;
    ScriptContext* script = gen.script0();

    CHECK(gen.exit_context() == script);
    CHECK(gen.context() == &gen.global());
    CHECK(script->done());
    CHECK(gen.abc().scripts.size() == 1);

    CHECK(script->exit() == &gen.global());
    CHECK(gen.abc().scripts.size() == 1);
    CHECK(gen.abc().methods.size() == 1);
}

void test_exit_until() {
    test::section("exit until");
    CodeGenerator gen;
    gen.begin_class("Foo");
    gen.begin_method("bar");

    gen.exit_until(*gen.script0());
    CHECK(gen.context() == gen.script0());
    CHECK(gen.abc().instances.size() == 1);

    CHECK_THROWS(CodegenError, gen.exit_until_type(ContextType::Class));
    CHECK(gen.context() == gen.script0());

    gen.begin_class("Baz");
    gen.begin_method("qux");
    gen.exit_until_type(ContextType::Class);
    CHECK(gen.context() == gen.current_class());
    CHECK(gen.current_class()->name() == QName("Baz"));

    CodeGenerator other;
    CHECK_THROWS(CodegenError, gen.exit_until(*other.script0()));
    CHECK(gen.context()->type() == ContextType::Class);
}

void test_override_native() {
    test::section("override detection against native classes");
    TypeRegistry types;
    types.add_library(display_library());
    CodeGenerator gen(types);

    ClassContext& shape = gen.begin_class("Shape", QName("flash.display", "Sprite"));
    gen.begin_method("startDrag");
    gen.end_method();
    gen.begin_method("hitTest", {{"Object", "obj"}}, QName("Boolean"));
    gen.end_method();
    gen.begin_method("x", {}, QName("Number"), MethodKind::Getter);
    gen.end_method();
    gen.begin_method("toString", {}, QName("String"));
    gen.end_method();
    gen.begin_method("draw");
    gen.end_method();
    gen.begin_method("create", {}, QName("void"), MethodKind::Method, true);
    gen.end_method();
    gen.begin_method("startDrag", {}, QName("void"), MethodKind::Method, true);
    gen.end_method();
    gen.end_class();

    const auto& traits = shape.instance_traits();
    CHECK(traits.size() == 5);
    CHECK(find_trait(traits, QName("startDrag"))->is_override);
    CHECK(find_trait(traits, QName("hitTest"))->is_override);
    CHECK(find_trait(traits, QName("x"))->is_override);
    CHECK(find_trait(traits, QName("toString"))->is_override);
    CHECK(!find_trait(traits, QName("draw"))->is_override);

    const auto& statics = shape.static_traits();
    CHECK(find_trait(statics, QName("create"))->is_override);
    CHECK(!find_trait(statics, QName("startDrag"))->is_override);

    // An explicit request is always honored.
    gen.begin_class("Plain");
    gen.begin_method("run", {}, QName("void"), MethodKind::Method, false, true);
    gen.end_method();
    ClassContext* plain = gen.current_class();
    gen.end_class();
    CHECK(plain->instance_traits()[0].is_override);
}

void test_override_pending() {
    test::section("override detection against pending classes");
    CodeGenerator gen;

    gen.begin_class("Animal");
    gen.begin_method("speak");
    gen.end_method();
    gen.end_class();

    ClassContext& dog = gen.begin_class("Dog", QName("Animal"));
    gen.begin_method("speak");
    gen.end_method();
    gen.begin_method("fetch");
    gen.end_method();
    gen.end_class();

    ClassContext& puppy = gen.begin_class("Puppy", QName("Dog"));
    gen.begin_method("speak");
    gen.end_method();
    gen.begin_method("fetch");
    gen.end_method();
    gen.begin_method("nap");
    gen.end_method();
    gen.end_class();

    CHECK(dog.instance_traits()[0].is_override);
    CHECK(!dog.instance_traits()[1].is_override);
    CHECK(puppy.instance_traits()[0].is_override);
    CHECK(puppy.instance_traits()[1].is_override);
    CHECK(!puppy.instance_traits()[2].is_override);

    auto found = gen.find_class(QName("Dog"));
    CHECK(found.has_value());
    CHECK(found && found->pending == &dog);
    CHECK(found && found->super_name == QName("Animal"));
    CHECK(!gen.find_class(QName("Cat")).has_value());

    CHECK((gen.ancestors_of(QName("Puppy")) == std::vector<QName>{"Puppy", "Dog", "Animal", "Object"}));
    CHECK((gen.ancestors_of(QName("Unknown")) == std::vector<QName>{"Object"}));
}

void test_class_setup() {
    test::section("class setup in script init");
    TypeRegistry types;
    types.add_library(display_library());
    CodeGenerator gen(types);

    gen.script0()->make_init();
    gen.return_void();
    gen.end_method();

    ClassContext& foo = gen.begin_class("Foo", QName("flash.display", "Sprite"));
    gen.end_class();
    gen.finish();

    MethodContext* init = gen.script0()->init();
    CHECK(init != nullptr);
    const std::vector<Op> expected{
        Op::GETLOCAL_0, Op::PUSHSCOPE,
        Op::GETSCOPEOBJECT,
        Op::GETLEX, Op::PUSHSCOPE,  // Object
        Op::GETLEX, Op::PUSHSCOPE,  // DisplayObject
        Op::GETLEX, Op::PUSHSCOPE,  // Sprite
        Op::GETLEX, Op::NEWCLASS,
        Op::POPSCOPE, Op::POPSCOPE, Op::POPSCOPE,
        Op::INITPROPERTY,
        Op::RETURNVOID,
    };
    CHECK(ops_of(*init) == expected);

    const auto& code = init->assembler().instructions();
    CHECK(code[3].name_operand() == QName("Object"));
    CHECK(code[5].name_operand() == QName("flash.display", "DisplayObject"));
    CHECK(code[7].name_operand() == QName("flash.display", "Sprite"));
    CHECK(code[9].name_operand() == QName("flash.display", "Sprite"));
    CHECK(code[10].int_operand() == static_cast<int64_t>(foo.index()));
    CHECK(code[14].name_operand() == QName("Foo"));
    CHECK(gen.abc().scripts[0]->init == init->method());
}

void test_class_setup_explicit_bases() {
    test::section("class setup with explicit bases");
    CodeGenerator gen;
    gen.begin_class("Foo", QName("Bar"), std::vector<QName>{QName("Bar")});
    gen.end_class();
    gen.begin_class("Second");
    gen.end_class();
    gen.finish();

    const std::vector<Op> expected{
        Op::GETLOCAL_0, Op::PUSHSCOPE,
        Op::GETSCOPEOBJECT, Op::GETLEX, Op::PUSHSCOPE, Op::GETLEX, Op::NEWCLASS, Op::POPSCOPE, Op::INITPROPERTY,
        Op::GETSCOPEOBJECT, Op::GETLEX, Op::PUSHSCOPE, Op::GETLEX, Op::NEWCLASS, Op::POPSCOPE, Op::INITPROPERTY,
    };
    CHECK(ops_of(*gen.script0()->init()) == expected);

    const auto& code = gen.script0()->init()->assembler().instructions();
    CHECK(code[6].int_operand() == 0);
    CHECK(code[10].name_operand() == QName("Object"));
    CHECK(code[13].int_operand() == 1);
    CHECK(gen.abc().scripts[0]->traits.size() == 2);
}

void test_inheritance_cycle() {
    test::section("inheritance cycle");
    CodeGenerator gen;
    gen.begin_class("A", QName("B"));
    gen.end_class();
    gen.begin_class("B", QName("A"));
    gen.end_class();
    CHECK_THROWS(CodegenError, gen.ancestors_of(QName("A")));
    CHECK_THROWS(CodegenError, gen.finish());
}

void test_reenter_pending_class() {
    test::section("re-entering a pending class");
    CodeGenerator gen;
    ClassContext& first = gen.begin_class("Foo");
    gen.begin_method("a");
    gen.end_method();
    gen.end_class();
    const auto record = first.instance();
    const uint32_t index = first.index();

    ClassContext& second = gen.begin_class("Foo");
    CHECK(&second == &first);
    gen.begin_method("b");
    gen.end_method();
    second.add_slot(QName("count"), QName("int"));
    second.add_slot(QName("LIMIT"), QName("int"), true, true);
    gen.end_class();
    gen.finish();

    CHECK(gen.abc().instances.size() == 1);
    CHECK(first.index() == index);
    CHECK(first.instance() == record);
    CHECK(record->traits.size() == 3);
    CHECK(find_trait(record->traits, QName("b")) != nullptr);
    CHECK(find_trait(record->traits, QName("count"))->kind == TraitKind::Slot);
    CHECK(first.class_info()->traits.size() == 1);
    CHECK(first.class_info()->traits[0].kind == TraitKind::Const);
    CHECK(gen.script0()->pending_order().size() == 1);
    CHECK(gen.abc().scripts[0]->traits.size() == 1);
}

void test_multiple_scripts() {
    test::section("multiple scripts");
    CodeGenerator gen(TypeRegistry{}, GeneratorOptions{false, true});
    CHECK(gen.script0() == nullptr);
    CHECK(gen.context() == &gen.global());

    ScriptContext& one = gen.begin_script();
    gen.begin_method("helper", {}, QName("int"));
    gen.load(int64_t{1});
    gen.return_value();
    gen.end_method();
    CHECK(one.traits().size() == 1);
    CHECK(one.traits()[0].kind == TraitKind::Method);
    gen.exit_context();

    ScriptContext& two = gen.begin_script();
    CHECK(&two != &one);
    gen.finish();
    CHECK(gen.abc().scripts.size() == 2);
    CHECK(gen.abc().scripts[0] == one.record());
    CHECK(gen.abc().scripts[1] == two.record());
}

void test_shared_abc() {
    test::section("generators sharing an abc file");
    auto abc = std::make_shared<AbcFile>();
    {
        CodeGenerator gen(TypeRegistry{}, GeneratorOptions{}, abc);
        gen.begin_class("One");
        gen.end_class();
        gen.finish();
    }
    {
        CodeGenerator gen(TypeRegistry{}, GeneratorOptions{}, abc);
        gen.begin_class("Two");
        gen.end_class();
        gen.finish();
        CHECK(gen.abc_ptr() == abc);
    }
    CHECK(abc->scripts.size() == 2);
    CHECK(abc->instances.size() == 2);
    CHECK(abc->instances[1]->name == QName("Two"));
}

int main() {
    test_nested_declarations();
    test_scoped_constructs();
    test_scoped_construct_early_close();
    test_scoped_construct_unwinding();
    test_wrong_contexts();
    test_constructor_redefinition();
    test_script_exit_is_idempotent();
    test_exit_until();
    test_override_native();
    test_override_pending();
    test_class_setup();
    test_class_setup_explicit_bases();
    test_inheritance_cycle();
    test_reenter_pending_class();
    test_multiple_scripts();
    test_shared_abc();
    return test::summary("codegen");
}
