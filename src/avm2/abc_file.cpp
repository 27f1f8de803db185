#include <fusion/avm2/abc_file.h>

namespace fusion::avm2 {

AbcTrait AbcTrait::make_method(QName name, TraitKind kind, std::shared_ptr<AbcMethodInfo> method, bool is_override) {
    AbcTrait t;
    t.name = std::move(name);
    t.kind = kind;
    t.method = std::move(method);
    t.is_override = is_override;
    return t;
}

AbcTrait AbcTrait::make_class(QName name, std::shared_ptr<AbcClassInfo> info) {
    AbcTrait t;
    t.name = std::move(name);
    t.kind = TraitKind::Class;
    t.class_info = std::move(info);
    return t;
}

AbcTrait AbcTrait::make_slot(QName name, QName type, bool is_const) {
    AbcTrait t;
    t.name = std::move(name);
    t.kind = is_const ? TraitKind::Const : TraitKind::Slot;
    t.type_name = std::move(type);
    return t;
}

} // namespace fusion::avm2
