#include <fusion/avm2/library.h>

#include <algorithm>
#include <ranges>

#include <fusion/avm2/abc_file.h>
#include <fusion/avm2/errors.h>
#include <fusion/diagnostics/log.h>

namespace fusion::avm2 {

bool ClassDesc::has_method(const QName& name, bool is_static) const {
    const auto& list = is_static ? static_methods : methods;
    return std::ranges::any_of(list, [&](const MethodDesc& m) { return m.name == name; });
}

// --- Package ---

Package& Package::child(std::string_view segment) {
    const std::string key(segment);
    if (auto* existing = packages_.find(key)) return **existing;
    std::string full = name_.empty() ? key : name_ + "." + key;
    return **packages_.try_emplace(key, std::make_unique<Package>(std::move(full))).first;
}

void Package::add_type(std::shared_ptr<const ClassDesc> desc) {
    const std::string key = desc->short_name();
    types_[key] = std::move(desc);
}

const Package* Package::find_package(std::string_view dotted) const {
    if (dotted.empty()) return this;
    const auto dot = dotted.find('.');
    const auto* next = packages_.find(std::string(dotted.substr(0, dot)));
    if (!next) return nullptr;
    if (dot == std::string_view::npos) return next->get();
    return (*next)->find_package(dotted.substr(dot + 1));
}

std::shared_ptr<const ClassDesc> Package::find_type(std::string_view dotted) const {
    const auto dot = dotted.rfind('.');
    if (dot == std::string_view::npos) {
        const auto* found = types_.find(std::string(dotted));
        return found ? *found : nullptr;
    }
    const Package* owner = find_package(dotted.substr(0, dot));
    return owner ? owner->find_type(dotted.substr(dot + 1)) : nullptr;
}

// --- Library ---

namespace {

std::vector<MethodDesc> collect_methods(const std::vector<AbcTrait>& traits) {
    std::vector<MethodDesc> out;
    for (const auto& t : traits) {
        if (t.kind != TraitKind::Method || !t.method) continue;
        out.push_back(MethodDesc{t.name, t.method->param_types, t.method->return_type});
    }
    return out;
}

std::vector<FieldDesc> collect_fields(const std::vector<AbcTrait>& traits) {
    std::vector<FieldDesc> out;
    for (const auto& t : traits) {
        if (t.kind == TraitKind::Slot || t.kind == TraitKind::Const) out.push_back(FieldDesc{t.name, t.type_name});
    }
    return out;
}

// Getters and setters of one name merge into a single property.
std::vector<PropertyDesc> collect_properties(const std::vector<AbcTrait>& traits) {
    std::vector<PropertyDesc> out;
    for (const auto& t : traits) {
        if ((t.kind != TraitKind::Getter && t.kind != TraitKind::Setter) || !t.method) continue;

        auto it = std::ranges::find_if(out, [&](const PropertyDesc& p) { return p.name == t.name; });
        if (it == out.end()) {
            out.push_back(PropertyDesc{t.name});
            it = out.end() - 1;
        }
        if (t.kind == TraitKind::Getter) {
            it->readable = true;
            it->type = t.method->return_type;
        } else {
            it->writable = true;
            if (!it->readable && !t.method->param_types.empty()) it->type = t.method->param_types.front();
        }
    }
    return out;
}

} // namespace

std::shared_ptr<Library> Library::from_descs(std::string name, std::vector<ClassDesc> descs) {
    auto lib = std::make_shared<Library>(std::move(name));
    for (auto& desc : descs) lib->add_type(std::move(desc));
    return lib;
}

std::shared_ptr<Library> Library::from_abc(std::string name, const AbcFile& abc) {
    auto lib = std::make_shared<Library>(std::move(name));
    for (std::size_t i = 0; i < abc.instances.size(); ++i) {
        const auto& inst = *abc.instances[i];
        ClassDesc desc;
        desc.full_name = inst.name;
        // The root class must not claim itself as a base.
        if (inst.name != QName("Object")) desc.base_type = inst.super_name;
        desc.fields = collect_fields(inst.traits);
        desc.methods = collect_methods(inst.traits);
        desc.properties = collect_properties(inst.traits);

        if (i < abc.classes.size()) {
            const auto& cls = *abc.classes[i];
            desc.static_fields = collect_fields(cls.traits);
            desc.static_methods = collect_methods(cls.traits);
            desc.static_properties = collect_properties(cls.traits);
        }
        lib->add_type(std::move(desc));
    }
    log_debug("LIBRARY", "'{}': {} types from an abc file", lib->name(), lib->size());
    return lib;
}

void Library::add_type(ClassDesc desc) {
    auto shared = std::make_shared<const ClassDesc>(std::move(desc));

    Package* node = &toplevel_;
    for (auto segment : std::views::split(std::string_view(shared->package()), '.')) {
        const std::string_view part(segment.begin(), segment.end());
        if (!part.empty()) node = &node->child(part);
    }
    node->add_type(shared);
    const QName key = shared->full_name;
    types_[key] = std::move(shared);
}

std::shared_ptr<const ClassDesc> Library::find_type(const QName& name) const {
    const auto* found = types_.find(name);
    return found ? *found : nullptr;
}

const ClassDesc& Library::get_type(const QName& name) const {
    const auto* found = types_.find(name);
    if (!found) throw TypeNotFoundError(name.full_name());
    return **found;
}

// --- TypeRegistry ---

void TypeRegistry::add_library(std::shared_ptr<const Library> library) {
    libraries_.push_back(std::move(library));
}

std::shared_ptr<const ClassDesc> TypeRegistry::find_type(const QName& name) const {
    for (const auto& lib : libraries_ | std::views::reverse) {
        if (auto desc = lib->find_type(name)) return desc;
    }
    return nullptr;
}

std::optional<ClassDesc> TypeRegistry::lookup(const QName& name) const {
    if (auto desc = find_type(name)) return *desc;
    return std::nullopt;
}

ClassDesc TypeRegistry::get_type(const QName& name) const {
    if (auto desc = find_type(name)) return *desc;
    throw TypeNotFoundError(name.full_name());
}

} // namespace fusion::avm2
