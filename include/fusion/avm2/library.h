#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <meow_flat_map.h>

#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

struct AbcFile;

struct MethodDesc {
    QName name;
    std::vector<QName> param_types;
    QName return_type = QName("void");
};

struct FieldDesc {
    QName name;
    QName type = QName::any();
};

struct PropertyDesc {
    QName name;
    QName type = QName::any();
    bool readable = false;
    bool writable = false;
};

// What the generator knows about a class it did not generate itself.
struct ClassDesc {
    QName full_name;
    std::optional<QName> base_type;  // none for the root class

    std::vector<FieldDesc> fields;
    std::vector<FieldDesc> static_fields;
    std::vector<MethodDesc> methods;
    std::vector<MethodDesc> static_methods;
    std::vector<PropertyDesc> properties;
    std::vector<PropertyDesc> static_properties;

    [[nodiscard]] const std::string& package() const noexcept { return full_name.ns; }
    [[nodiscard]] const std::string& short_name() const noexcept { return full_name.name; }
    [[nodiscard]] bool has_method(const QName& name, bool is_static) const;
};

// One node of a dotted package tree ("flash" -> "display" -> Sprite).
class Package {
public:
    explicit Package(std::string name) : name_(std::move(name)) {}
    Package(const Package&) = delete;
    Package& operator=(const Package&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    Package& child(std::string_view segment);
    void add_type(std::shared_ptr<const ClassDesc> desc);

    [[nodiscard]] const Package* find_package(std::string_view dotted) const;
    // "Sprite" in this node, or "display.Sprite" below it.
    [[nodiscard]] std::shared_ptr<const ClassDesc> find_type(std::string_view dotted) const;

    [[nodiscard]] std::vector<std::string> package_names() const { return packages_.keys(); }
    [[nodiscard]] std::vector<std::string> type_names() const { return types_.keys(); }

private:
    std::string name_;
    meow::flat_map<std::string, std::unique_ptr<Package>> packages_;
    meow::flat_map<std::string, std::shared_ptr<const ClassDesc>> types_;
};

// All the types of one native library, by qualified name and as a package tree.
class Library {
public:
    explicit Library(std::string name = {}) : name_(std::move(name)) {}

    [[nodiscard]] static std::shared_ptr<Library> from_descs(std::string name, std::vector<ClassDesc> descs);
    // Instance i is paired with class i, as in the ABC format.
    [[nodiscard]] static std::shared_ptr<Library> from_abc(std::string name, const AbcFile& abc);

    void add_type(ClassDesc desc);

    [[nodiscard]] std::shared_ptr<const ClassDesc> find_type(const QName& name) const;
    [[nodiscard]] const ClassDesc& get_type(const QName& name) const;
    [[nodiscard]] bool has_type(const QName& name) const { return types_.contains(name); }

    [[nodiscard]] const Package& toplevel() const noexcept { return toplevel_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }
    [[nodiscard]] std::vector<QName> type_names() const { return types_.keys(); }

private:
    std::string name_;
    meow::flat_map<QName, std::shared_ptr<const ClassDesc>> types_;
    Package toplevel_{""};
};

// The libraries a generator resolves native types against. Later libraries shadow earlier ones.
class TypeRegistry {
public:
    TypeRegistry() = default;
    explicit TypeRegistry(std::vector<std::shared_ptr<const Library>> libraries) : libraries_(std::move(libraries)) {}

    void add_library(std::shared_ptr<const Library> library);

    [[nodiscard]] bool type_exists(const QName& name) const { return find_type(name) != nullptr; }
    [[nodiscard]] std::shared_ptr<const ClassDesc> find_type(const QName& name) const;
    // Copy of the descriptor, or none.
    [[nodiscard]] std::optional<ClassDesc> lookup(const QName& name) const;
    [[nodiscard]] ClassDesc get_type(const QName& name) const;

    [[nodiscard]] std::size_t size() const noexcept { return libraries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return libraries_.empty(); }

private:
    std::vector<std::shared_ptr<const Library>> libraries_;
};

} // namespace fusion::avm2
