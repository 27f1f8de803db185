#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <meow_enum.h>
#include <meow_flat_map.h>

#include <fusion/avm2/constant_pool.h>
#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

class CodeAssembler;
struct AbcClassInfo;

struct AbcMethodInfo {
    std::string name;
    std::vector<QName> param_types;
    QName return_type = QName::any();
    std::vector<std::string> param_names;
};

enum class TraitKind : uint8_t { Slot, Method, Getter, Setter, Class, Function, Const };

struct AbcTrait {
    QName name;
    TraitKind kind = TraitKind::Slot;
    bool is_override = false;
    bool is_final = false;

    std::shared_ptr<AbcMethodInfo> method;      // Method / Getter / Setter
    std::shared_ptr<AbcClassInfo> class_info;   // Class
    QName type_name = QName::any();             // Slot / Const
    uint32_t slot_id = 0;

    [[nodiscard]] static AbcTrait make_method(QName name, TraitKind kind, std::shared_ptr<AbcMethodInfo> method,
                                              bool is_override = false);
    [[nodiscard]] static AbcTrait make_class(QName name, std::shared_ptr<AbcClassInfo> info);
    [[nodiscard]] static AbcTrait make_slot(QName name, QName type, bool is_const = false);
};

struct AbcException {
    int64_t from = -1;
    int64_t to = -1;
    int64_t target = -1;
    QName type = QName::any();
    std::string var_name;
};

struct AbcMethodBodyInfo {
    std::shared_ptr<AbcMethodInfo> method;
    std::shared_ptr<CodeAssembler> code;
    std::vector<AbcTrait> activation_traits;
    std::vector<AbcException> exceptions;
    bool optimize = true;
};

struct AbcInstanceInfo {
    QName name;
    std::optional<QName> super_name;
    std::shared_ptr<AbcMethodInfo> iinit;
    std::vector<AbcTrait> traits;
    std::vector<QName> interfaces;
};

struct AbcClassInfo {
    std::shared_ptr<AbcMethodInfo> cinit;
    std::vector<AbcTrait> traits;
};

struct AbcScriptInfo {
    std::shared_ptr<AbcMethodInfo> init;
    std::vector<AbcTrait> traits;
};

// Records interned by identity. Registering the same record twice returns its first index.
template <typename T>
class RecordTable {
    std::vector<std::shared_ptr<T>> records_;
    meow::flat_map<const T*, uint32_t> ids_;

public:
    uint32_t index_for(const std::shared_ptr<T>& record) {
        if (const uint32_t* id = ids_.find(record.get())) return *id;
        const auto id = static_cast<uint32_t>(records_.size());
        records_.push_back(record);
        ids_.try_emplace(record.get(), id);
        return id;
    }

    [[nodiscard]] bool contains(const T* record) const noexcept { return ids_.contains(record); }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    [[nodiscard]] const std::shared_ptr<T>& operator[](std::size_t i) const { return records_[i]; }
    [[nodiscard]] const std::shared_ptr<T>& at(std::size_t i) const { return records_.at(i); }

    [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
    [[nodiscard]] auto end() const noexcept { return records_.end(); }
};

struct AbcFile {
    ConstantPool constants;
    RecordTable<AbcMethodInfo> methods;
    RecordTable<AbcMethodBodyInfo> bodies;
    RecordTable<AbcInstanceInfo> instances;
    RecordTable<AbcClassInfo> classes;
    RecordTable<AbcScriptInfo> scripts;
};

} // namespace fusion::avm2

template <>
struct meow::enum_traits<fusion::avm2::TraitKind> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 6;
};
