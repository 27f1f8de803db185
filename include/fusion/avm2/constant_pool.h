#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <meow_flat_map.h>

#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

// Interning tables of an ABC file. Slot 0 of every table is reserved, as in the file format.
class ConstantPool {
    std::vector<std::string> strings_{""};
    meow::flat_map<std::string, uint32_t> string_ids_;

    std::vector<int32_t> ints_{0};
    meow::flat_map<int32_t, uint32_t> int_ids_;

    std::vector<uint32_t> uints_{0};
    meow::flat_map<uint32_t, uint32_t> uint_ids_;

    std::vector<double> doubles_{0.0};
    meow::flat_map<uint64_t, uint32_t> double_ids_;  // keyed by bit pattern

    std::vector<uint32_t> namespaces_{0};             // string index per namespace
    meow::flat_map<std::string, uint32_t> namespace_ids_;

    std::vector<QName> multinames_{QName()};
    meow::flat_map<QName, uint32_t> multiname_ids_;

public:
    uint32_t string_index(std::string_view s);
    uint32_t int_index(int32_t v);
    uint32_t uint_index(uint32_t v);
    uint32_t double_index(double v);
    uint32_t namespace_index(std::string_view package);
    uint32_t multiname_index(const QName& name);

    [[nodiscard]] const std::string& string_at(uint32_t i) const { return strings_.at(i); }
    [[nodiscard]] int32_t int_at(uint32_t i) const { return ints_.at(i); }
    [[nodiscard]] uint32_t uint_at(uint32_t i) const { return uints_.at(i); }
    [[nodiscard]] double double_at(uint32_t i) const { return doubles_.at(i); }
    [[nodiscard]] const QName& multiname_at(uint32_t i) const { return multinames_.at(i); }

    [[nodiscard]] std::size_t string_count() const noexcept { return strings_.size(); }
    [[nodiscard]] std::size_t int_count() const noexcept { return ints_.size(); }
    [[nodiscard]] std::size_t uint_count() const noexcept { return uints_.size(); }
    [[nodiscard]] std::size_t double_count() const noexcept { return doubles_.size(); }
    [[nodiscard]] std::size_t namespace_count() const noexcept { return namespaces_.size(); }
    [[nodiscard]] std::size_t multiname_count() const noexcept { return multinames_.size(); }
};

} // namespace fusion::avm2
