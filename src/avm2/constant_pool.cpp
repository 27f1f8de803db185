#include <fusion/avm2/constant_pool.h>

#include <bit>

namespace fusion::avm2 {

namespace {

template <typename Key, typename Value>
uint32_t intern(std::vector<Value>& table, meow::flat_map<Key, uint32_t>& ids, const Key& key, Value value) {
    if (const uint32_t* id = ids.find(key)) return *id;
    const auto id = static_cast<uint32_t>(table.size());
    table.push_back(std::move(value));
    ids.try_emplace(key, id);
    return id;
}

} // namespace

uint32_t ConstantPool::string_index(std::string_view s) {
    std::string key(s);
    return intern(strings_, string_ids_, key, key);
}

uint32_t ConstantPool::int_index(int32_t v) {
    return intern(ints_, int_ids_, v, v);
}

uint32_t ConstantPool::uint_index(uint32_t v) {
    return intern(uints_, uint_ids_, v, v);
}

uint32_t ConstantPool::double_index(double v) {
    return intern(doubles_, double_ids_, std::bit_cast<uint64_t>(v), v);
}

uint32_t ConstantPool::namespace_index(std::string_view package) {
    std::string key(package);
    if (const uint32_t* id = namespace_ids_.find(key)) return *id;
    const uint32_t name_id = string_index(key);
    return intern(namespaces_, namespace_ids_, key, name_id);
}

uint32_t ConstantPool::multiname_index(const QName& name) {
    if (const uint32_t* id = multiname_ids_.find(name)) return *id;
    namespace_index(name.ns);
    string_index(name.name);
    return intern(multinames_, multiname_ids_, name, name);
}

} // namespace fusion::avm2
