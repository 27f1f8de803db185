#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fusion/avm2/instruction.h>
#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

// Anything that names a type or property is loaded with getlex.
template <typename T>
concept Named = requires(const T& t) {
    { t.multiname() } -> std::convertible_to<QName>;
};

// A local register, loaded with getlocal.
struct Local {
    std::string name;
};

// A declared parameter of the current method, loaded with getlocal.
struct Argument {
    std::string name;
};

struct Undefined {};

// Narrowest push for an integer: pushbyte, pushuint, pushint, or pushdouble.
[[nodiscard]] Instruction push_integer(int64_t v);
[[nodiscard]] Instruction push_integer(uint64_t v);
// pushnan for NaN, pushdouble otherwise.
[[nodiscard]] Instruction push_number(double v);

// Specialize to teach CodeGenerator::load a new value shape:
//   template <> struct LoadTraits<Point> {
//       template <typename Gen> static void load(Gen& gen, const Point& p) { gen.load(p.x, p.y); ... }
//   };
template <typename T>
struct LoadTraits;

template <>
struct LoadTraits<bool> {
    template <typename Gen>
    static void load(Gen& gen, bool v) {
        if (v) gen.push_true();
        else gen.push_false();
    }
};

template <std::integral T>
    requires(!std::is_same_v<T, bool> && !std::is_same_v<T, char>)
struct LoadTraits<T> {
    template <typename Gen>
    static void load(Gen& gen, T v) {
        if constexpr (std::is_signed_v<T>) gen.emit(push_integer(static_cast<int64_t>(v)));
        else gen.emit(push_integer(static_cast<uint64_t>(v)));
    }
};

template <std::floating_point T>
struct LoadTraits<T> {
    template <typename Gen>
    static void load(Gen& gen, T v) {
        gen.emit(push_number(static_cast<double>(v)));
    }
};

template <>
struct LoadTraits<std::string> {
    template <typename Gen>
    static void load(Gen& gen, const std::string& v) {
        gen.emit(ins::pushstring(v));
    }
};

template <>
struct LoadTraits<std::string_view> {
    template <typename Gen>
    static void load(Gen& gen, std::string_view v) {
        gen.emit(ins::pushstring(std::string(v)));
    }
};

template <>
struct LoadTraits<const char*> {
    template <typename Gen>
    static void load(Gen& gen, const char* v) {
        gen.emit(ins::pushstring(v));
    }
};

template <std::size_t N>
struct LoadTraits<char[N]> {
    template <typename Gen>
    static void load(Gen& gen, const char (&v)[N]) {
        gen.emit(ins::pushstring(std::string(v)));
    }
};

template <>
struct LoadTraits<std::nullptr_t> {
    template <typename Gen>
    static void load(Gen& gen, std::nullptr_t) {
        gen.push_null();
    }
};

template <>
struct LoadTraits<Undefined> {
    template <typename Gen>
    static void load(Gen& gen, const Undefined&) {
        gen.push_undefined();
    }
};

template <>
struct LoadTraits<Local> {
    template <typename Gen>
    static void load(Gen& gen, const Local& v) {
        gen.push_var(v.name);
    }
};

template <>
struct LoadTraits<Argument> {
    template <typename Gen>
    static void load(Gen& gen, const Argument& v) {
        gen.push_arg(v.name);
    }
};

template <typename T, typename A>
struct LoadTraits<std::vector<T, A>> {
    template <typename Gen>
    static void load(Gen& gen, const std::vector<T, A>& v) {
        gen.init_array(v);
    }
};

// Key/value sequences become objects.
template <typename K, typename V, typename A>
struct LoadTraits<std::vector<std::pair<K, V>, A>> {
    template <typename Gen>
    static void load(Gen& gen, const std::vector<std::pair<K, V>, A>& v) {
        gen.init_object(v);
    }
};

template <typename K, typename V, typename C, typename A>
struct LoadTraits<std::map<K, V, C, A>> {
    template <typename Gen>
    static void load(Gen& gen, const std::map<K, V, C, A>& v) {
        gen.init_object(v);
    }
};

} // namespace fusion::avm2
