#pragma once

#include <compare>
#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace fusion::avm2 {

// A package-qualified name. An empty namespace is the public top level.
struct QName {
    std::string ns;
    std::string name;

    QName() = default;
    QName(const char* n) : name(n) {}
    QName(std::string n) : name(std::move(n)) {}
    QName(std::string package, std::string n) : ns(std::move(package)), name(std::move(n)) {}

    // "flash.display.Sprite" or "flash.display::Sprite"
    [[nodiscard]] static QName parse(std::string_view full);
    [[nodiscard]] static QName any() { return QName("*"); }

    [[nodiscard]] const QName& multiname() const noexcept { return *this; }
    [[nodiscard]] std::string full_name() const;
    [[nodiscard]] bool is_any() const noexcept { return ns.empty() && name == "*"; }

    auto operator<=>(const QName&) const = default;
    bool operator==(const QName&) const = default;
};

} // namespace fusion::avm2

template <>
struct std::hash<fusion::avm2::QName> {
    std::size_t operator()(const fusion::avm2::QName& q) const noexcept {
        const std::size_t h = std::hash<std::string>{}(q.ns);
        return h ^ (std::hash<std::string>{}(q.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

template <>
struct std::formatter<fusion::avm2::QName> : std::formatter<std::string> {
    auto format(const fusion::avm2::QName& q, std::format_context& ctx) const {
        return std::formatter<std::string>::format(q.full_name(), ctx);
    }
};
