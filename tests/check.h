#pragma once

#include <print>
#include <source_location>
#include <string_view>

namespace fusion::test {

inline int checks = 0;
inline int failures = 0;

inline void check(bool ok, std::string_view what, std::source_location loc = std::source_location::current()) {
    ++checks;
    if (!ok) {
        ++failures;
        std::println(stderr, "  [FAIL] {}:{}  {}", loc.file_name(), loc.line(), what);
    }
}

template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

inline void section(std::string_view name) {
    std::println("--- {} ---", name);
}

inline int summary(std::string_view suite) {
    std::println("[{}] {} checks, {} failed", suite, checks, failures);
    return failures == 0 ? 0 : 1;
}

} // namespace fusion::test

#define CHECK(expr) ::fusion::test::check(static_cast<bool>(expr), #expr)
#define CHECK_THROWS(E, expr) \
    ::fusion::test::check(::fusion::test::throws<E>([&] { (void)(expr); }), #expr " throws " #E)
