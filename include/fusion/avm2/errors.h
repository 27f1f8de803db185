#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fusion::avm2 {

class CodegenError : public std::runtime_error {
public:
    explicit CodegenError(const std::string& msg) : std::runtime_error(msg) {}
};

// An operation that needs a particular kind of frame was called in another kind.
class WrongContextError : public CodegenError {
    std::string operation_;
    std::string context_;

public:
    WrongContextError(std::string_view operation, std::string_view context)
        : CodegenError(std::format("You called '{}' while the current context was a {} context.", operation, context)),
          operation_(operation), context_(context) {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }
};

class LocalNotFoundError : public CodegenError {
public:
    explicit LocalNotFoundError(std::string_view name)
        : CodegenError(std::format("The local variable '{}' is not bound in the current method.", name)) {}
};

class NotAnArgumentError : public CodegenError {
public:
    explicit NotAnArgumentError(std::string_view name)
        : CodegenError(std::format("The local variable '{}' is not an argument in the current method.", name)) {}
};

class RedefinitionError : public CodegenError {
public:
    explicit RedefinitionError(const std::string& msg) : CodegenError(msg) {}
};

class TypeNotFoundError : public std::runtime_error {
public:
    explicit TypeNotFoundError(std::string_view name)
        : std::runtime_error(std::format("The type '{}' is not known to this library.", name)) {}
};

} // namespace fusion::avm2
