#pragma once

#include <stdexcept>
#include <string>

namespace fusion {

class BitStreamError : public std::runtime_error {
public:
    explicit BitStreamError(const std::string& msg) : std::runtime_error(msg) {}
};

// Not enough bits left for a read, or a seek outside the stream.
class EndOfStreamError : public BitStreamError {
public:
    explicit EndOfStreamError(const std::string& msg) : BitStreamError(msg) {}
};

// A value or a bit pattern that the requested format cannot represent.
class FormatError : public BitStreamError {
public:
    explicit FormatError(const std::string& msg) : BitStreamError(msg) {}
};

} // namespace fusion
