#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chroma {

// Recoverable failure classes reported by the inference core.
// None of these are fatal; the hosting layer is expected to re-prompt.
enum class ErrorCode : std::uint32_t {
    InvalidArgument = 0,
    InvalidState = 1,
    NotStarted = 2,
    InsufficientData = 3,
};

const char* errorCodeName(ErrorCode code);

class ScreenError : public std::runtime_error {
public:
    ScreenError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

[[noreturn]] void throwInvalidArgument(const std::string& what);
[[noreturn]] void throwInvalidState(const std::string& what);
[[noreturn]] void throwNotStarted(const std::string& what);
[[noreturn]] void throwInsufficientData(const std::string& what);

} // namespace chroma
