#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace kb::crypto {

enum class ErrorKind {
    NotSupported,
    KeyGenerationFailed,
    UnsupportedFormat,
    MalformedAlgorithmName,
    InvalidParameter,
    InvalidAccess
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

class CryptoError : public std::runtime_error {
public:
    CryptoError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
