#include "crypto/CryptoError.hpp"

namespace kb::crypto {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotSupported: return "NotSupported";
        case ErrorKind::KeyGenerationFailed: return "KeyGenerationFailed";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::MalformedAlgorithmName: return "MalformedAlgorithmName";
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::InvalidAccess: return "InvalidAccess";
    }
    return "Unknown";
}

CryptoError::CryptoError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}
