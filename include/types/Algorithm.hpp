#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kb::types {

enum class AesMode { Gcm, Cbc, Ecb, Ctr };

struct GcmParams {
    std::vector<uint8_t> iv;
    std::optional<std::vector<uint8_t>> additionalData;
    std::optional<unsigned int> tagLength;   // bits
};

struct CbcParams {
    std::vector<uint8_t> iv;
};

struct EcbParams {};

// Known to the abstract API, no mechanism mapper behind it.
struct CtrParams {
    std::vector<uint8_t> counter;
    unsigned int length = 0;
};

using AlgorithmDescriptor = std::variant<GcmParams, CbcParams, EcbParams, CtrParams>;

struct KeyAlgorithm {
    std::string name;        // "AES-GCM", "AES-CBC", ...
    unsigned int length = 0; // bits

    bool operator==(const KeyAlgorithm&) const = default;
};

[[nodiscard]] AesMode modeOf(const AlgorithmDescriptor& descriptor);

// "GCM", "CBC", "ECB", "CTR"
[[nodiscard]] std::string_view modeSuffix(AesMode mode);

// "AES-GCM", ...
[[nodiscard]] std::string algorithmName(AesMode mode);

// Parses a WebCrypto name such as "AES-CBC". Throws CryptoError(MalformedAlgorithmName)
// when the name carries no "AES-<MODE>" part and CryptoError(NotSupported) for
// a well-formed but unknown mode.
[[nodiscard]] AesMode parseAlgorithmName(const std::string& name);

// Extracts the word following "AES-" the way the JWK "alg" member needs it.
// Throws CryptoError(MalformedAlgorithmName) on mismatch.
[[nodiscard]] std::string extractModeSuffix(const std::string& name);

}
