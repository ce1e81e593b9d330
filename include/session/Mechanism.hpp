#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace kb::session {

// Values match the PKCS#11 CKM_* constants.
enum class MechanismType : unsigned long {
    AesKeyGen = 0x00001080,
    AesEcb    = 0x00001081,
    AesCbc    = 0x00001082,
    AesCbcPad = 0x00001085,
    AesGcm    = 0x00001087
};

[[nodiscard]] std::string_view to_string(MechanismType type);

// CK_GCM_PARAMS as defined before interface version 2.40 (no ulIvBits).
struct GcmLegacyParams {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> aad;
    unsigned long tagBits = 128;
};

// CK_GCM_PARAMS from interface version 2.40 on.
struct Gcm240Params {
    std::vector<uint8_t> iv;
    unsigned long ivBits = 0;
    std::vector<uint8_t> aad;
    unsigned long tagBits = 128;
};

using MechanismParams = std::variant<std::monostate, std::vector<uint8_t>, GcmLegacyParams, Gcm240Params>;

struct Mechanism {
    MechanismType type;
    MechanismParams params;
};

}
