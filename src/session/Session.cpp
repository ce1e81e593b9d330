#include "session/Session.hpp"

#include <fmt/format.h>

namespace kb::session {

std::string to_string(const ReturnValue rv) {
    switch (rv) {
        case ReturnValue::Ok: return "CKR_OK";
        case ReturnValue::GeneralError: return "CKR_GENERAL_ERROR";
        case ReturnValue::ArgumentsBad: return "CKR_ARGUMENTS_BAD";
        case ReturnValue::AttributeSensitive: return "CKR_ATTRIBUTE_SENSITIVE";
        case ReturnValue::AttributeValueInvalid: return "CKR_ATTRIBUTE_VALUE_INVALID";
        case ReturnValue::DataLenRange: return "CKR_DATA_LEN_RANGE";
        case ReturnValue::EncryptedDataInvalid: return "CKR_ENCRYPTED_DATA_INVALID";
        case ReturnValue::EncryptedDataLenRange: return "CKR_ENCRYPTED_DATA_LEN_RANGE";
        case ReturnValue::KeyHandleInvalid: return "CKR_KEY_HANDLE_INVALID";
        case ReturnValue::KeySizeRange: return "CKR_KEY_SIZE_RANGE";
        case ReturnValue::KeyFunctionNotPermitted: return "CKR_KEY_FUNCTION_NOT_PERMITTED";
        case ReturnValue::MechanismInvalid: return "CKR_MECHANISM_INVALID";
        case ReturnValue::MechanismParamInvalid: return "CKR_MECHANISM_PARAM_INVALID";
        case ReturnValue::TemplateIncomplete: return "CKR_TEMPLATE_INCOMPLETE";
        case ReturnValue::BufferTooSmall: return "CKR_BUFFER_TOO_SMALL";
    }
    return fmt::format("CKR_0x{:08X}", static_cast<unsigned long>(rv));
}

ModuleError::ModuleError(const ReturnValue rv, const std::string& what)
    : std::runtime_error(fmt::format("{}: {}", to_string(rv), what)), rv_(rv) {}

bool atLeast(const Version& v, const unsigned int major, const unsigned int minor) {
    return v.major > major || (v.major == major && v.minor >= minor);
}

std::string_view to_string(const MechanismType type) {
    switch (type) {
        case MechanismType::AesKeyGen: return "AES_KEY_GEN";
        case MechanismType::AesEcb: return "AES_ECB";
        case MechanismType::AesCbc: return "AES_CBC";
        case MechanismType::AesCbcPad: return "AES_CBC_PAD";
        case MechanismType::AesGcm: return "AES_GCM";
    }
    return "UNKNOWN";
}

}
