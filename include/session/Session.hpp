#pragma once

#include "session/KeyTemplate.hpp"
#include "session/Mechanism.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace kb::session {

using KeyObject = unsigned long;   // CK_OBJECT_HANDLE

// Subset of PKCS#11 CKR_* return values reported by modules.
enum class ReturnValue : unsigned long {
    Ok                    = 0x00000000,
    GeneralError          = 0x00000005,
    ArgumentsBad          = 0x00000007,
    AttributeSensitive    = 0x00000011,
    AttributeValueInvalid = 0x00000013,
    DataLenRange          = 0x00000021,
    EncryptedDataInvalid  = 0x00000040,
    EncryptedDataLenRange = 0x00000041,
    KeyHandleInvalid      = 0x00000060,
    KeySizeRange          = 0x00000062,
    KeyFunctionNotPermitted = 0x00000068,
    MechanismInvalid      = 0x00000070,
    MechanismParamInvalid = 0x00000071,
    TemplateIncomplete    = 0x000000D0,
    BufferTooSmall        = 0x00000150
};

[[nodiscard]] std::string to_string(ReturnValue rv);

// Error reported by the cryptographic module. Propagated to callers unchanged.
class ModuleError : public std::runtime_error {
public:
    ModuleError(ReturnValue rv, const std::string& what);

    [[nodiscard]] ReturnValue rv() const noexcept { return rv_; }

private:
    ReturnValue rv_;
};

struct Version {
    unsigned int major = 0;
    unsigned int minor = 0;
};

[[nodiscard]] bool atLeast(const Version& v, unsigned int major, unsigned int minor);

struct KeyAttributes {
    std::vector<uint8_t> value;
    unsigned long valueLen = 0;
};

// Channel to a cryptographic module. Owns the key objects it hands out.
class Session {
public:
    virtual ~Session() = default;

    virtual KeyObject generateSecretKey(const Mechanism& mechanism, const KeyTemplate& tmpl) = 0;
    virtual KeyObject createSecretKeyObject(const KeyTemplate& tmpl) = 0;
    [[nodiscard]] virtual KeyAttributes readAttributes(KeyObject key) const = 0;

    // Single-part operations. outputSize is the upper bound the caller allocated;
    // the returned buffer holds the bytes the module actually wrote.
    virtual std::vector<uint8_t> encrypt(const Mechanism& mechanism, KeyObject key,
                                         const std::vector<uint8_t>& input, std::size_t outputSize) = 0;
    virtual std::vector<uint8_t> decrypt(const Mechanism& mechanism, KeyObject key,
                                         const std::vector<uint8_t>& input, std::size_t outputSize) = 0;

    [[nodiscard]] virtual Version interfaceVersion() const = 0;
    virtual std::vector<uint8_t> generateRandom(std::size_t n) = 0;
};

}
