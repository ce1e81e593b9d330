#pragma once

#include "crypto/IdGenerator.hpp"
#include "crypto/Jwk.hpp"
#include "crypto/KeyHandle.hpp"
#include "crypto/KeyTemplateBuilder.hpp"
#include "session/Session.hpp"
#include "types/Algorithm.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace kb::crypto {

using ExportedKey = std::variant<JsonWebKey, std::vector<uint8_t>>;
using KeyData = std::variant<JsonWebKey, std::vector<uint8_t>>;

// AES (GCM, CBC, ECB) on top of a session-based cryptographic module.
//
// Every call is one pass through a fixed pipeline and issues at most one module
// call. Failures surface as CryptoError, except errors the module reports on
// cipher calls, which propagate as session::ModuleError untouched.
class AesCipherProvider {
public:
    AesCipherProvider(std::shared_ptr<session::Session> session, const KeyPolicy& policy);

    AesCipherProvider(const AesCipherProvider&) = delete;
    AesCipherProvider& operator=(const AesCipherProvider&) = delete;

    [[nodiscard]] KeyHandle generateKey(const types::KeyAlgorithm& algorithm,
                                        bool extractable,
                                        const std::vector<std::string>& usages) const;

    // format: "jwk" or "raw" (case-insensitive)
    [[nodiscard]] ExportedKey exportKey(const std::string& format, const KeyHandle& key) const;

    [[nodiscard]] KeyHandle importKey(const std::string& format,
                                      const KeyData& keyData,
                                      const std::string& algorithmName,
                                      bool extractable,
                                      const std::vector<std::string>& usages) const;

    [[nodiscard]] std::vector<uint8_t> encrypt(const types::AlgorithmDescriptor& algorithm,
                                               const KeyHandle& key,
                                               const std::vector<uint8_t>& data) const;

    [[nodiscard]] std::vector<uint8_t> decrypt(const types::AlgorithmDescriptor& algorithm,
                                               const KeyHandle& key,
                                               const std::vector<uint8_t>& data) const;

    [[nodiscard]] const std::shared_ptr<session::Session>& session() const { return session_; }

private:
    std::shared_ptr<session::Session> session_;
    IdGenerator ids_;
    KeyTemplateBuilder templates_;

    [[nodiscard]] KeyHandle makeHandle(session::KeyObject object, types::KeyAlgorithm algorithm,
                                       bool extractable, const std::vector<std::string>& usages,
                                       session::KeyTemplate tmpl) const;
};

}
