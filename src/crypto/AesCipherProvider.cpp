#include "crypto/AesCipherProvider.hpp"
#include "crypto/CryptoError.hpp"
#include "crypto/MechanismMapper.hpp"
#include "crypto/Padding.hpp"
#include "crypto/util/encoding.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/format.h>

using namespace kb::session;
using namespace kb::types;

namespace kb::crypto {

namespace {

constexpr std::array<unsigned int, 3> AES_KEY_LENGTHS = {128, 192, 256};
constexpr std::array<unsigned int, 7> GCM_TAG_LENGTHS = {32, 64, 96, 104, 112, 120, 128};
constexpr std::array<std::string_view, 4> AES_USAGES = {"encrypt", "decrypt", "wrapKey", "unwrapKey"};

std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void checkKeyLength(const unsigned int length) {
    if (std::ranges::find(AES_KEY_LENGTHS, length) == AES_KEY_LENGTHS.end())
        throw CryptoError(ErrorKind::InvalidParameter,
                          fmt::format("AES key length must be 128, 192 or 256 bits, got {}", length));
}

void checkUsages(const std::vector<std::string>& usages) {
    for (const auto& usage : usages)
        if (std::ranges::find(AES_USAGES, usage) == AES_USAGES.end())
            throw CryptoError(ErrorKind::InvalidParameter, fmt::format("Usage '{}' is not valid for AES keys", usage));
}

struct CheckParams {
    void operator()(const GcmParams& p) const {
        if (p.iv.empty()) throw CryptoError(ErrorKind::InvalidParameter, "AES-GCM requires a non-empty iv");
        if (p.tagLength && std::ranges::find(GCM_TAG_LENGTHS, *p.tagLength) == GCM_TAG_LENGTHS.end())
            throw CryptoError(ErrorKind::InvalidParameter,
                              fmt::format("AES-GCM tagLength {} is not supported", *p.tagLength));
    }
    void operator()(const CbcParams& p) const {
        if (p.iv.size() != padding::AES_BLOCK_SIZE)
            throw CryptoError(ErrorKind::InvalidParameter,
                              fmt::format("AES-CBC iv must be 16 bytes, got {}", p.iv.size()));
    }
    void operator()(const EcbParams&) const {}
    void operator()(const CtrParams&) const {}
};

// Rejects a well-formed but unmapped mode. A name without an AES-<MODE> part is
// left for the callers that actually need the suffix.
void checkMapped(const std::string& name) {
    try {
        (void)traitsFor(parseAlgorithmName(name));
    } catch (const CryptoError& e) {
        if (e.kind() != ErrorKind::MalformedAlgorithmName) throw;
    }
}

// The key must have been created for this mode and carry the usage.
void checkKey(const KeyHandle& key, const AesMode mode, const std::string& usage) {
    if (parseAlgorithmName(key.algorithm.name) != mode)
        throw CryptoError(ErrorKind::InvalidAccess,
                          fmt::format("Key algorithm {} does not match {}", key.algorithm.name, algorithmName(mode)));
    if (std::ranges::find(key.usages, usage) == key.usages.end())
        throw CryptoError(ErrorKind::InvalidAccess, fmt::format("Key does not allow '{}'", usage));
}

}

AesCipherProvider::AesCipherProvider(std::shared_ptr<Session> session, const KeyPolicy& policy)
    : session_(std::move(session)),
      ids_(session_ ? *session_ : throw std::invalid_argument("AesCipherProvider requires a session")),
      templates_(ids_, policy) {}

KeyHandle AesCipherProvider::makeHandle(const KeyObject object, KeyAlgorithm algorithm, const bool extractable,
                                        const std::vector<std::string>& usages, KeyTemplate tmpl) const {
    if (tmpl.value) {
        util::secure_wipe(*tmpl.value);
        tmpl.value.reset();
    }

    KeyHandle handle;
    handle.object = object;
    handle.algorithm = std::move(algorithm);
    handle.extractable = extractable;
    handle.usages = usages;
    handle.attributes = std::move(tmpl);
    return handle;
}

KeyHandle AesCipherProvider::generateKey(const KeyAlgorithm& algorithm, const bool extractable,
                                         const std::vector<std::string>& usages) const {
    (void)traitsFor(parseAlgorithmName(algorithm.name));
    checkKeyLength(algorithm.length);
    checkUsages(usages);

    auto tmpl = templates_.build(algorithm, extractable, usages);
    tmpl.valueLen = algorithm.length >> 3;

    KeyObject object{};
    try {
        object = session_->generateSecretKey({MechanismType::AesKeyGen, std::monostate{}}, tmpl);
    } catch (const ModuleError& e) {
        log::Registry::crypto()->error("[AesCipherProvider] Key generation for {}-{} failed: {}",
                                       algorithm.name, algorithm.length, e.what());
        throw CryptoError(ErrorKind::KeyGenerationFailed, std::string("Aes: Can not generate new key\n") + e.what());
    }

    log::Registry::crypto()->debug("[AesCipherProvider] Generated {} key ({} bits) as object {}",
                                   algorithm.name, algorithm.length, object);
    return makeHandle(object, algorithm, extractable, usages, std::move(tmpl));
}

ExportedKey AesCipherProvider::exportKey(const std::string& format, const KeyHandle& key) const {
    const auto fmtName = toLower(format);
    if (fmtName != "jwk" && fmtName != "raw")
        throw CryptoError(ErrorKind::UnsupportedFormat, fmt::format("Unknown format '{}'", format));

    checkMapped(key.algorithm.name);

    if (!key.extractable)
        throw CryptoError(ErrorKind::InvalidAccess, "Key is not extractable");

    auto attrs = session_->readAttributes(key.object);

    if (fmtName == "raw") return std::move(attrs.value);

    std::string suffix;
    try {
        suffix = extractModeSuffix(key.algorithm.name);
    } catch (const CryptoError&) {
        util::secure_wipe(attrs.value);
        throw;
    }

    JsonWebKey jwk;
    jwk.kty = "oct";
    jwk.k = util::b64url_encode(attrs.value);
    jwk.alg = fmt::format("A{}{}", attrs.valueLen * 8, suffix);
    jwk.ext = key.extractable;
    jwk.key_ops = key.usages;
    util::secure_wipe(attrs.value);
    return jwk;
}

KeyHandle AesCipherProvider::importKey(const std::string& format, const KeyData& keyData,
                                       const std::string& algorithmName, const bool extractable,
                                       const std::vector<std::string>& usages) const {
    const auto fmtName = toLower(format);
    std::vector<uint8_t> value;

    if (fmtName == "jwk") {
        const auto* jwk = std::get_if<JsonWebKey>(&keyData);
        if (!jwk) throw CryptoError(ErrorKind::InvalidParameter, "Format 'jwk' requires a JSON Web Key");
        if (jwk->kty != "oct")
            throw CryptoError(ErrorKind::InvalidParameter, fmt::format("JWK kty must be 'oct', got '{}'", jwk->kty));
        if (jwk->k.empty()) throw CryptoError(ErrorKind::InvalidParameter, "JWK is missing 'k'");
        try {
            value = util::b64url_decode(jwk->k);
        } catch (const std::runtime_error& e) {
            throw CryptoError(ErrorKind::InvalidParameter, fmt::format("JWK 'k' is not base64url: {}", e.what()));
        }
    } else if (fmtName == "raw") {
        const auto* raw = std::get_if<std::vector<uint8_t>>(&keyData);
        if (!raw) throw CryptoError(ErrorKind::InvalidParameter, "Format 'raw' requires a byte buffer");
        value = *raw;
    } else {
        throw CryptoError(ErrorKind::UnsupportedFormat, fmt::format("Unknown format '{}'", format));
    }

    const KeyAlgorithm algorithm{algorithmName, static_cast<unsigned int>(value.size() * 8)};
    KeyTemplate tmpl;
    KeyObject object{};

    try {
        (void)traitsFor(parseAlgorithmName(algorithmName));
        checkKeyLength(algorithm.length);
        checkUsages(usages);

        tmpl = templates_.build(algorithm, extractable, usages);
        tmpl.value = std::move(value);
        object = session_->createSecretKeyObject(tmpl);
    } catch (const std::exception&) {
        util::secure_wipe(value);
        if (tmpl.value) util::secure_wipe(*tmpl.value);
        throw;
    }

    log::Registry::crypto()->debug("[AesCipherProvider] Imported {} key ({} bits) from '{}' as object {}",
                                   algorithm.name, algorithm.length, fmtName, object);
    return makeHandle(object, algorithm, extractable, usages, std::move(tmpl));
}

std::vector<uint8_t> AesCipherProvider::encrypt(const AlgorithmDescriptor& algorithm, const KeyHandle& key,
                                                const std::vector<uint8_t>& data) const {
    const auto mode = modeOf(algorithm);
    const auto& traits = traitsFor(mode);
    std::visit(CheckParams{}, algorithm);
    checkKey(key, mode, "encrypt");

    const auto input = traits.padding ? padding::pad(data) : data;
    const auto mechanism = traits.toMechanism(algorithm, session_->interfaceVersion());
    const auto outSize = padding::outputBufferSize(key.algorithm.length, true, input.size());

    log::Registry::crypto()->trace("[AesCipherProvider] {} encrypt: {} bytes in, {} byte buffer",
                                   to_string(mechanism.type), input.size(), outSize);
    return session_->encrypt(mechanism, key.object, input, outSize);
}

std::vector<uint8_t> AesCipherProvider::decrypt(const AlgorithmDescriptor& algorithm, const KeyHandle& key,
                                                const std::vector<uint8_t>& data) const {
    const auto mode = modeOf(algorithm);
    const auto& traits = traitsFor(mode);
    std::visit(CheckParams{}, algorithm);
    checkKey(key, mode, "decrypt");

    const auto mechanism = traits.toMechanism(algorithm, session_->interfaceVersion());
    const auto outSize = padding::outputBufferSize(key.algorithm.length, false, data.size());

    log::Registry::crypto()->trace("[AesCipherProvider] {} decrypt: {} bytes in, {} byte buffer",
                                   to_string(mechanism.type), data.size(), outSize);
    auto plain = session_->decrypt(mechanism, key.object, data, outSize);
    if (traits.padding) return padding::unpad(plain);
    return plain;
}

}
