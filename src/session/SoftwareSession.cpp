#include "session/SoftwareSession.hpp"
#include "log/Registry.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fmt/format.h>
#include <memory>

namespace kb::session {

namespace {

constexpr std::size_t AES_BLOCK = 16;

using ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&::EVP_CIPHER_CTX_free)>;

[[noreturn]] void fail(const ReturnValue rv, const std::string& msg) {
    log::Registry::session()->debug("[SoftwareSession] {}: {}", to_string(rv), msg);
    throw ModuleError(rv, msg);
}

bool validKeySize(const std::size_t n) { return n == 16 || n == 24 || n == 32; }

const EVP_CIPHER* cipherFor(const MechanismType type, const std::size_t keySize) {
    switch (type) {
        case MechanismType::AesEcb:
            return keySize == 16 ? EVP_aes_128_ecb() : keySize == 24 ? EVP_aes_192_ecb() : EVP_aes_256_ecb();
        case MechanismType::AesCbc:
        case MechanismType::AesCbcPad:
            return keySize == 16 ? EVP_aes_128_cbc() : keySize == 24 ? EVP_aes_192_cbc() : EVP_aes_256_cbc();
        case MechanismType::AesGcm:
            return keySize == 16 ? EVP_aes_128_gcm() : keySize == 24 ? EVP_aes_192_gcm() : EVP_aes_256_gcm();
        default:
            fail(ReturnValue::MechanismInvalid, fmt::format("{} is not a cipher mechanism", to_string(type)));
    }
}

struct GcmView {
    const std::vector<uint8_t>* iv = nullptr;
    const std::vector<uint8_t>* aad = nullptr;
    std::size_t tagBytes = 0;
};

GcmView gcmParams(const MechanismParams& params) {
    GcmView view;
    unsigned long tagBits = 0;
    if (const auto* p = std::get_if<Gcm240Params>(&params)) {
        if (p->ivBits != p->iv.size() * 8) fail(ReturnValue::MechanismParamInvalid, "ulIvBits does not match iv");
        view.iv = &p->iv;
        view.aad = &p->aad;
        tagBits = p->tagBits;
    } else if (const auto* l = std::get_if<GcmLegacyParams>(&params)) {
        view.iv = &l->iv;
        view.aad = &l->aad;
        tagBits = l->tagBits;
    } else {
        fail(ReturnValue::MechanismParamInvalid, "AES_GCM requires CK_GCM_PARAMS");
    }

    if (view.iv->empty()) fail(ReturnValue::MechanismParamInvalid, "AES_GCM iv is empty");
    if (tagBits < 32 || tagBits > 128 || tagBits % 8 != 0)
        fail(ReturnValue::MechanismParamInvalid, fmt::format("Invalid GCM tag length {}", tagBits));
    view.tagBytes = tagBits / 8;
    return view;
}

}

SoftwareSession::SoftwareSession(const Version& interfaceVersion) : version_(interfaceVersion) {
    log::Registry::session()->debug("[SoftwareSession] Opened (interface {}.{})", version_.major, version_.minor);
}

SoftwareSession::~SoftwareSession() {
    for (auto& [handle, obj] : objects_)
        if (!obj.value.empty()) OPENSSL_cleanse(obj.value.data(), obj.value.size());
}

KeyObject SoftwareSession::store(const KeyTemplate& tmpl, std::vector<uint8_t> value) {
    StoredKey obj;
    obj.attributes = tmpl;
    obj.attributes.value.reset();
    obj.attributes.valueLen = value.size();
    obj.value = std::move(value);

    const auto handle = nextHandle_++;
    objects_.emplace(handle, std::move(obj));
    return handle;
}

const SoftwareSession::StoredKey& SoftwareSession::lookup(const KeyObject key) const {
    const auto it = objects_.find(key);
    if (it == objects_.end()) fail(ReturnValue::KeyHandleInvalid, fmt::format("No object with handle {}", key));
    return it->second;
}

KeyObject SoftwareSession::generateSecretKey(const Mechanism& mechanism, const KeyTemplate& tmpl) {
    if (mechanism.type != MechanismType::AesKeyGen)
        fail(ReturnValue::MechanismInvalid, fmt::format("{} cannot generate secret keys", to_string(mechanism.type)));
    if (!tmpl.valueLen) fail(ReturnValue::TemplateIncomplete, "CKA_VALUE_LEN is required for AES_KEY_GEN");
    if (!validKeySize(*tmpl.valueLen))
        fail(ReturnValue::KeySizeRange, fmt::format("AES key of {} bytes", *tmpl.valueLen));

    std::vector<uint8_t> value(*tmpl.valueLen);
    if (RAND_bytes(value.data(), static_cast<int>(value.size())) != 1)
        fail(ReturnValue::GeneralError, "RAND_bytes failed");

    std::scoped_lock lock(mutex_);
    const auto handle = store(tmpl, std::move(value));
    log::Registry::session()->debug("[SoftwareSession] Generated secret key {} ('{}')", handle, tmpl.label);
    return handle;
}

KeyObject SoftwareSession::createSecretKeyObject(const KeyTemplate& tmpl) {
    if (!tmpl.value) fail(ReturnValue::TemplateIncomplete, "CKA_VALUE is required to create a secret key");
    if (!validKeySize(tmpl.value->size()))
        fail(ReturnValue::AttributeValueInvalid, fmt::format("AES key of {} bytes", tmpl.value->size()));

    std::scoped_lock lock(mutex_);
    const auto handle = store(tmpl, *tmpl.value);
    log::Registry::session()->debug("[SoftwareSession] Created secret key {} ('{}')", handle, tmpl.label);
    return handle;
}

KeyAttributes SoftwareSession::readAttributes(const KeyObject key) const {
    std::scoped_lock lock(mutex_);
    const auto& obj = lookup(key);
    if (obj.attributes.sensitive || !obj.attributes.extractable)
        fail(ReturnValue::AttributeSensitive, fmt::format("CKA_VALUE of object {} cannot be revealed", key));
    return {obj.value, obj.value.size()};
}

std::vector<uint8_t> SoftwareSession::encrypt(const Mechanism& mechanism, const KeyObject key,
                                              const std::vector<uint8_t>& input, const std::size_t outputSize) {
    return cipher(mechanism, key, input, outputSize, true);
}

std::vector<uint8_t> SoftwareSession::decrypt(const Mechanism& mechanism, const KeyObject key,
                                              const std::vector<uint8_t>& input, const std::size_t outputSize) {
    return cipher(mechanism, key, input, outputSize, false);
}

std::vector<uint8_t> SoftwareSession::cipher(const Mechanism& mechanism, const KeyObject key,
                                             const std::vector<uint8_t>& input, const std::size_t outputSize,
                                             const bool encrypt) {
    std::scoped_lock lock(mutex_);
    const auto& obj = lookup(key);

    if (encrypt ? !obj.attributes.encrypt : !obj.attributes.decrypt)
        fail(ReturnValue::KeyFunctionNotPermitted,
             fmt::format("Object {} does not allow {}", key, encrypt ? "CKA_ENCRYPT" : "CKA_DECRYPT"));

    const auto type = mechanism.type;
    const EVP_CIPHER* evp = cipherFor(type, obj.value.size());

    const std::vector<uint8_t>* iv = nullptr;
    GcmView gcm;
    if (type == MechanismType::AesGcm) {
        gcm = gcmParams(mechanism.params);
        iv = gcm.iv;
    } else if (type == MechanismType::AesEcb) {
        if (!std::holds_alternative<std::monostate>(mechanism.params))
            fail(ReturnValue::MechanismParamInvalid, "AES_ECB takes no parameters");
    } else {
        iv = std::get_if<std::vector<uint8_t>>(&mechanism.params);
        if (!iv || iv->size() != AES_BLOCK) fail(ReturnValue::MechanismParamInvalid, "AES_CBC requires a 16 byte iv");
    }

    const bool nativePadding = type == MechanismType::AesCbcPad;
    if (!nativePadding && type != MechanismType::AesGcm && input.size() % AES_BLOCK != 0)
        fail(encrypt ? ReturnValue::DataLenRange : ReturnValue::EncryptedDataLenRange,
             fmt::format("{} input of {} bytes is not block aligned", to_string(type), input.size()));

    std::vector<uint8_t> body = input;
    std::vector<uint8_t> tag;
    if (type == MechanismType::AesGcm && !encrypt) {
        if (input.size() < gcm.tagBytes)
            fail(ReturnValue::EncryptedDataLenRange, "Ciphertext shorter than the authentication tag");
        tag.assign(input.end() - static_cast<std::ptrdiff_t>(gcm.tagBytes), input.end());
        body.resize(input.size() - gcm.tagBytes);
    }

    ctx_ptr ctx{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
    if (!ctx) fail(ReturnValue::GeneralError, "EVP_CIPHER_CTX_new failed");

    const int enc = encrypt ? 1 : 0;
    if (1 != EVP_CipherInit_ex(ctx.get(), evp, nullptr, nullptr, nullptr, enc))
        fail(ReturnValue::GeneralError, "EVP_CipherInit_ex failed");

    if (type == MechanismType::AesGcm &&
        1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv->size()), nullptr))
        fail(ReturnValue::MechanismParamInvalid, "Unsupported GCM iv length");

    if (1 != EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, obj.value.data(), iv ? iv->data() : nullptr, enc))
        fail(ReturnValue::GeneralError, "EVP_CipherInit_ex failed to set key");

    if (1 != EVP_CIPHER_CTX_set_padding(ctx.get(), nativePadding ? 1 : 0))
        fail(ReturnValue::GeneralError, "EVP_CIPHER_CTX_set_padding failed");

    int written = 0;
    if (type == MechanismType::AesGcm && !gcm.aad->empty() &&
        1 != EVP_CipherUpdate(ctx.get(), nullptr, &written, gcm.aad->data(), static_cast<int>(gcm.aad->size())))
        fail(ReturnValue::GeneralError, "EVP_CipherUpdate failed on AAD");

    std::vector<uint8_t> out(body.size() + AES_BLOCK + gcm.tagBytes);
    written = 0;
    if (!body.empty() &&
        1 != EVP_CipherUpdate(ctx.get(), out.data(), &written, body.data(), static_cast<int>(body.size())))
        fail(ReturnValue::GeneralError, "EVP_CipherUpdate failed");

    if (type == MechanismType::AesGcm && !encrypt &&
        1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()))
        fail(ReturnValue::GeneralError, "Failed to set GCM tag");

    int finallyWritten = 0;
    if (1 != EVP_CipherFinal_ex(ctx.get(), out.data() + written, &finallyWritten))
        fail(encrypt ? ReturnValue::GeneralError : ReturnValue::EncryptedDataInvalid,
             fmt::format("{} final block failed", to_string(type)));

    std::size_t total = static_cast<std::size_t>(written) + static_cast<std::size_t>(finallyWritten);

    if (type == MechanismType::AesGcm && encrypt) {
        if (1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(gcm.tagBytes), out.data() + total))
            fail(ReturnValue::GeneralError, "Failed to read GCM tag");
        total += gcm.tagBytes;
    }

    if (total > outputSize) {
        OPENSSL_cleanse(out.data(), out.size());
        fail(ReturnValue::BufferTooSmall, fmt::format("Output of {} bytes exceeds buffer of {}", total, outputSize));
    }

    out.resize(total);
    return out;
}

std::vector<uint8_t> SoftwareSession::generateRandom(const std::size_t n) {
    std::vector<uint8_t> buf(n);
    if (n > 0 && RAND_bytes(buf.data(), static_cast<int>(n)) != 1) fail(ReturnValue::GeneralError, "RAND_bytes failed");
    return buf;
}

void SoftwareSession::destroyObject(const KeyObject key) {
    std::scoped_lock lock(mutex_);
    const auto it = objects_.find(key);
    if (it == objects_.end()) fail(ReturnValue::KeyHandleInvalid, fmt::format("No object with handle {}", key));
    if (!it->second.value.empty()) OPENSSL_cleanse(it->second.value.data(), it->second.value.size());
    objects_.erase(it);
}

std::size_t SoftwareSession::objectCount() const {
    std::scoped_lock lock(mutex_);
    return objects_.size();
}

}
