#include <gtest/gtest.h>
#include "RecordingSession.hpp"
#include "crypto/AesCipherProvider.hpp"
#include "crypto/CryptoError.hpp"
#include "crypto/util/encoding.hpp"

#include <functional>
#include <numeric>

using namespace kb::crypto;
using namespace kb::session;
using namespace kb::types;
using kb::test::RecordingSession;

namespace {

const std::vector<std::string> ENC_DEC = {"encrypt", "decrypt"};

std::vector<uint8_t> bytes(const size_t n, const uint8_t start = 0) {
    std::vector<uint8_t> v(n);
    std::iota(v.begin(), v.end(), start);
    return v;
}

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const CryptoError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected CryptoError";
    return ErrorKind::InvalidParameter;
}

}

class AesCipherProviderTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSession> session = std::make_shared<RecordingSession>();
    std::unique_ptr<AesCipherProvider> provider = std::make_unique<AesCipherProvider>(session, KeyPolicy{});

    KeyHandle generate(const std::string& name, const unsigned int length,
                       const std::vector<std::string>& usages = ENC_DEC) const {
        return provider->generateKey({name, length}, true, usages);
    }
};

TEST_F(AesCipherProviderTest, GenerateKeyTemplateFlags) {
    const auto key = generate("AES-CBC", 256);

    EXPECT_TRUE(key.attributes.encrypt);
    EXPECT_TRUE(key.attributes.decrypt);
    EXPECT_FALSE(key.attributes.sign);
    EXPECT_FALSE(key.attributes.verify);
    EXPECT_FALSE(key.attributes.wrap);
    EXPECT_FALSE(key.attributes.unwrap);
    EXPECT_EQ(key.attributes.label, "AES-256");
    EXPECT_EQ(key.attributes.valueLen, 32u);
    EXPECT_EQ(key.algorithm, (KeyAlgorithm{"AES-CBC", 256}));

    ASSERT_EQ(session->mechanisms.size(), 1u);
    EXPECT_EQ(session->mechanisms.front().type, MechanismType::AesKeyGen);
    ASSERT_EQ(session->templates.size(), 1u);
    EXPECT_FALSE(session->templates.front().value.has_value());
}

TEST_F(AesCipherProviderTest, GenerateKeyWrapsModuleFailure) {
    session->failGenerateWith = ReturnValue::GeneralError;
    try {
        (void)generate("AES-GCM", 128);
        FAIL() << "expected KeyGenerationFailed";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::KeyGenerationFailed);
        EXPECT_NE(std::string(e.what()).find("generation rejected by test"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("CKR_GENERAL_ERROR"), std::string::npos);
    }
}

TEST_F(AesCipherProviderTest, GenerateKeyRejectsBadParameters) {
    EXPECT_EQ(kindOf([&] { (void)generate("AES-GCM", 100); }), ErrorKind::InvalidParameter);
    EXPECT_EQ(kindOf([&] { (void)generate("AES-GCM", 128, {"sign"}); }), ErrorKind::InvalidParameter);
    EXPECT_TRUE(session->templates.empty());
}

TEST_F(AesCipherProviderTest, UnmappedModeIsNotSupportedEverywhere) {
    EXPECT_EQ(kindOf([&] { (void)generate("AES-CTR", 128); }), ErrorKind::NotSupported);
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("raw", bytes(16), "AES-CTR", true, ENC_DEC); }),
              ErrorKind::NotSupported);

    const auto key = generate("AES-CBC", 128);
    EXPECT_EQ(kindOf([&] { (void)provider->encrypt(CtrParams{bytes(16), 64}, key, bytes(4)); }),
              ErrorKind::NotSupported);
    EXPECT_EQ(kindOf([&] { (void)provider->decrypt(CtrParams{bytes(16), 64}, key, bytes(16)); }),
              ErrorKind::NotSupported);
}

TEST_F(AesCipherProviderTest, EcbRoundTripForAnyLength) {
    const auto key = generate("AES-ECB", 128);
    for (const size_t n : {0, 1, 15, 16, 17, 31, 32, 100}) {
        const auto data = bytes(n, 7);
        const auto ct = provider->encrypt(EcbParams{}, key, data);
        EXPECT_EQ(ct.size(), (n / 16 + 1) * 16) << "n=" << n;
        EXPECT_EQ(provider->decrypt(EcbParams{}, key, ct), data) << "n=" << n;
    }
}

TEST_F(AesCipherProviderTest, EcbPadsBeforeSizingTheBuffer) {
    const auto key = generate("AES-ECB", 256);
    (void)provider->encrypt(EcbParams{}, key, bytes(20));

    ASSERT_EQ(session->inputSizes.size(), 1u);
    EXPECT_EQ(session->inputSizes[0], 32u);
    EXPECT_EQ(session->outputSizes[0], 64u);    // ceil(32/32)*32 + 32
}

TEST_F(AesCipherProviderTest, EcbKnownAnswer) {
    // FIPS-197 appendix C.1
    const auto key = provider->importKey("raw", kb::crypto::util::hex_decode("000102030405060708090a0b0c0d0e0f"),
                                         "AES-ECB", true, ENC_DEC);
    const auto plain = kb::crypto::util::hex_decode("00112233445566778899aabbccddeeff");

    const auto ct = provider->encrypt(EcbParams{}, key, plain);
    ASSERT_EQ(ct.size(), 32u);
    EXPECT_EQ(kb::crypto::util::hex_encode({ct.begin(), ct.begin() + 16}), "69c4e0d86a7b0430d8cdb78070b4c55a");
    EXPECT_EQ(provider->decrypt(EcbParams{}, key, ct), plain);
}

TEST_F(AesCipherProviderTest, EcbDecryptWithOverlongPadByteKeepsLeadingBytes) {
    const auto key = generate("AES-ECB", 128);
    std::vector<uint8_t> block(16, 0x41);
    block.back() = 20;

    // Encrypt without local padding so the decrypted block ends in 20.
    const auto ct = session->encrypt({MechanismType::AesEcb, std::monostate{}}, key.object, block, 16);
    ASSERT_EQ(ct.size(), 16u);
    EXPECT_EQ(provider->decrypt(EcbParams{}, key, ct), std::vector<uint8_t>(12, 0x41));
}

TEST_F(AesCipherProviderTest, GcmRoundTripAndTagLength) {
    const auto key = generate("AES-GCM", 256);
    const GcmParams params{bytes(12, 1), bytes(5, 0xA0), 96};
    const auto data = bytes(40);

    const auto ct = provider->encrypt(params, key, data);
    EXPECT_EQ(ct.size(), data.size() + 12);
    EXPECT_EQ(provider->decrypt(params, key, ct), data);

    ASSERT_FALSE(session->mechanisms.empty());
    EXPECT_TRUE(std::holds_alternative<Gcm240Params>(session->mechanisms.back().params));
}

TEST_F(AesCipherProviderTest, GcmDifferentIvDoesNotDecrypt) {
    const auto key = generate("AES-GCM", 128);
    const auto data = bytes(33);
    const auto ct = provider->encrypt(GcmParams{bytes(12, 1), std::nullopt, std::nullopt}, key, data);

    try {
        const auto out = provider->decrypt(GcmParams{bytes(12, 2), std::nullopt, std::nullopt}, key, ct);
        EXPECT_NE(out, data);
    } catch (const ModuleError& e) {
        EXPECT_EQ(e.rv(), ReturnValue::EncryptedDataInvalid);
    }
}

TEST_F(AesCipherProviderTest, GcmWrongAadIsRejectedByModule) {
    const auto key = generate("AES-GCM", 128);
    const auto ct = provider->encrypt(GcmParams{bytes(12), bytes(4), std::nullopt}, key, bytes(8));
    EXPECT_THROW((void)provider->decrypt(GcmParams{bytes(12), bytes(4, 9), std::nullopt}, key, ct), ModuleError);
}

TEST_F(AesCipherProviderTest, GcmOnLegacyModule) {
    auto legacy = std::make_shared<RecordingSession>(Version{2, 20});
    const AesCipherProvider p(legacy, {});
    const auto key = p.generateKey({"AES-GCM", 128}, true, ENC_DEC);
    const GcmParams params{bytes(12), std::nullopt, std::nullopt};

    const auto ct = p.encrypt(params, key, bytes(10));
    EXPECT_EQ(p.decrypt(params, key, ct), bytes(10));
    EXPECT_TRUE(std::holds_alternative<GcmLegacyParams>(legacy->mechanisms.back().params));
}

TEST_F(AesCipherProviderTest, CbcRoundTripAndIvSensitivity) {
    const auto key = generate("AES-CBC", 192);
    const auto data = bytes(45, 3);
    const auto ct = provider->encrypt(CbcParams{bytes(16, 1)}, key, data);

    EXPECT_EQ(ct.size(), 48u);
    EXPECT_EQ(provider->decrypt(CbcParams{bytes(16, 1)}, key, ct), data);
    EXPECT_NE(provider->decrypt(CbcParams{bytes(16, 2)}, key, ct), data);
    EXPECT_EQ(session->mechanisms.back().type, MechanismType::AesCbcPad);
}

TEST_F(AesCipherProviderTest, CbcRequiresBlockSizedIv) {
    const auto key = generate("AES-CBC", 128);
    EXPECT_EQ(kindOf([&] { (void)provider->encrypt(CbcParams{bytes(12)}, key, bytes(4)); }),
              ErrorKind::InvalidParameter);
}

TEST_F(AesCipherProviderTest, GcmRejectsUnknownTagLength) {
    const auto key = generate("AES-GCM", 128);
    EXPECT_EQ(kindOf([&] { (void)provider->encrypt(GcmParams{bytes(12), std::nullopt, 100}, key, bytes(4)); }),
              ErrorKind::InvalidParameter);
}

TEST_F(AesCipherProviderTest, CipherRequiresMatchingKey) {
    const auto encryptOnly = generate("AES-GCM", 128, {"encrypt"});
    const GcmParams params{bytes(12), std::nullopt, std::nullopt};
    const auto ct = provider->encrypt(params, encryptOnly, bytes(8));
    EXPECT_EQ(kindOf([&] { (void)provider->decrypt(params, encryptOnly, ct); }), ErrorKind::InvalidAccess);

    const auto cbcKey = generate("AES-CBC", 128);
    EXPECT_EQ(kindOf([&] { (void)provider->encrypt(params, cbcKey, bytes(8)); }), ErrorKind::InvalidAccess);
}

TEST_F(AesCipherProviderTest, ModuleCipherErrorsPropagateUnchanged) {
    const auto key = generate("AES-ECB", 128);
    try {
        (void)provider->decrypt(EcbParams{}, key, bytes(15));
        FAIL() << "expected ModuleError";
    } catch (const ModuleError& e) {
        EXPECT_EQ(e.rv(), ReturnValue::EncryptedDataLenRange);
    }
}

TEST_F(AesCipherProviderTest, ExportJwk) {
    const auto key = generate("AES-GCM", 256);
    const auto exported = provider->exportKey("jwk", key);
    ASSERT_TRUE(std::holds_alternative<JsonWebKey>(exported));

    const auto& jwk = std::get<JsonWebKey>(exported);
    EXPECT_EQ(jwk.kty, "oct");
    EXPECT_EQ(jwk.alg, "A256GCM");
    EXPECT_TRUE(jwk.ext);
    EXPECT_EQ(jwk.key_ops, ENC_DEC);
    EXPECT_EQ(jwk.k.find('='), std::string::npos);

    const auto raw = std::get<std::vector<uint8_t>>(provider->exportKey("raw", key));
    EXPECT_EQ(kb::crypto::util::b64url_decode(jwk.k), raw);
}

TEST_F(AesCipherProviderTest, ExportFormatIsCaseInsensitive) {
    const auto key = generate("AES-CBC", 128);
    const auto jwk = std::get<JsonWebKey>(provider->exportKey("JWK", key));
    EXPECT_EQ(jwk.alg, "A128CBC");
    EXPECT_EQ(std::get<std::vector<uint8_t>>(provider->exportKey("Raw", key)).size(), 16u);
}

TEST_F(AesCipherProviderTest, JwkRoundTripPreservesKeyValue) {
    const auto original = generate("AES-CBC", 192);
    const auto jwk = provider->exportKey("jwk", original);

    const auto imported = provider->importKey("jwk", std::get<JsonWebKey>(jwk), "AES-CBC", true, ENC_DEC);
    EXPECT_EQ(imported.algorithm, (KeyAlgorithm{"AES-CBC", 192}));
    EXPECT_NE(imported.object, original.object);
    EXPECT_EQ(std::get<std::vector<uint8_t>>(provider->exportKey("raw", imported)),
              std::get<std::vector<uint8_t>>(provider->exportKey("raw", original)));

    // Both objects hold the same key material.
    const auto ct = provider->encrypt(CbcParams{bytes(16)}, original, bytes(30));
    EXPECT_EQ(provider->decrypt(CbcParams{bytes(16)}, imported, ct), bytes(30));
}

TEST_F(AesCipherProviderTest, ImportRawAttachesValueOnce) {
    const auto value = bytes(32, 0x10);
    const auto key = provider->importKey("raw", value, "AES-GCM", false, {"decrypt"});

    EXPECT_EQ(key.algorithm.length, 256u);
    EXPECT_FALSE(key.extractable);
    EXPECT_TRUE(key.attributes.decrypt);
    EXPECT_FALSE(key.attributes.encrypt);
    EXPECT_FALSE(key.attributes.value.has_value());
    ASSERT_EQ(session->templates.size(), 1u);
    EXPECT_EQ(session->templates.front().value, value);
    EXPECT_EQ(session->templates.front().label, "AES-256");
}

TEST_F(AesCipherProviderTest, UnsupportedFormats) {
    const auto key = generate("AES-GCM", 128);
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("der", key); }), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("spki", key); }), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("pkcs8", bytes(16), "AES-GCM", true, ENC_DEC); }),
              ErrorKind::UnsupportedFormat);
}

TEST_F(AesCipherProviderTest, ImportValidation) {
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("raw", bytes(20), "AES-GCM", true, ENC_DEC); }),
              ErrorKind::InvalidParameter);

    JsonWebKey rsa;
    rsa.kty = "RSA";
    rsa.k = "AAAAAAAAAAAAAAAAAAAAAA";
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("jwk", rsa, "AES-GCM", true, ENC_DEC); }),
              ErrorKind::InvalidParameter);

    EXPECT_EQ(kindOf([&] { (void)provider->importKey("jwk", bytes(16), "AES-GCM", true, ENC_DEC); }),
              ErrorKind::InvalidParameter);
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("raw", bytes(16), "Rijndael", true, ENC_DEC); }),
              ErrorKind::MalformedAlgorithmName);
}

TEST_F(AesCipherProviderTest, ExportOfMalformedNameFails) {
    auto key = generate("AES-GCM", 128);
    key.algorithm.name = "Rijndael-GCM";
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("jwk", key); }), ErrorKind::MalformedAlgorithmName);
}

TEST_F(AesCipherProviderTest, ExportChecksFormatBeforeName) {
    auto key = generate("AES-GCM", 128);
    key.algorithm.name = "Rijndael-GCM";

    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("der", key); }), ErrorKind::UnsupportedFormat);
    EXPECT_EQ(std::get<std::vector<uint8_t>>(provider->exportKey("raw", key)).size(), 16u);
}

TEST_F(AesCipherProviderTest, ExportOfUnmappedModeIsNotSupported) {
    auto key = generate("AES-GCM", 128);
    key.algorithm.name = "AES-CTR";

    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("raw", key); }), ErrorKind::NotSupported);
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("jwk", key); }), ErrorKind::NotSupported);
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("der", key); }), ErrorKind::UnsupportedFormat);
}

TEST_F(AesCipherProviderTest, ImportPropagatesModuleRejection) {
    session->failCreateWith = ReturnValue::AttributeValueInvalid;
    try {
        (void)provider->importKey("raw", bytes(16), "AES-GCM", true, ENC_DEC);
        FAIL() << "expected ModuleError";
    } catch (const ModuleError& e) {
        EXPECT_EQ(e.rv(), ReturnValue::AttributeValueInvalid);
    }
    EXPECT_EQ(session->objectCount(), 0u);
    ASSERT_EQ(session->templates.size(), 1u);
    EXPECT_EQ(session->templates.front().value, bytes(16));
}

TEST_F(AesCipherProviderTest, ImportValidationFailureCreatesNothing) {
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("raw", bytes(24), "AES-GCM", true, {"sign"}); }),
              ErrorKind::InvalidParameter);
    EXPECT_EQ(kindOf([&] { (void)provider->importKey("raw", bytes(24), "AES-CTR", true, ENC_DEC); }),
              ErrorKind::NotSupported);
    EXPECT_TRUE(session->templates.empty());
    EXPECT_EQ(session->objectCount(), 0u);
}

TEST_F(AesCipherProviderTest, ExportRequiresExtractableKey) {
    const auto key = provider->generateKey({"AES-GCM", 128}, false, ENC_DEC);
    EXPECT_EQ(kindOf([&] { (void)provider->exportKey("raw", key); }), ErrorKind::InvalidAccess);
}

TEST_F(AesCipherProviderTest, SensitivePolicyBlocksExportAtModule) {
    const AesCipherProvider hardened(session, {false, true});
    const auto key = hardened.generateKey({"AES-GCM", 128}, true, ENC_DEC);
    EXPECT_TRUE(key.attributes.sensitive);

    try {
        (void)hardened.exportKey("raw", key);
        FAIL() << "expected ModuleError";
    } catch (const ModuleError& e) {
        EXPECT_EQ(e.rv(), ReturnValue::AttributeSensitive);
    }
}

TEST(AesCipherProviderConstruction, RequiresSession) {
    EXPECT_THROW(AesCipherProvider(nullptr, {}), std::invalid_argument);
}
