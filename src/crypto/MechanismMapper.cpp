#include "crypto/MechanismMapper.hpp"
#include "crypto/CryptoError.hpp"

#include <map>

using namespace kb::session;
using namespace kb::types;

namespace kb::crypto {

static constexpr unsigned long DEFAULT_TAG_LENGTH = 128;

namespace mapper {

Mechanism gcm(const AlgorithmDescriptor& descriptor, const Version& version) {
    const auto& alg = std::get<GcmParams>(descriptor);
    const auto aad = alg.additionalData.value_or(std::vector<uint8_t>{});
    const unsigned long tagBits = alg.tagLength.value_or(DEFAULT_TAG_LENGTH);

    if (atLeast(version, 2, 40))
        return {MechanismType::AesGcm, Gcm240Params{alg.iv, alg.iv.size() * 8, aad, tagBits}};

    return {MechanismType::AesGcm, GcmLegacyParams{alg.iv, aad, tagBits}};
}

Mechanism cbc(const AlgorithmDescriptor& descriptor, const Version&) {
    return {MechanismType::AesCbcPad, std::get<CbcParams>(descriptor).iv};
}

Mechanism ecb(const AlgorithmDescriptor&, const Version&) {
    return {MechanismType::AesEcb, std::monostate{}};
}

}

static const std::map<AesMode, ModeTraits>& registry() {
    static const std::map<AesMode, ModeTraits> modes = {
        {AesMode::Gcm, {mapper::gcm, false}},
        {AesMode::Cbc, {mapper::cbc, false}},
        {AesMode::Ecb, {mapper::ecb, true}},
    };
    return modes;
}

bool hasMapper(const AesMode mode) { return registry().contains(mode); }

const ModeTraits& traitsFor(const AesMode mode) {
    const auto it = registry().find(mode);
    if (it == registry().end())
        throw CryptoError(ErrorKind::NotSupported,
                          "No mechanism mapping for " + algorithmName(mode));
    return it->second;
}

Mechanism toMechanism(const AlgorithmDescriptor& descriptor, const Version& version) {
    return traitsFor(modeOf(descriptor)).toMechanism(descriptor, version);
}

}
