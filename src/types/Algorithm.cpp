#include "types/Algorithm.hpp"
#include "crypto/CryptoError.hpp"

#include <regex>

using namespace kb::crypto;

namespace kb::types {

namespace {

struct ModeOf {
    AesMode operator()(const GcmParams&) const { return AesMode::Gcm; }
    AesMode operator()(const CbcParams&) const { return AesMode::Cbc; }
    AesMode operator()(const EcbParams&) const { return AesMode::Ecb; }
    AesMode operator()(const CtrParams&) const { return AesMode::Ctr; }
};

}

AesMode modeOf(const AlgorithmDescriptor& descriptor) {
    return std::visit(ModeOf{}, descriptor);
}

std::string_view modeSuffix(const AesMode mode) {
    switch (mode) {
        case AesMode::Gcm: return "GCM";
        case AesMode::Cbc: return "CBC";
        case AesMode::Ecb: return "ECB";
        case AesMode::Ctr: return "CTR";
    }
    return "";
}

std::string algorithmName(const AesMode mode) {
    return "AES-" + std::string(modeSuffix(mode));
}

std::string extractModeSuffix(const std::string& name) {
    static const std::regex pattern(R"(AES-(\w+))");
    std::smatch match;
    if (!std::regex_search(name, match, pattern))
        throw CryptoError(ErrorKind::MalformedAlgorithmName,
                          "Algorithm name '" + name + "' does not match AES-<MODE>");
    return match[1].str();
}

AesMode parseAlgorithmName(const std::string& name) {
    const auto suffix = extractModeSuffix(name);
    for (const auto mode : {AesMode::Gcm, AesMode::Cbc, AesMode::Ecb, AesMode::Ctr})
        if (suffix == modeSuffix(mode)) return mode;
    throw CryptoError(ErrorKind::NotSupported, "Unsupported AES mode '" + suffix + "'");
}

}
