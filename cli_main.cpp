#include "config/ConfigRegistry.hpp"
#include "crypto/AesCipherProvider.hpp"
#include "crypto/CryptoError.hpp"
#include "crypto/util/encoding.hpp"
#include "log/Registry.hpp"
#include "session/SoftwareSession.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using namespace kb;

static constexpr const auto* USAGE =
    "usage: kbctl generate <AES-GCM|AES-CBC|AES-ECB> <128|192|256>\n"
    "       kbctl encrypt <jwk-file> <hex-iv|-> <hex-data>\n"
    "       kbctl decrypt <jwk-file> <hex-iv|-> <hex-data>\n"
    "       kbctl config\n";

static const std::vector<std::string> ALL_USAGES = {"encrypt", "decrypt"};

static crypto::JsonWebKey readJwk(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open JWK file: " + path);
    return nlohmann::json::parse(in).get<crypto::JsonWebKey>();
}

// "A256GCM" -> "AES-GCM"
static std::string algorithmFromJwk(const crypto::JsonWebKey& jwk) {
    static const std::regex pattern(R"(A\d+(\w+))");
    std::smatch match;
    if (!std::regex_match(jwk.alg, match, pattern))
        throw crypto::CryptoError(crypto::ErrorKind::MalformedAlgorithmName, "Unrecognized JWK alg '" + jwk.alg + "'");
    return "AES-" + match[1].str();
}

static types::AlgorithmDescriptor descriptorFor(const types::AesMode mode, const std::string& ivArg) {
    const auto iv = ivArg == "-" ? std::vector<uint8_t>{} : crypto::util::hex_decode(ivArg);
    switch (mode) {
        case types::AesMode::Gcm: return types::GcmParams{iv, std::nullopt, std::nullopt};
        case types::AesMode::Cbc: return types::CbcParams{iv};
        case types::AesMode::Ecb: return types::EcbParams{};
        case types::AesMode::Ctr: return types::CtrParams{iv, 64};
    }
    throw std::invalid_argument("Unknown AES mode");
}

static int run(const std::vector<std::string>& args) {
    const auto& cfg = config::ConfigRegistry::get();
    const auto& cmd = args[0];

    if (cmd == "config") {
        fmt::print("{}\n", nlohmann::json(cfg).dump(2));
        return 0;
    }

    auto soft = std::make_shared<session::SoftwareSession>(
        session::Version{cfg.module.interface_major, cfg.module.interface_minor});
    const crypto::AesCipherProvider provider(soft, {cfg.keys.token, cfg.keys.sensitive});

    if (cmd == "generate" && args.size() == 3) {
        const auto key = provider.generateKey({args[1], static_cast<unsigned int>(std::stoul(args[2]))},
                                              true, ALL_USAGES);
        const auto jwk = std::get<crypto::JsonWebKey>(provider.exportKey("jwk", key));
        fmt::print("{}\n", nlohmann::json(jwk).dump(2));
        return 0;
    }

    if ((cmd == "encrypt" || cmd == "decrypt") && args.size() == 4) {
        const auto jwk = readJwk(args[1]);
        const auto algorithmName = algorithmFromJwk(jwk);
        const auto key = provider.importKey("jwk", jwk, algorithmName, true, ALL_USAGES);
        const auto descriptor = descriptorFor(types::parseAlgorithmName(algorithmName), args[2]);
        const auto data = crypto::util::hex_decode(args[3]);

        const auto out = cmd == "encrypt" ? provider.encrypt(descriptor, key, data)
                                          : provider.decrypt(descriptor, key, data);
        fmt::print("{}\n", crypto::util::hex_encode(out));
        return 0;
    }

    std::cerr << USAGE;
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << USAGE;
        return 2;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    try {
        config::ConfigRegistry::init();
        log::Registry::init();
        return run(args);
    } catch (const crypto::CryptoError& e) {
        fmt::print(stderr, "kbctl: {}: {}\n", crypto::to_string(e.kind()), e.what());
    } catch (const session::ModuleError& e) {
        fmt::print(stderr, "kbctl: module error: {}\n", e.what());
    } catch (const std::exception& e) {
        fmt::print(stderr, "kbctl: {}\n", e.what());
    }
    return 1;
}
