#include "crypto/Jwk.hpp"

#include <nlohmann/json.hpp>

namespace kb::crypto {

void to_json(nlohmann::json& j, const JsonWebKey& jwk) {
    j = {
        {"kty", jwk.kty},
        {"k", jwk.k},
        {"alg", jwk.alg},
        {"ext", jwk.ext}
    };
    if (!jwk.key_ops.empty()) j["key_ops"] = jwk.key_ops;
}

void from_json(const nlohmann::json& j, JsonWebKey& jwk) {
    jwk.kty = j.value("kty", "");
    jwk.k = j.value("k", "");
    jwk.alg = j.value("alg", "");
    jwk.ext = j.value("ext", true);
    jwk.key_ops = j.value("key_ops", std::vector<std::string>{});
}

}
