#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace kb::crypto {

// Symmetric JSON Web Key (RFC 7517, kty "oct").
struct JsonWebKey {
    std::string kty = "oct";
    std::string k;      // base64url, unpadded
    std::string alg;    // "A256GCM", "A128CBC", ...
    bool ext = true;
    std::vector<std::string> key_ops;
};

void to_json(nlohmann::json& j, const JsonWebKey& jwk);
void from_json(const nlohmann::json& j, JsonWebKey& jwk);

}
