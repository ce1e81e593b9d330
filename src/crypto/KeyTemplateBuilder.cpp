#include "crypto/KeyTemplateBuilder.hpp"

#include <algorithm>

namespace kb::crypto {

static bool hasUsage(const std::vector<std::string>& usages, const std::string& usage) {
    return std::ranges::find(usages, usage) != usages.end();
}

KeyTemplateBuilder::KeyTemplateBuilder(const IdGenerator& ids, const KeyPolicy& policy)
    : ids_(ids), policy_(policy) {}

session::KeyTemplate KeyTemplateBuilder::build(const types::KeyAlgorithm& algorithm,
                                               const bool extractable,
                                               const std::vector<std::string>& usages) const {
    session::KeyTemplate t;
    t.token = policy_.token;
    t.sensitive = policy_.sensitive;
    t.objectClass = session::ObjectClass::SecretKey;
    t.keyType = session::KeyType::Aes;
    t.label = "AES-" + std::to_string(algorithm.length);
    t.id = ids_.generate();
    t.extractable = extractable;
    t.derive = false;
    t.sign = hasUsage(usages, "sign");
    t.verify = hasUsage(usages, "verify");
    t.encrypt = hasUsage(usages, "encrypt");
    t.decrypt = hasUsage(usages, "decrypt");
    t.wrap = hasUsage(usages, "wrapKey");
    t.unwrap = hasUsage(usages, "unwrapKey");
    return t;
}

}
