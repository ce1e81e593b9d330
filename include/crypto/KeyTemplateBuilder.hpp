#pragma once

#include "crypto/IdGenerator.hpp"
#include "session/KeyTemplate.hpp"
#include "types/Algorithm.hpp"

#include <string>
#include <vector>

namespace kb::crypto {

// Module-level persistence and sensitivity for every key this process creates.
struct KeyPolicy {
    bool token = false;
    bool sensitive = false;
};

class KeyTemplateBuilder {
public:
    KeyTemplateBuilder(const IdGenerator& ids, const KeyPolicy& policy);

    [[nodiscard]] session::KeyTemplate build(const types::KeyAlgorithm& algorithm,
                                             bool extractable,
                                             const std::vector<std::string>& usages) const;

    [[nodiscard]] const KeyPolicy& policy() const { return policy_; }

private:
    const IdGenerator& ids_;
    KeyPolicy policy_;
};

}
