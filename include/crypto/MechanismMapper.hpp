#pragma once

#include "session/Mechanism.hpp"
#include "session/Session.hpp"
#include "types/Algorithm.hpp"

#include <functional>

namespace kb::crypto {

using MechanismMapperFn = std::function<session::Mechanism(const types::AlgorithmDescriptor&,
                                                           const session::Version&)>;

struct ModeTraits {
    MechanismMapperFn toMechanism;
    // True when this core pads on the module's behalf.
    bool padding = false;
};

namespace mapper {

session::Mechanism gcm(const types::AlgorithmDescriptor& descriptor, const session::Version& version);
session::Mechanism cbc(const types::AlgorithmDescriptor& descriptor, const session::Version& version);
session::Mechanism ecb(const types::AlgorithmDescriptor& descriptor, const session::Version& version);

}

// Registered traits for a mode. Throws CryptoError(NotSupported) when the mode
// has no mapper.
[[nodiscard]] const ModeTraits& traitsFor(types::AesMode mode);

[[nodiscard]] bool hasMapper(types::AesMode mode);

[[nodiscard]] session::Mechanism toMechanism(const types::AlgorithmDescriptor& descriptor,
                                             const session::Version& version);

}
