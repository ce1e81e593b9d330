#pragma once

#include "session/KeyTemplate.hpp"
#include "session/Session.hpp"
#include "types/Algorithm.hpp"

#include <string>
#include <vector>

namespace kb::crypto {

// Reference to a secret key living in a session. Does not own the session or
// the object; the session's own lifecycle destroys it.
struct KeyHandle {
    session::KeyObject object{};
    types::KeyAlgorithm algorithm;
    bool extractable = false;
    std::vector<std::string> usages;
    session::KeyTemplate attributes;   // as created, value stripped
};

}
