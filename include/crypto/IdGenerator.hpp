#pragma once

#include "crypto/util/encoding.hpp"
#include "session/Session.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace kb::crypto {

struct IdOptions {
    // Random bytes drawn from the session per id. The id itself is their
    // lowercase hex encoding, so it is twice as long.
    size_t random_bytes = 10;
};

// Session-scoped CKA_ID source.
class IdGenerator {
public:
    explicit IdGenerator(session::Session& session, const IdOptions& opt = {})
        : session_(session), options_(opt) {
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
    }

    [[nodiscard]] std::vector<uint8_t> generate() const {
        const auto hex = util::hex_encode(session_.generateRandom(options_.random_bytes));
        return {hex.begin(), hex.end()};
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    session::Session& session_;
    IdOptions options_;
};

}
