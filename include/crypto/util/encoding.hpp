#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kb::crypto::util {

// libsodium must be initialized before any of the helpers below; safe to call repeatedly.
void ensure_sodium_init();

// RFC 4648 base64url without padding, as used by the JWK "k" member.
std::string b64url_encode(const std::vector<uint8_t>& data);

// Accepts input with or without trailing '=' padding.
std::vector<uint8_t> b64url_decode(std::string_view b64);

std::string hex_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> hex_decode(std::string_view hex);

// Overwrites the buffer before releasing it.
void secure_wipe(std::vector<uint8_t>& buf);

}
