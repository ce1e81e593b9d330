#include "crypto/util/encoding.hpp"

#include <sodium.h>
#include <stdexcept>
#include <cstring>

namespace kb::crypto::util {

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::string b64url_encode(const std::vector<uint8_t>& data) {
    ensure_sodium_init();
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), variant);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      variant);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64url_decode(const std::string_view b64) {
    ensure_sodium_init();
    std::string_view body = b64;
    while (!body.empty() && body.back() == '=') body.remove_suffix(1);

    std::vector<uint8_t> decoded(body.size() * 3 / 4 + 1);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          body.data(), body.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
        throw std::runtime_error("Invalid base64url input");

    decoded.resize(out_len);
    return decoded;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    ensure_sodium_init();
    std::string result(data.size() * 2 + 1, '\0');
    sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
    result.resize(data.size() * 2);
    return result;
}

std::vector<uint8_t> hex_decode(const std::string_view hex) {
    ensure_sodium_init();
    std::vector<uint8_t> decoded(hex.size() / 2 + 1);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(decoded.data(), decoded.size(),
                       hex.data(), hex.size(),
                       nullptr, &out_len, &end) != 0 || end != hex.data() + hex.size())
        throw std::runtime_error("Invalid hex input");

    decoded.resize(out_len);
    return decoded;
}

void secure_wipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) sodium_memzero(buf.data(), buf.size());
    buf.clear();
}

}
