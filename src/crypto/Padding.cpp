#include "crypto/Padding.hpp"

#include <algorithm>
#include <stdexcept>

namespace kb::crypto::padding {

std::vector<uint8_t> pad(const std::vector<uint8_t>& data, const size_t blockSize) {
    if (blockSize == 0 || blockSize > 255) throw std::invalid_argument("Invalid padding block size");

    const size_t mod = blockSize - (data.size() % blockSize);
    std::vector<uint8_t> out;
    out.reserve(data.size() + mod);
    out.insert(out.end(), data.begin(), data.end());
    out.insert(out.end(), mod, static_cast<uint8_t>(mod));
    return out;
}

std::vector<uint8_t> unpad(const std::vector<uint8_t>& decrypted) {
    if (decrypted.empty()) return {};

    const auto size = static_cast<std::ptrdiff_t>(decrypted.size());
    const auto paddingLength = static_cast<std::ptrdiff_t>(decrypted.back());

    // An overlong count wraps around from the end once, then clamps at zero.
    auto keep = size - paddingLength;
    if (keep < 0) keep = std::max<std::ptrdiff_t>(0, size + keep);
    return {decrypted.begin(), decrypted.begin() + keep};
}

size_t outputBufferSize(const unsigned int keyBits, const bool encrypt, const size_t dataSize) {
    if (!encrypt) return dataSize;

    const size_t len = keyBits >> 3;
    if (len == 0) throw std::invalid_argument("Key length must be at least 8 bits");
    return (dataSize + len - 1) / len * len + len;
}

}
