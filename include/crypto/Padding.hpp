#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kb::crypto::padding {

constexpr size_t AES_BLOCK_SIZE = 16;

// PKCS#7: always appends between 1 and blockSize bytes, a full block when the
// input is already aligned.
[[nodiscard]] std::vector<uint8_t> pad(const std::vector<uint8_t>& data, size_t blockSize = AES_BLOCK_SIZE);

// Drops as many trailing bytes as the last byte says. The padding bytes are
// not checked, so this must not be used where a padding oracle matters.
// A count p above the size keeps the first max(0, 2*size - p) bytes.
[[nodiscard]] std::vector<uint8_t> unpad(const std::vector<uint8_t>& decrypted);

// Upper bound handed to the module for a single-part operation. Encryption
// rounds up in units of the key byte length (not the block size) and adds one
// more unit; decryption uses the input size unchanged.
[[nodiscard]] size_t outputBufferSize(unsigned int keyBits, bool encrypt, size_t dataSize);

}
