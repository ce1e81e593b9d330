#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kb::session {

enum class ObjectClass : unsigned long { SecretKey = 0x00000004 };   // CKO_SECRET_KEY
enum class KeyType : unsigned long { Aes = 0x0000001F };             // CKK_AES

// Attribute set used once to create or generate a secret key object.
struct KeyTemplate {
    bool token = false;
    bool sensitive = false;
    ObjectClass objectClass = ObjectClass::SecretKey;
    KeyType keyType = KeyType::Aes;
    std::string label;
    std::vector<uint8_t> id;
    bool extractable = false;
    bool derive = false;
    bool sign = false;
    bool verify = false;
    bool encrypt = false;
    bool decrypt = false;
    bool wrap = false;
    bool unwrap = false;
    std::optional<unsigned long> valueLen;
    std::optional<std::vector<uint8_t>> value;
};

}
