#pragma once

#include "session/Session.hpp"

#include <map>
#include <mutex>

namespace kb::session {

// In-process module backed by OpenSSL. Objects live as long as the session.
class SoftwareSession : public Session {
public:
    explicit SoftwareSession(const Version& interfaceVersion = {2, 40});
    ~SoftwareSession() override;

    SoftwareSession(const SoftwareSession&) = delete;
    SoftwareSession& operator=(const SoftwareSession&) = delete;

    KeyObject generateSecretKey(const Mechanism& mechanism, const KeyTemplate& tmpl) override;
    KeyObject createSecretKeyObject(const KeyTemplate& tmpl) override;
    [[nodiscard]] KeyAttributes readAttributes(KeyObject key) const override;

    std::vector<uint8_t> encrypt(const Mechanism& mechanism, KeyObject key,
                                 const std::vector<uint8_t>& input, std::size_t outputSize) override;
    std::vector<uint8_t> decrypt(const Mechanism& mechanism, KeyObject key,
                                 const std::vector<uint8_t>& input, std::size_t outputSize) override;

    [[nodiscard]] Version interfaceVersion() const override { return version_; }
    std::vector<uint8_t> generateRandom(std::size_t n) override;

    void destroyObject(KeyObject key);
    [[nodiscard]] std::size_t objectCount() const;

private:
    struct StoredKey {
        KeyTemplate attributes;   // value stripped
        std::vector<uint8_t> value;
    };

    Version version_;
    mutable std::mutex mutex_;
    std::map<KeyObject, StoredKey> objects_;
    KeyObject nextHandle_ = 1;

    KeyObject store(const KeyTemplate& tmpl, std::vector<uint8_t> value);
    [[nodiscard]] const StoredKey& lookup(KeyObject key) const;

    std::vector<uint8_t> cipher(const Mechanism& mechanism, KeyObject key,
                                const std::vector<uint8_t>& input, std::size_t outputSize, bool encrypt);
};

}
