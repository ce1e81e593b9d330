#pragma once

#include "concurrency/ThreadPool.hpp"
#include "crypto/AesCipherProvider.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace kb::crypto {

// Runs provider operations on a worker pool. Each call is one task whose
// future resolves exactly once, with the result or the provider's exception.
// There is no cancellation; a submitted call runs to completion.
class AsyncCipherService {
public:
    explicit AsyncCipherService(std::shared_ptr<const AesCipherProvider> provider, unsigned int nThreads = 0);
    ~AsyncCipherService();

    std::future<KeyHandle> generateKey(types::KeyAlgorithm algorithm, bool extractable,
                                       std::vector<std::string> usages);

    std::future<ExportedKey> exportKey(std::string format, KeyHandle key);

    std::future<KeyHandle> importKey(std::string format, KeyData keyData, std::string algorithmName,
                                     bool extractable, std::vector<std::string> usages);

    std::future<std::vector<uint8_t>> encrypt(types::AlgorithmDescriptor algorithm, KeyHandle key,
                                              std::vector<uint8_t> data);

    std::future<std::vector<uint8_t>> decrypt(types::AlgorithmDescriptor algorithm, KeyHandle key,
                                              std::vector<uint8_t> data);

    void shutdown();

private:
    std::shared_ptr<const AesCipherProvider> provider_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    template <typename T>
    std::future<T> enqueue(std::function<T()> fn);
};

}
