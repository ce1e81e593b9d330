#include "crypto/AsyncCipherService.hpp"

#include <stdexcept>

using namespace kb::concurrency;
using namespace kb::types;

namespace kb::crypto {

AsyncCipherService::AsyncCipherService(std::shared_ptr<const AesCipherProvider> provider, const unsigned int nThreads)
    : provider_(std::move(provider)), pool_(std::make_unique<ThreadPool>(nThreads)) {
    if (!provider_) throw std::invalid_argument("AsyncCipherService requires a provider");
}

AsyncCipherService::~AsyncCipherService() { shutdown(); }

void AsyncCipherService::shutdown() {
    if (pool_) pool_->stop();
}

template <typename T>
std::future<T> AsyncCipherService::enqueue(std::function<T()> fn) {
    auto task = std::make_shared<PromisedTask<T>>(std::move(fn));
    auto future = task->getFuture();
    pool_->submit(task);
    return future;
}

std::future<KeyHandle> AsyncCipherService::generateKey(KeyAlgorithm algorithm, const bool extractable,
                                                       std::vector<std::string> usages) {
    return enqueue<KeyHandle>([p = provider_, algorithm = std::move(algorithm), extractable,
                               usages = std::move(usages)] {
        return p->generateKey(algorithm, extractable, usages);
    });
}

std::future<ExportedKey> AsyncCipherService::exportKey(std::string format, KeyHandle key) {
    return enqueue<ExportedKey>([p = provider_, format = std::move(format), key = std::move(key)] {
        return p->exportKey(format, key);
    });
}

std::future<KeyHandle> AsyncCipherService::importKey(std::string format, KeyData keyData, std::string algorithmName,
                                                     const bool extractable, std::vector<std::string> usages) {
    return enqueue<KeyHandle>([p = provider_, format = std::move(format), keyData = std::move(keyData),
                               algorithmName = std::move(algorithmName), extractable,
                               usages = std::move(usages)] {
        return p->importKey(format, keyData, algorithmName, extractable, usages);
    });
}

std::future<std::vector<uint8_t>> AsyncCipherService::encrypt(AlgorithmDescriptor algorithm, KeyHandle key,
                                                              std::vector<uint8_t> data) {
    return enqueue<std::vector<uint8_t>>([p = provider_, algorithm = std::move(algorithm), key = std::move(key),
                                          data = std::move(data)] {
        return p->encrypt(algorithm, key, data);
    });
}

std::future<std::vector<uint8_t>> AsyncCipherService::decrypt(AlgorithmDescriptor algorithm, KeyHandle key,
                                                              std::vector<uint8_t> data) {
    return enqueue<std::vector<uint8_t>>([p = provider_, algorithm = std::move(algorithm), key = std::move(key),
                                          data = std::move(data)] {
        return p->decrypt(algorithm, key, data);
    });
}

}
