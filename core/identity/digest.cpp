#include "identity/digest.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace kchoice {

Digest::Sha256 Digest::sha256(const std::string& data) {
    Sha256 out{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &length,
                   EVP_sha256(), nullptr) != 1 ||
        length != out.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

uint64_t Digest::truncate64(const Sha256& digest) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; i++) {
        value = (value << 8) | digest[i];
    }
    return value;
}

uint64_t Digest::fingerprint(const std::string& data) {
    return truncate64(sha256(data));
}

} // namespace kchoice
