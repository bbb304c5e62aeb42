#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace kchoice {

// ─── Digest ────────────────────────────────────────────────────
// Cryptographic digests for identities that must be reproducible
// across runs and processes (saved distributions are compared by
// these, never by runtime-local hashes or addresses).

class Digest {
public:
    using Sha256 = std::array<uint8_t, 32>;

    /// SHA-256 of the given bytes.
    static Sha256 sha256(const std::string& data);

    /// First 8 bytes of a digest, big-endian.
    static uint64_t truncate64(const Sha256& digest);

    /// truncate64(sha256(data)).
    static uint64_t fingerprint(const std::string& data);
};

} // namespace kchoice
