/**
 * MediaDrop - Content hashing and random identifiers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include <sodium.h>

namespace mediadrop::crypto
{

    void ensure_sodium_init();

    /**
     * Incremental SHA-256. Bytes are fed as they stream past so a file never
     * has to be re-read to learn its hash.
     */
    class ContentHasher
    {
    public:
        ContentHasher();

        void update(std::span<const std::byte> data);

        // Lowercase hex digest. The hasher cannot be updated afterwards.
        std::string finish();

        std::uint64_t bytes_hashed() const noexcept { return bytes_hashed_; }

    private:
        crypto_hash_sha256_state state_{};
        std::uint64_t bytes_hashed_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string random_hex(std::size_t bytes);

} // namespace mediadrop::crypto
