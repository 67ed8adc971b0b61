#include "mediadrop/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace mediadrop::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            std::string result(data.size() * 2 + 1, '\0');
            sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
            result.resize(data.size() * 2);
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    ContentHasher::ContentHasher()
    {
        ensure_sodium_init();
        if (crypto_hash_sha256_init(&state_) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    void ContentHasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher updated after finish");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_hash_sha256_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
        bytes_hashed_ += data.size();
    }

    std::string ContentHasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher finished twice");
        }
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256_final(&state_, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ContentHasher hasher;
        hasher.update(data);
        return hasher.finish();
    }

    std::string random_hex(std::size_t bytes)
    {
        ensure_sodium_init();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

} // namespace mediadrop::crypto
