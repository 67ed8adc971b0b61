#include "mediadrop/encoding/base64.hpp"

#include <sodium.h>

#include "mediadrop/crypto.hpp"

namespace mediadrop::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
        constexpr const char *kIgnoredCharacters = " \t\r\n";
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        if (data.empty())
        {
            return {};
        }
        std::string output(sodium_base64_ENCODED_LEN(data.size(), kVariant), '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // sodium_base64_ENCODED_LEN counts the terminating NUL
        output.resize(output.size() - 1);
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output((input.size() / 4 + 1) * 3);
        if (input.empty())
        {
            return std::vector<std::byte>{};
        }
        std::size_t decoded_length = 0;
        const char *end = nullptr;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), kIgnoredCharacters, &decoded_length, &end, kVariant) != 0)
        {
            return std::nullopt;
        }
        if (end != input.data() + input.size())
        {
            return std::nullopt;
        }
        output.resize(decoded_length);
        return output;
    }

} // namespace mediadrop::encoding
