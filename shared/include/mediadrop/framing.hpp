/**
 * MediaDrop - Length-prefixed JSON framing.
 *
 * Every frame is a 4-byte big-endian payload length followed by that many
 * bytes of UTF-8 JSON.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediadrop::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kDefaultMaxFrameBytes = 64u * 1024u * 1024u;

    class FrameTooLarge : public std::length_error
    {
    public:
        FrameTooLarge(std::size_t size, std::size_t limit);

        std::size_t size() const noexcept { return size_; }

    private:
        std::size_t size_;
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Payload length announced by a header; throws FrameTooLarge above max_payload.
    std::size_t frame_payload_size(const std::array<std::uint8_t, kFrameHeaderSize> &header,
                                   std::size_t max_payload = kDefaultMaxFrameBytes);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::size_t max_payload = kDefaultMaxFrameBytes);

} // namespace mediadrop::protocol
