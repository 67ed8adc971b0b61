#include "mediadrop/framing.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace mediadrop::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t, kFrameHeaderSize> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, kFrameHeaderSize> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    FrameTooLarge::FrameTooLarge(std::size_t size, std::size_t limit)
        : std::length_error("Frame of " + std::to_string(size) + " bytes exceeds limit of " +
                            std::to_string(limit)),
          size_(size)
    {
    }

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw FrameTooLarge(text.size(), std::numeric_limits<std::uint32_t>::max());
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::size_t frame_payload_size(const std::array<std::uint8_t, kFrameHeaderSize> &header, std::size_t max_payload)
    {
        const auto size = static_cast<std::size_t>(read_u32_be(header));
        if (size > max_payload)
        {
            throw FrameTooLarge(size, max_payload);
        }
        return size;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(buffer.begin(), kFrameHeaderSize, header.begin());
        const auto payload_size = frame_payload_size(header, max_payload);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        const std::string payload(payload_begin, payload_begin + static_cast<std::ptrdiff_t>(payload_size));
        return DecodedFrame{
            .message = nlohmann::json::parse(payload),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace mediadrop::protocol
