/**
 * MediaDrop - Error codes shared by the wire protocol and the ingestion core.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace mediadrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidRequest = 2,
        Unauthorized = 3,
        StorageIOError = 5,
        IntegrityError = 6,
        AllocationExhausted = 7,
        Unsupported = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Storage failures are worth retrying by the caller; everything else needs a different request.
    constexpr bool is_retryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::StorageIOError;
    }

} // namespace mediadrop
