#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "mediadrop/error_codes.hpp"

namespace mediadrop::server
{

    class IngestError : public std::runtime_error
    {
    public:
        IngestError(mediadrop::ErrorCode code, std::string message);
        IngestError(mediadrop::ErrorCode code, std::string message, std::vector<std::uint32_t> defective_indices);

        mediadrop::ErrorCode code() const noexcept { return code_; }

        // Chunk indices the client has to resend; only set for IntegrityError.
        const std::vector<std::uint32_t> &defective_indices() const noexcept { return defective_indices_; }

        bool retryable() const noexcept { return mediadrop::is_retryable(code_); }

    private:
        mediadrop::ErrorCode code_;
        std::vector<std::uint32_t> defective_indices_;
    };

} // namespace mediadrop::server
