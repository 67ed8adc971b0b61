#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server
{

    IngestError::IngestError(mediadrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    IngestError::IngestError(mediadrop::ErrorCode code, std::string message,
                             std::vector<std::uint32_t> defective_indices)
        : std::runtime_error(std::move(message)), code_(code), defective_indices_(std::move(defective_indices)) {}

} // namespace mediadrop::server
