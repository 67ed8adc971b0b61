/**
 * MediaDrop - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediadrop/error_codes.hpp"

namespace mediadrop::protocol
{

    // A payload that is well-formed JSON but carries a value the schema rejects.
    class PayloadError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class Command : std::uint8_t
    {
        AuthCheck,
        UploadChunk,
        UploadStatus,
        UploadFinalize,
        UploadDirect,
        Health,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // One part of a multipart-style submission. Parts are applied in order, so
    // a file part may arrive before the fields that describe it.
    enum class PartKind : std::uint8_t
    {
        Field,
        File
    };

    struct SubmissionPart
    {
        PartKind kind{PartKind::Field};
        std::string name;
        std::string value;
        std::string filename;
        std::string content_type;
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const SubmissionPart &part);
    void from_json(const nlohmann::json &json, SubmissionPart &part);

    struct MultipartRequest
    {
        std::vector<SubmissionPart> parts;
    };

    void to_json(nlohmann::json &json, const MultipartRequest &request);
    void from_json(const nlohmann::json &json, MultipartRequest &request);

    struct AuthCheckRequest
    {
        std::string owner_token;
    };

    void to_json(nlohmann::json &json, const AuthCheckRequest &request);
    void from_json(const nlohmann::json &json, AuthCheckRequest &request);

    struct AuthCheckResponse
    {
        bool valid{};
        std::optional<std::string> owner_name{};
    };

    void to_json(nlohmann::json &json, const AuthCheckResponse &response);
    void from_json(const nlohmann::json &json, AuthCheckResponse &response);

    struct UploadStatusRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadStatusRequest &request);
    void from_json(const nlohmann::json &json, UploadStatusRequest &request);

    struct UploadStatusResponse
    {
        std::vector<std::uint32_t> received;
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct ChunkAck
    {
        bool ok{};
        std::uint32_t index{};
        std::uint64_t received{};
        std::uint32_t total{};
        bool complete{};
    };

    void to_json(nlohmann::json &json, const ChunkAck &ack);
    void from_json(const nlohmann::json &json, ChunkAck &ack);

    struct FinalizeManifest
    {
        std::string upload_id;
        std::uint32_t total_chunks{};
        std::string filename;
        std::string owner_token;
        bool is_video{};
    };

    void to_json(nlohmann::json &json, const FinalizeManifest &manifest);
    void from_json(const nlohmann::json &json, FinalizeManifest &manifest);

    struct FinalizeResponse
    {
        bool success{};
        bool deduped{};
        std::string saved_as;
        std::string content_hash;
    };

    // A deduped response names the stored file as "existing" instead of "saved_as".
    void to_json(nlohmann::json &json, const FinalizeResponse &response);
    void from_json(const nlohmann::json &json, FinalizeResponse &response);

    struct DirectUploadResponse
    {
        bool success{};
        std::vector<std::string> files;
        std::vector<std::string> deduped;
    };

    void to_json(nlohmann::json &json, const DirectUploadResponse &response);
    void from_json(const nlohmann::json &json, DirectUploadResponse &response);

    struct HealthResponse
    {
        bool ok{};
        std::string address;
        std::uint16_t port{};
        std::int64_t pid{};
        std::uint64_t owners{};
    };

    void to_json(nlohmann::json &json, const HealthResponse &response);
    void from_json(const nlohmann::json &json, HealthResponse &response);

} // namespace mediadrop::protocol
