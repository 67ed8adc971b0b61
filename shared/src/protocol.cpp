#include "mediadrop/protocol.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace mediadrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::AuthCheck, "AUTH_CHECK"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadFinalize, "UPLOAD_FINALIZE"},
            {Command::UploadDirect, "UPLOAD_DIRECT"},
            {Command::Health, "HEALTH"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const SubmissionPart &part)
    {
        if (part.kind == PartKind::Field)
        {
            json = {
                {"type", "field"},
                {"name", part.name},
                {"value", part.value},
            };
            return;
        }
        json = {
            {"type", "file"},
            {"name", part.name},
            {"filename", part.filename},
            {"content_type", part.content_type},
            {"data", part.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, SubmissionPart &part)
    {
        const auto type = json.at("type").get<std::string>();
        if (type == "field")
        {
            part.kind = PartKind::Field;
            part.value = json.value("value", std::string{});
        }
        else if (type == "file")
        {
            part.kind = PartKind::File;
            part.filename = json.value("filename", std::string{});
            part.content_type = json.value("content_type", std::string{});
            part.data_base64 = json.value("data", std::string{});
        }
        else
        {
            throw PayloadError("Unknown part type: " + type);
        }
        part.name = json.value("name", std::string{});
    }

    void to_json(nlohmann::json &json, const MultipartRequest &request)
    {
        json = {{"parts", request.parts}};
    }

    void from_json(const nlohmann::json &json, MultipartRequest &request)
    {
        request.parts = json.at("parts").get<std::vector<SubmissionPart>>();
    }

    void to_json(nlohmann::json &json, const AuthCheckRequest &request)
    {
        json = {{"owner_token", request.owner_token}};
    }

    void from_json(const nlohmann::json &json, AuthCheckRequest &request)
    {
        request.owner_token = json.value("owner_token", std::string{});
    }

    void to_json(nlohmann::json &json, const AuthCheckResponse &response)
    {
        json = {{"valid", response.valid}};
        if (response.owner_name)
        {
            json["owner_name"] = *response.owner_name;
        }
    }

    void from_json(const nlohmann::json &json, AuthCheckResponse &response)
    {
        response.valid = json.value("valid", false);
        if (auto it = json.find("owner_name"); it != json.end())
        {
            response.owner_name = it->get<std::string>();
        }
        else
        {
            response.owner_name.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadStatusRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadStatusRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {{"received", response.received}};
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.received = json.value("received", std::vector<std::uint32_t>{});
    }

    void to_json(nlohmann::json &json, const ChunkAck &ack)
    {
        json = {
            {"ok", ack.ok},
            {"index", ack.index},
            {"received", ack.received},
            {"total", ack.total},
            {"complete", ack.complete},
        };
    }

    void from_json(const nlohmann::json &json, ChunkAck &ack)
    {
        ack.ok = json.value("ok", false);
        ack.index = json.value("index", 0u);
        ack.received = json.value("received", 0ULL);
        ack.total = json.value("total", 0u);
        ack.complete = json.value("complete", false);
    }

    void to_json(nlohmann::json &json, const FinalizeManifest &manifest)
    {
        json = {
            {"upload_id", manifest.upload_id},
            {"total_chunks", manifest.total_chunks},
            {"filename", manifest.filename},
            {"owner_token", manifest.owner_token},
            {"is_video", manifest.is_video},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeManifest &manifest)
    {
        manifest.upload_id = json.at("upload_id").get<std::string>();
        const auto &total = json.at("total_chunks");
        if (!total.is_number_integer())
        {
            throw PayloadError("total_chunks must be an integer");
        }
        const auto value = total.get<std::int64_t>();
        if (value < 0 || value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        {
            throw PayloadError("total_chunks out of range: " + std::to_string(value));
        }
        manifest.total_chunks = static_cast<std::uint32_t>(value);
        manifest.filename = json.at("filename").get<std::string>();
        manifest.owner_token = json.at("owner_token").get<std::string>();
        manifest.is_video = json.value("is_video", false);
    }

    void to_json(nlohmann::json &json, const FinalizeResponse &response)
    {
        json = {
            {"success", response.success},
            {"content_hash", response.content_hash},
        };
        if (response.deduped)
        {
            json["deduped"] = true;
            json["existing"] = response.saved_as;
        }
        else
        {
            json["saved_as"] = response.saved_as;
        }
    }

    void from_json(const nlohmann::json &json, FinalizeResponse &response)
    {
        response.success = json.value("success", false);
        response.deduped = json.value("deduped", false);
        response.content_hash = json.value("content_hash", std::string{});
        response.saved_as = response.deduped ? json.value("existing", std::string{})
                                             : json.value("saved_as", std::string{});
    }

    void to_json(nlohmann::json &json, const DirectUploadResponse &response)
    {
        json = {
            {"success", response.success},
            {"files", response.files},
            {"deduped", response.deduped},
        };
    }

    void from_json(const nlohmann::json &json, DirectUploadResponse &response)
    {
        response.success = json.value("success", false);
        response.files = json.value("files", std::vector<std::string>{});
        response.deduped = json.value("deduped", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const HealthResponse &response)
    {
        json = {
            {"ok", response.ok},
            {"address", response.address},
            {"port", response.port},
            {"pid", response.pid},
            {"owners", response.owners},
        };
    }

    void from_json(const nlohmann::json &json, HealthResponse &response)
    {
        response.ok = json.value("ok", false);
        response.address = json.value("address", std::string{});
        response.port = json.value("port", static_cast<std::uint16_t>(0));
        response.pid = json.value("pid", static_cast<std::int64_t>(0));
        response.owners = json.value("owners", 0ULL);
    }

} // namespace mediadrop::protocol
