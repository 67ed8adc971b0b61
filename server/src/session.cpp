#include "mediadrop/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include <unistd.h>

#include "mediadrop/encoding/base64.hpp"
#include "mediadrop/server/direct_upload.hpp"
#include "mediadrop/server/ingest_error.hpp"

#include <spdlog/spdlog.h>

namespace mediadrop::server
{

    namespace
    {

        std::vector<std::byte> decode_part_data(const mediadrop::protocol::SubmissionPart &part)
        {
            auto bytes = mediadrop::encoding::decode_base64(part.data_base64);
            if (!bytes)
            {
                throw IngestError(mediadrop::ErrorCode::InvalidRequest,
                                  "Part '" + part.name + "' does not carry valid base64 data");
            }
            return std::move(*bytes);
        }

        nlohmann::json diagnostics(const IngestError &error)
        {
            nlohmann::json payload = nlohmann::json::object();
            if (!error.defective_indices().empty())
            {
                payload["missing"] = error.defective_indices();
            }
            if (error.retryable())
            {
                payload["retryable"] = true;
            }
            return payload;
        }

        mediadrop::protocol::FinalizeResponse to_response(const StoreOutcome &outcome)
        {
            return mediadrop::protocol::FinalizeResponse{
                .success = true,
                .deduped = outcome.deduped,
                .saved_as = outcome.saved_name,
                .content_hash = outcome.content_hash,
            };
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::size_t payload_size = 0;
                             try
                             {
                                 payload_size = mediadrop::protocol::frame_payload_size(
                                     header_buffer_, services_.config.max_frame_bytes);
                             }
                             catch (const mediadrop::protocol::FrameTooLarge &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(mediadrop::ErrorCode::InvalidRequest, ex.what());
                             }
                             buffer_.clear();
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        mediadrop::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<mediadrop::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            const bool unknown_command = json.is_object() && json.contains("cmd") && json["cmd"].is_string() &&
                                         !mediadrop::protocol::command_from_string(json["cmd"].get<std::string>());
            send_error(unknown_command ? mediadrop::ErrorCode::InvalidCommand : mediadrop::ErrorCode::InvalidRequest,
                       ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), mediadrop::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case mediadrop::protocol::Command::AuthCheck:
            handle_auth_check(envelope);
            break;
        case mediadrop::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case mediadrop::protocol::Command::UploadStatus:
            handle_upload_status(envelope);
            break;
        case mediadrop::protocol::Command::UploadFinalize:
            handle_upload_finalize(envelope);
            break;
        case mediadrop::protocol::Command::UploadDirect:
            handle_upload_direct(envelope);
            break;
        case mediadrop::protocol::Command::Health:
            handle_health(envelope);
            break;
        case mediadrop::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(mediadrop::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const mediadrop::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(mediadrop::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to send response to {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Session::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        mediadrop::protocol::ResponseEnvelope envelope;
        envelope.kind = mediadrop::protocol::ResponseKind::Ok;
        envelope.error = mediadrop::ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Session::send_error(mediadrop::ErrorCode code, std::string message, std::optional<std::string> request_id,
                             nlohmann::json payload)
    {
        mediadrop::protocol::ResponseEnvelope envelope;
        envelope.kind = mediadrop::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = std::move(payload);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::guarded(const mediadrop::protocol::RequestEnvelope &envelope, const std::function<void()> &body)
    {
        try
        {
            body();
        }
        catch (const IngestError &error)
        {
            spdlog::info("{} {} rejected ({}): {}", remote_endpoint(), mediadrop::protocol::to_string(envelope.command),
                         mediadrop::to_string(error.code()), error.what());
            send_error(error.code(), error.what(), envelope.request_id, diagnostics(error));
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(mediadrop::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
        }
        catch (const mediadrop::protocol::PayloadError &ex)
        {
            send_error(mediadrop::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", remote_endpoint(), mediadrop::protocol::to_string(envelope.command),
                          ex.what());
            send_error(mediadrop::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_auth_check(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
            const auto request = envelope.payload.get<mediadrop::protocol::AuthCheckRequest>();
            const auto owner = services_.owners.find_owner(request.owner_token);
            const mediadrop::protocol::AuthCheckResponse response{.valid = owner.has_value(), .owner_name = owner};
            send_ok(response, envelope.request_id); });
    }

    void Session::handle_upload_chunk(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
            const auto request = envelope.payload.get<mediadrop::protocol::MultipartRequest>();
            auto submission = services_.ingest.begin_chunk();
            for (const auto &part : request.parts)
            {
                if (part.kind == mediadrop::protocol::PartKind::Field)
                {
                    submission.add_field(part.name, part.value);
                }
                else if (part.name == "chunk")
                {
                    const auto bytes = decode_part_data(part);
                    submission.add_payload(bytes);
                }
                else
                {
                    spdlog::debug("{} chunk submission: ignoring file part {}", remote_endpoint(), part.name);
                }
            }

            const auto outcome = services_.ingest.accept_chunk(submission);
            const mediadrop::protocol::ChunkAck ack{
                .ok = true,
                .index = outcome.receipt.index,
                .received = outcome.receipt.received_count,
                .total = outcome.receipt.total_chunks,
                .complete = outcome.receipt.complete,
            };
            nlohmann::json payload = ack;
            if (outcome.finalized)
            {
                payload["finalized"] = to_response(*outcome.finalized);
            }
            if (outcome.finalize_error)
            {
                auto error = diagnostics(*outcome.finalize_error);
                error["error"] = mediadrop::to_int(outcome.finalize_error->code());
                error["message"] = outcome.finalize_error->what();
                payload["finalize_error"] = std::move(error);
            }
            send_ok(std::move(payload), envelope.request_id); });
    }

    void Session::handle_upload_status(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
            const auto request = envelope.payload.get<mediadrop::protocol::UploadStatusRequest>();
            const mediadrop::protocol::UploadStatusResponse response{
                .received = services_.ingest.upload_status(request.upload_id),
            };
            send_ok(response, envelope.request_id); });
    }

    void Session::handle_upload_finalize(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
            // The manifest may come as an object or as a JSON-encoded string form field.
            nlohmann::json raw = envelope.payload.contains("manifest") ? envelope.payload.at("manifest") : envelope.payload;
            if (raw.is_string())
            {
                raw = nlohmann::json::parse(raw.get<std::string>());
            }
            const auto manifest = raw.get<mediadrop::protocol::FinalizeManifest>();
            const auto outcome = services_.ingest.finalize(FinalizeRequest{
                .upload_id = manifest.upload_id,
                .total_chunks = manifest.total_chunks,
                .filename = manifest.filename,
                .owner_token = manifest.owner_token,
                .is_video = manifest.is_video,
            });
            send_ok(to_response(outcome), envelope.request_id); });
    }

    void Session::handle_upload_direct(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        guarded(envelope, [&]
                {
            const auto request = envelope.payload.get<mediadrop::protocol::MultipartRequest>();
            auto upload = services_.ingest.begin_direct();
            for (const auto &part : request.parts)
            {
                if (part.kind == mediadrop::protocol::PartKind::Field)
                {
                    upload.add_field(part.name, part.value);
                }
                else
                {
                    const auto bytes = decode_part_data(part);
                    upload.add_file(part.filename.empty() ? part.name : part.filename, part.content_type, bytes);
                }
            }
            auto result = upload.commit();
            const mediadrop::protocol::DirectUploadResponse response{
                .success = true,
                .files = std::move(result.files),
                .deduped = std::move(result.deduped),
            };
            send_ok(response, envelope.request_id); });
    }

    void Session::handle_health(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        const mediadrop::protocol::HealthResponse response{
            .ok = true,
            .address = services_.config.address,
            .port = services_.bound_port,
            .pid = static_cast<std::int64_t>(::getpid()),
            .owners = services_.owners.size(),
        };
        send_ok(response, envelope.request_id);
    }

    void Session::handle_ping(const mediadrop::protocol::RequestEnvelope &envelope)
    {
        send_ok(nlohmann::json{{"pong", true}}, envelope.request_id);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace mediadrop::server
