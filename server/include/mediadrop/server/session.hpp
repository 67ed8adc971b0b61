#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mediadrop/error_codes.hpp"
#include "mediadrop/framing.hpp"
#include "mediadrop/protocol.hpp"
#include "mediadrop/server/config.hpp"
#include "mediadrop/server/ingest_service.hpp"
#include "mediadrop/server/owner_directory.hpp"

namespace mediadrop::server
{

    struct ServerServices
    {
        IngestService &ingest;
        const OwnerLookup &owners;
        const ServerConfig &config;
        std::uint16_t bound_port;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const mediadrop::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(mediadrop::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        nlohmann::json payload = nlohmann::json::object());

        // Runs a handler body and turns whatever it throws into an error response.
        void guarded(const mediadrop::protocol::RequestEnvelope &envelope, const std::function<void()> &body);

        // Command handlers
        void handle_auth_check(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_upload_status(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_upload_finalize(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_upload_direct(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_health(const mediadrop::protocol::RequestEnvelope &envelope);
        void handle_ping(const mediadrop::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, mediadrop::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool stopped_{false};
    };

} // namespace mediadrop::server
