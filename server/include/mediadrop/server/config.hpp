#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "mediadrop/framing.hpp"

namespace mediadrop::server
{

    struct ServerConfig
    {
        std::string address{"127.0.0.1"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> credentials_file;
        std::optional<std::filesystem::path> log_file;
        std::chrono::seconds lock_ttl{std::chrono::minutes{10}};
        std::chrono::seconds temp_ttl{std::chrono::hours{48}};
        std::chrono::seconds janitor_interval{std::chrono::hours{1}};
        std::chrono::seconds owner_reload_interval{std::chrono::seconds{2}};
        std::size_t max_frame_bytes{mediadrop::protocol::kDefaultMaxFrameBytes};
        bool auto_assemble{false};
        bool verbose{false};
    };

} // namespace mediadrop::server
