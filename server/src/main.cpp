#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mediadrop/server/server.hpp"
#include "mediadrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "MediaDrop server " << mediadrop::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--credentials <CSV>]\n"
                     "       [--log <FILE>] [--lock-ttl <seconds>] [--temp-ttl <seconds>]\n"
                     "       [--janitor-interval <seconds>] [--owner-reload <seconds>] [--max-frame <bytes>]\n"
                     "       [--auto-assemble] [--verbose]\n"
                     "Environment: HOST, PORT, LOCK_TTL_MS, TMP_TTL_MS, RES_LOG=1\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::string> read_env(const char *name)
    {
        const char *value = std::getenv(name);
        if (value == nullptr || *value == '\0')
        {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::chrono::seconds parse_seconds(const std::string &value)
    {
        return std::chrono::seconds(std::stoll(value));
    }

    // Values such as LOCK_TTL_MS are given in milliseconds; anything under a second rounds up.
    std::chrono::seconds from_milliseconds(const std::string &value)
    {
        return std::chrono::ceil<std::chrono::seconds>(std::chrono::milliseconds(std::stoll(value)));
    }

    void apply_environment(mediadrop::server::ServerConfig &config, bool &verbose)
    {
        if (auto host = read_env("HOST"))
        {
            config.address = *host;
        }
        if (auto port = read_env("PORT"))
        {
            config.port = static_cast<std::uint16_t>(std::stoi(*port));
        }
        if (auto lock_ttl = read_env("LOCK_TTL_MS"))
        {
            config.lock_ttl = from_milliseconds(*lock_ttl);
        }
        if (auto temp_ttl = read_env("TMP_TTL_MS"))
        {
            config.temp_ttl = from_milliseconds(*temp_ttl);
        }
        if (auto res_log = read_env("RES_LOG"))
        {
            verbose = *res_log == "1";
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    using mediadrop::server::Server;
    using mediadrop::server::ServerConfig;

    static const std::set<std::string> kValueOptions = {
        "--port", "--root", "--address", "--threads", "--credentials", "--log", "--lock-ttl",
        "--temp-ttl", "--janitor-interval", "--owner-reload", "--max-frame"};

    ServerConfig config;
    bool verbose = false;

    try
    {
        apply_environment(config, verbose);

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--auto-assemble")
            {
                config.auto_assemble = true;
                continue;
            }
            if (arg == "--verbose")
            {
                verbose = true;
                continue;
            }
            if (!kValueOptions.contains(arg))
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--credentials")
            {
                config.credentials_file = std::filesystem::path(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--lock-ttl")
            {
                config.lock_ttl = parse_seconds(*value);
            }
            else if (arg == "--temp-ttl")
            {
                config.temp_ttl = parse_seconds(*value);
            }
            else if (arg == "--janitor-interval")
            {
                config.janitor_interval = parse_seconds(*value);
            }
            else if (arg == "--owner-reload")
            {
                config.owner_reload_interval = parse_seconds(*value);
            }
            else if (arg == "--max-frame")
            {
                config.max_frame_bytes = static_cast<std::size_t>(std::stoull(*value));
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid option value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.janitor_interval.count() <= 0 || config.owner_reload_interval.count() <= 0)
    {
        std::cerr << "--janitor-interval and --owner-reload must be positive" << std::endl;
        return EXIT_FAILURE;
    }
    config.verbose = verbose;

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting MediaDrop server {} on {}:{}", mediadrop::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
