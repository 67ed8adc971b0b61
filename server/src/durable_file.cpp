#include "durable_file.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server::durable_file
{

    namespace
    {
        constexpr int kRenameAttempts = 3;
        constexpr auto kRetryDelay = std::chrono::milliseconds(20);
        constexpr std::string_view kStagingMarker = ".tmp.";

        [[noreturn]] void throw_storage_error(const std::string &what, const std::filesystem::path &path, int error)
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              what + " " + path.string() + ": " + std::strerror(error));
        }

        void write_all(int fd, const std::string &text, const std::filesystem::path &path)
        {
            std::size_t written_total = 0;
            while (written_total < text.size())
            {
                const ssize_t written = ::write(fd, text.data() + written_total, text.size() - written_total);
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    throw_storage_error("write failed for", path, errno);
                }
                written_total += static_cast<std::size_t>(written);
            }
        }

    } // namespace

    void write_json_atomic(const std::filesystem::path &target, const nlohmann::json &document)
    {
        auto staging = target;
        staging += std::string(kStagingMarker) + crypto::random_hex(6);
        const auto text = document.dump(2);

        const int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            throw_storage_error("open failed for", staging, errno);
        }
        try
        {
            write_all(fd, text, staging);
            if (::fsync(fd) != 0)
            {
                throw_storage_error("fsync failed for", staging, errno);
            }
        }
        catch (...)
        {
            ::close(fd);
            ::unlink(staging.c_str());
            throw;
        }
        if (::close(fd) != 0)
        {
            const int error = errno;
            ::unlink(staging.c_str());
            throw_storage_error("close failed for", staging, error);
        }

        try
        {
            rename_with_retry(staging, target);
        }
        catch (...)
        {
            ::unlink(staging.c_str());
            throw;
        }
    }

    std::optional<nlohmann::json> read_json(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        return nlohmann::json::parse(in);
    }

    void rename_with_retry(const std::filesystem::path &from, const std::filesystem::path &to)
    {
        std::error_code ec;
        for (int attempt = 1; attempt <= kRenameAttempts; ++attempt)
        {
            std::filesystem::rename(from, to, ec);
            if (!ec)
            {
                return;
            }
            spdlog::warn("rename {} -> {} failed (attempt {}/{}): {}", from.string(), to.string(), attempt,
                         kRenameAttempts, ec.message());
            if (ec == std::errc::no_such_file_or_directory)
            {
                break;
            }
            std::this_thread::sleep_for(kRetryDelay);
        }
        throw IngestError(mediadrop::ErrorCode::StorageIOError,
                          "rename " + from.string() + " -> " + to.string() + " failed: " + ec.message());
    }

    bool is_staging_name(const std::filesystem::path &path)
    {
        return path.filename().string().find(kStagingMarker) != std::string::npos;
    }

} // namespace mediadrop::server::durable_file
