#include "mediadrop/server/serial_allocator.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "mediadrop/server/ingest_error.hpp"
#include "mediadrop/server/storage_layout.hpp"

namespace mediadrop::server
{

    namespace
    {
        constexpr int kSerialWidth = 4;
        constexpr int kMaxReclaimAttempts = 3;
        constexpr std::size_t kMaxSerialDigits = 9;

        std::string format_serial(std::uint32_t serial)
        {
            std::ostringstream oss;
            oss << std::setw(kSerialWidth) << std::setfill('0') << serial;
            return oss.str();
        }

        std::string owner_prefix(const std::string &owner, MediaKind kind)
        {
            return StorageLayout::sanitize_owner_name(owner) + "_" + std::string(serial_prefix(kind)) + "-";
        }

    } // namespace

    std::string_view serial_prefix(MediaKind kind) noexcept
    {
        return kind == MediaKind::Video ? "VID" : "IMG";
    }

    Reservation::Reservation(std::filesystem::path marker_path, std::filesystem::path final_path,
                             std::uint32_t serial)
        : marker_path_(std::move(marker_path)), final_path_(std::move(final_path)), serial_(serial)
    {
    }

    Reservation::~Reservation()
    {
        release();
    }

    Reservation::Reservation(Reservation &&other) noexcept
        : marker_path_(std::move(other.marker_path_)), final_path_(std::move(other.final_path_)),
          serial_(other.serial_)
    {
        other.marker_path_.clear();
    }

    Reservation &Reservation::operator=(Reservation &&other) noexcept
    {
        if (this != &other)
        {
            release();
            marker_path_ = std::move(other.marker_path_);
            final_path_ = std::move(other.final_path_);
            serial_ = other.serial_;
            other.marker_path_.clear();
        }
        return *this;
    }

    void Reservation::release() noexcept
    {
        if (marker_path_.empty())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(marker_path_, ec);
        if (ec)
        {
            // The janitor removes it once it is older than the lock TTL.
            spdlog::warn("Failed to release reservation {}: {}", marker_path_.string(), ec.message());
        }
        marker_path_.clear();
    }

    SerialAllocator::SerialAllocator(std::filesystem::path directory, AllocatorOptions options)
        : directory_(std::move(directory)), options_(options)
    {
        std::filesystem::create_directories(directory_);
    }

    std::string SerialAllocator::base_name(const std::string &owner, MediaKind kind, std::uint32_t serial)
    {
        return owner_prefix(owner, kind) + format_serial(serial);
    }

    Reservation SerialAllocator::reserve(const std::string &owner, MediaKind kind, const std::string &extension)
    {
        const auto used = used_serials(owner, kind);
        for (std::uint32_t candidate = 0; candidate < options_.max_probes; ++candidate)
        {
            const auto base = base_name(owner, kind, candidate);
            if (used.contains(candidate))
            {
                spdlog::debug("serial {} used", base);
                continue;
            }

            const auto marker = directory_ / (base + std::string(kMarkerSuffix));
            auto outcome = try_lock(marker);
            for (int attempt = 1; outcome == LockOutcome::Reclaimed && attempt < kMaxReclaimAttempts; ++attempt)
            {
                outcome = try_lock(marker);
            }
            if (outcome != LockOutcome::Acquired)
            {
                spdlog::debug("serial {} locked by another writer", base);
                continue;
            }

            Reservation reservation(marker, directory_ / (base + extension), candidate);
            if (serial_in_use(owner, kind, candidate))
            {
                spdlog::debug("serial {} taken while locking, released", base);
                reservation.release();
                continue;
            }
            spdlog::debug("serial {} reserved", base);
            return reservation;
        }
        throw IngestError(mediadrop::ErrorCode::AllocationExhausted,
                          "No free serial for " + owner_prefix(owner, kind) + " after " +
                              std::to_string(options_.max_probes) + " candidates");
    }

    std::string SerialAllocator::finalize(Reservation reservation, const std::filesystem::path &source)
    {
        if (!reservation.active())
        {
            throw std::logic_error("finalize requires an active reservation");
        }
        const auto target = reservation.final_path();

        std::error_code ec;
        std::filesystem::rename(source, target, ec);
        if (ec)
        {
            spdlog::warn("rename {} -> {} failed ({}), copying instead", source.string(), target.string(),
                         ec.message());
            std::error_code copy_ec;
            std::filesystem::copy_file(source, target, std::filesystem::copy_options::none, copy_ec);
            if (copy_ec)
            {
                if (copy_ec != std::errc::file_exists)
                {
                    std::error_code cleanup_ec;
                    std::filesystem::remove(target, cleanup_ec);
                }
                reservation.release();
                throw IngestError(mediadrop::ErrorCode::StorageIOError,
                                  "Failed to store " + target.filename().string() + ": " + copy_ec.message());
            }
            std::filesystem::remove(source, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove {} after copy: {}", source.string(), ec.message());
            }
        }

        reservation.release();
        spdlog::info("stored {}", target.filename().string());
        return target.filename().string();
    }

    bool SerialAllocator::serial_in_use(const std::string &owner, MediaKind kind, std::uint32_t serial) const
    {
        return used_serials(owner, kind).contains(serial);
    }

    std::set<std::uint32_t> SerialAllocator::used_serials(const std::string &owner, MediaKind kind) const
    {
        const auto prefix = owner_prefix(owner, kind);
        std::set<std::uint32_t> used;

        std::error_code ec;
        std::filesystem::directory_iterator it(directory_, ec);
        if (ec)
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              "Failed to scan " + directory_.string() + ": " + ec.message());
        }
        for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec))
        {
            if (ec)
            {
                throw IngestError(mediadrop::ErrorCode::StorageIOError,
                                  "Failed to scan " + directory_.string() + ": " + ec.message());
            }
            const auto name = it->path().filename().string();
            if (!name.starts_with(prefix))
            {
                continue;
            }
            const std::string_view rest = std::string_view(name).substr(prefix.size());
            std::size_t digits = 0;
            while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits])) != 0)
            {
                ++digits;
            }
            if (digits == 0 || digits > kMaxSerialDigits)
            {
                continue;
            }
            const auto suffix = rest.substr(digits);
            if (suffix == kMarkerSuffix || suffix == kLegacyPlaceholderSuffix)
            {
                continue;
            }
            const auto serial = static_cast<std::uint32_t>(std::stoul(std::string(rest.substr(0, digits))));
            // "alice_IMG-10000" must not count as serial 1000 followed by a "0" suffix.
            if (format_serial(serial) != rest.substr(0, digits))
            {
                continue;
            }
            used.insert(serial);
        }
        return used;
    }

    SerialAllocator::LockOutcome SerialAllocator::try_lock(const std::filesystem::path &marker) const
    {
        std::error_code ec;
        if (std::filesystem::create_directory(marker, ec))
        {
            return LockOutcome::Acquired;
        }
        if (ec)
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              "Failed to create reservation " + marker.string() + ": " + ec.message());
        }

        const auto modified = std::filesystem::last_write_time(marker, ec);
        if (ec)
        {
            // Released between our mkdir and the stat; the candidate is free again.
            return LockOutcome::Reclaimed;
        }
        if (std::filesystem::file_time_type::clock::now() - modified <= options_.stale_after)
        {
            return LockOutcome::Held;
        }

        std::filesystem::remove_all(marker, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove stale reservation {}: {}", marker.string(), ec.message());
            return LockOutcome::Held;
        }
        spdlog::info("removed stale reservation {}", marker.filename().string());
        return LockOutcome::Reclaimed;
    }

} // namespace mediadrop::server
