#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace mediadrop::server
{

    enum class MediaKind
    {
        Image,
        Video
    };

    // "IMG" or "VID".
    std::string_view serial_prefix(MediaKind kind) noexcept;

    struct AllocatorOptions
    {
        std::chrono::seconds stale_after{std::chrono::minutes{10}};
        std::uint32_t max_probes{1'000'000};
    };

    // Exclusive claim on one serial, visible on disk as a marker directory.
    // The marker is removed when the reservation is released or destroyed.
    class Reservation
    {
    public:
        Reservation() = default;
        ~Reservation();

        Reservation(Reservation &&other) noexcept;
        Reservation &operator=(Reservation &&other) noexcept;

        Reservation(const Reservation &) = delete;
        Reservation &operator=(const Reservation &) = delete;

        const std::filesystem::path &final_path() const noexcept { return final_path_; }
        const std::filesystem::path &marker_path() const noexcept { return marker_path_; }
        std::uint32_t serial() const noexcept { return serial_; }
        bool active() const noexcept { return !marker_path_.empty(); }

        void release() noexcept;

    private:
        friend class SerialAllocator;
        Reservation(std::filesystem::path marker_path, std::filesystem::path final_path, std::uint32_t serial);

        std::filesystem::path marker_path_;
        std::filesystem::path final_path_;
        std::uint32_t serial_{};
    };

    /**
     * Hands out stored names of the form <owner>_<IMG|VID>-<NNNN><ext>.
     *
     * Serials are scoped to (owner, prefix) regardless of extension. Mutual
     * exclusion relies only on mkdir(2) being atomic, so several processes
     * may allocate in the same directory concurrently. A marker older than
     * stale_after is taken to belong to a crashed writer and is reclaimed.
     */
    class SerialAllocator
    {
    public:
        explicit SerialAllocator(std::filesystem::path directory, AllocatorOptions options = {});

        // Throws IngestError(AllocationExhausted) after max_probes candidates.
        Reservation reserve(const std::string &owner, MediaKind kind, const std::string &extension);

        /**
         * Moves source onto the reserved path, falling back to copy and
         * remove when a rename is not possible. The marker is released
         * whether or not the move succeeds. Returns the stored file name.
         */
        std::string finalize(Reservation reservation, const std::filesystem::path &source);

        bool serial_in_use(const std::string &owner, MediaKind kind, std::uint32_t serial) const;

        const std::filesystem::path &directory() const noexcept { return directory_; }
        const AllocatorOptions &options() const noexcept { return options_; }

        // <owner>_<PREFIX>-<NNNN>, owner sanitized for use in a file name.
        static std::string base_name(const std::string &owner, MediaKind kind, std::uint32_t serial);

        static constexpr std::string_view kMarkerSuffix = ".lock";
        static constexpr std::string_view kLegacyPlaceholderSuffix = ".serial";

    private:
        enum class LockOutcome
        {
            Acquired,
            Held,
            Reclaimed
        };

        std::set<std::uint32_t> used_serials(const std::string &owner, MediaKind kind) const;
        LockOutcome try_lock(const std::filesystem::path &marker) const;

        std::filesystem::path directory_;
        AllocatorOptions options_;
    };

} // namespace mediadrop::server
