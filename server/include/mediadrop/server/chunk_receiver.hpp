#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/owner_directory.hpp"
#include "mediadrop/server/storage_layout.hpp"

namespace mediadrop::server
{

    inline constexpr std::uint32_t kMaxChunksPerUpload = 1'000'000;

    struct ChunkReceipt
    {
        std::string upload_id;
        std::uint32_t index{};
        std::size_t received_count{};
        std::uint32_t total_chunks{};
        bool complete{};
        UploadManifest manifest;
    };

    class ChunkReceiver;

    // One chunk submission. Fields and the payload may arrive in any order;
    // the payload is staged privately and only moved onto the chunk path by
    // commit(). A submission destroyed without a successful commit leaves
    // nothing behind.
    class ChunkSubmission
    {
    public:
        explicit ChunkSubmission(ChunkReceiver &receiver);
        ~ChunkSubmission();

        ChunkSubmission(const ChunkSubmission &) = delete;
        ChunkSubmission &operator=(const ChunkSubmission &) = delete;

        void add_field(std::string_view name, std::string_view value);

        void add_payload(std::span<const std::byte> data);

        ChunkReceipt commit();

        const std::optional<std::string> &owner_token() const noexcept { return owner_token_; }

    private:
        void check_index_in_range() const;
        void discard_staging() noexcept;

        ChunkReceiver &receiver_;

        std::optional<std::string> owner_token_;
        std::optional<std::string> upload_id_;
        std::optional<std::uint32_t> index_;
        std::optional<std::uint32_t> total_chunks_;
        std::string filename_;
        bool is_video_{false};

        std::filesystem::path staging_path_;
        std::uint64_t payload_bytes_{};
        bool payload_seen_{false};
        bool committed_{false};
    };

    class ChunkReceiver
    {
    public:
        ChunkReceiver(const StorageLayout &layout, ManifestStore &manifests, const OwnerLookup &owners);

        ChunkSubmission begin();

        // Strict decimal parse of a request field; InvalidRequest outside [min_value, max_value].
        static std::uint32_t parse_number(std::string_view field, std::string_view value, std::uint32_t min_value,
                                          std::uint32_t max_value);

        static bool parse_flag(std::string_view value) noexcept;

    private:
        friend class ChunkSubmission;

        const StorageLayout &layout_;
        ManifestStore &manifests_;
        const OwnerLookup &owners_;
    };

} // namespace mediadrop::server
