#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mediadrop/server/storage_layout.hpp"

namespace mediadrop::server
{

    struct UploadManifest
    {
        std::string upload_id;
        std::uint32_t total_chunks{};
        std::set<std::uint32_t> received;
        std::string original_filename;
        std::string owner_token;
        bool is_video{};
        std::chrono::system_clock::time_point last_modified{};

        bool complete() const noexcept { return received.size() == total_chunks; }
    };

    struct ChunkRecord
    {
        std::string upload_id;
        std::uint32_t index{};
        std::uint32_t total_chunks{};
        std::string original_filename;
        std::string owner_token;
        bool is_video{};
    };

    // Durable per-upload record of which chunks have arrived, one JSON
    // document per upload. Every write replaces the document atomically;
    // an unreadable document is reported as absent.
    class ManifestStore
    {
    public:
        explicit ManifestStore(const StorageLayout &layout);

        std::optional<UploadManifest> get(const std::string &upload_id) const;

        // False when a manifest for the upload already exists.
        bool create(const UploadManifest &manifest);

        void update(const UploadManifest &manifest);

        // Creates the manifest on the first chunk, otherwise adds the index to
        // the received set. The stored total_chunks always wins over the one
        // in the record.
        UploadManifest record_chunk(const ChunkRecord &record);

        bool remove(const std::string &upload_id);

        // Resume query: indices already delivered, ascending; empty when unknown.
        std::vector<std::uint32_t> received(const std::string &upload_id) const;

    private:
        std::optional<UploadManifest> load_locked(const std::string &upload_id) const;
        void persist_locked(const UploadManifest &manifest) const;

        const StorageLayout &layout_;
        mutable std::mutex mutex_;
    };

} // namespace mediadrop::server
