#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/storage_layout.hpp"

namespace mediadrop::server
{

    struct AssembledFile
    {
        std::filesystem::path path;
        std::string content_hash;
        std::uint64_t size{};
    };

    class Assembler
    {
    public:
        Assembler(const StorageLayout &layout, ManifestStore &manifests);

        // Indices whose chunk file is missing or empty, ascending.
        std::vector<std::uint32_t> find_defective(const std::string &upload_id, std::uint32_t total_chunks) const;

        /**
         * Concatenates chunks 0..total_chunks-1 into a temporary file while
         * hashing the same bytes, then deletes the chunks and the manifest.
         *
         * Throws IngestError(IntegrityError) naming the defective indices
         * before anything is written, or IngestError(StorageIOError) if the
         * merge fails part way. In both cases chunks and manifest are left
         * untouched so the upload can be retried.
         */
        AssembledFile assemble(const std::string &upload_id, std::uint32_t total_chunks,
                               const std::string &extension);

    private:
        void discard_sources(const std::string &upload_id, std::uint32_t total_chunks);

        const StorageLayout &layout_;
        ManifestStore &manifests_;
    };

} // namespace mediadrop::server
