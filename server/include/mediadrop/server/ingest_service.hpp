#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mediadrop/server/assembler.hpp"
#include "mediadrop/server/chunk_receiver.hpp"
#include "mediadrop/server/hash_deduper.hpp"
#include "mediadrop/server/ingest_error.hpp"
#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/owner_directory.hpp"
#include "mediadrop/server/serial_allocator.hpp"
#include "mediadrop/server/storage_layout.hpp"
#include "mediadrop/server/upload_log.hpp"

namespace mediadrop::server
{

    class DirectUpload;

    struct FinalizeRequest
    {
        std::string upload_id;
        std::uint32_t total_chunks{};
        std::string filename;
        std::string owner_token;
        bool is_video{};
    };

    struct StoreOutcome
    {
        bool deduped{};
        // Newly stored name, or the existing name on a dedupe hit.
        std::string saved_name;
        std::string content_hash;
        bool replayed{};
    };

    struct ChunkOutcome
    {
        ChunkReceipt receipt;
        std::optional<StoreOutcome> finalized;
        std::optional<IngestError> finalize_error;
    };

    /**
     * Ingestion pipeline: chunk receipt, assembly, dedupe, serial allocation
     * and the upload log, wired in that order.
     *
     * All stores are owned by the caller and passed in. The dedupe lookup,
     * allocation, final move and log append of one file run under a single
     * commit mutex; finalizes of the same upload are serialized on top of
     * that so a repeated finalize replays the first outcome.
     */
    class IngestService
    {
    public:
        IngestService(const StorageLayout &layout, ManifestStore &manifests, const OwnerLookup &owners,
                      Assembler &assembler, HashDeduper &deduper, SerialAllocator &allocator, UploadLog &log,
                      bool auto_assemble);

        ChunkSubmission begin_chunk();

        // Commits the submission; assembles right away when the upload became
        // complete and auto-assembly is on.
        ChunkOutcome accept_chunk(ChunkSubmission &submission);

        std::vector<std::uint32_t> upload_status(const std::string &upload_id) const;

        StoreOutcome finalize(const FinalizeRequest &request);

        DirectUpload begin_direct();

        /**
         * Commits one staged file: either records it as a duplicate of an
         * existing file or moves it onto a freshly allocated name. The staged
         * file is consumed in every case, including failure.
         */
        StoreOutcome store(const UploadAttribution &attribution, MediaKind kind,
                           const std::filesystem::path &staged, const std::string &content_hash,
                           const std::string &extension);

        std::optional<std::string> owner_name(std::string_view token) const;

        const StorageLayout &layout() const noexcept { return layout_; }
        bool auto_assemble() const noexcept { return auto_assemble_; }

    private:
        class UploadGuard;

        std::optional<StoreOutcome> replay(const FinalizeRequest &request) const;

        const StorageLayout &layout_;
        ManifestStore &manifests_;
        const OwnerLookup &owners_;
        Assembler &assembler_;
        HashDeduper &deduper_;
        SerialAllocator &allocator_;
        UploadLog &log_;
        ChunkReceiver chunk_receiver_;
        bool auto_assemble_;

        std::mutex commit_mutex_;

        std::mutex finalizing_mutex_;
        std::condition_variable finalizing_cv_;
        std::set<std::string> finalizing_;
    };

} // namespace mediadrop::server
