#include "mediadrop/server/ingest_service.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "mediadrop/server/direct_upload.hpp"

namespace mediadrop::server
{

    namespace
    {

        void remove_staged(const std::filesystem::path &staged) noexcept
        {
            std::error_code ec;
            std::filesystem::remove(staged, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove staged file {}: {}", staged.string(), ec.message());
            }
        }

    } // namespace

    // Blocks while another finalize of the same upload is running.
    class IngestService::UploadGuard
    {
    public:
        UploadGuard(IngestService &service, std::string upload_id)
            : service_(service), upload_id_(std::move(upload_id))
        {
            std::unique_lock lock(service_.finalizing_mutex_);
            service_.finalizing_cv_.wait(lock, [this]
                                         { return !service_.finalizing_.contains(upload_id_); });
            service_.finalizing_.insert(upload_id_);
        }

        ~UploadGuard()
        {
            {
                std::lock_guard lock(service_.finalizing_mutex_);
                service_.finalizing_.erase(upload_id_);
            }
            service_.finalizing_cv_.notify_all();
        }

        UploadGuard(const UploadGuard &) = delete;
        UploadGuard &operator=(const UploadGuard &) = delete;

    private:
        IngestService &service_;
        std::string upload_id_;
    };

    IngestService::IngestService(const StorageLayout &layout, ManifestStore &manifests, const OwnerLookup &owners,
                                 Assembler &assembler, HashDeduper &deduper, SerialAllocator &allocator,
                                 UploadLog &log, bool auto_assemble)
        : layout_(layout), manifests_(manifests), owners_(owners), assembler_(assembler), deduper_(deduper),
          allocator_(allocator), log_(log), chunk_receiver_(layout, manifests, owners), auto_assemble_(auto_assemble)
    {
    }

    ChunkSubmission IngestService::begin_chunk()
    {
        return chunk_receiver_.begin();
    }

    ChunkOutcome IngestService::accept_chunk(ChunkSubmission &submission)
    {
        ChunkOutcome outcome{.receipt = submission.commit(), .finalized = std::nullopt, .finalize_error = std::nullopt};
        if (!auto_assemble_ || !outcome.receipt.complete)
        {
            return outcome;
        }

        const auto &manifest = outcome.receipt.manifest;
        try
        {
            outcome.finalized = finalize(FinalizeRequest{
                .upload_id = manifest.upload_id,
                .total_chunks = manifest.total_chunks,
                .filename = manifest.original_filename,
                .owner_token = manifest.owner_token,
                .is_video = manifest.is_video,
            });
        }
        catch (const IngestError &ex)
        {
            // The chunk itself was accepted; the client can still finalize explicitly.
            spdlog::warn("auto-assembly of {} failed: {}", manifest.upload_id, ex.what());
            outcome.finalize_error = ex;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            spdlog::warn("auto-assembly of {} failed: {}", manifest.upload_id, ex.what());
            outcome.finalize_error = IngestError(mediadrop::ErrorCode::StorageIOError, ex.what());
        }
        return outcome;
    }

    std::vector<std::uint32_t> IngestService::upload_status(const std::string &upload_id) const
    {
        StorageLayout::validate_upload_id(upload_id);
        return manifests_.received(upload_id);
    }

    StoreOutcome IngestService::finalize(const FinalizeRequest &request)
    {
        const auto owner = owners_.find_owner(request.owner_token);
        if (!owner)
        {
            throw IngestError(mediadrop::ErrorCode::Unauthorized, "Invalid ownerToken");
        }
        StorageLayout::validate_upload_id(request.upload_id);
        if (request.total_chunks == 0 || request.total_chunks > kMaxChunksPerUpload)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "totalChunks out of range");
        }
        const auto filename = StorageLayout::sanitize_filename(request.filename);

        UploadGuard guard(*this, request.upload_id);

        if (const auto manifest = manifests_.get(request.upload_id))
        {
            if (manifest->total_chunks != request.total_chunks)
            {
                throw IngestError(mediadrop::ErrorCode::InvalidRequest,
                                  "totalChunks " + std::to_string(request.total_chunks) + " does not match upload of " +
                                      std::to_string(manifest->total_chunks) + " chunks");
            }
            if (manifest->owner_token != request.owner_token)
            {
                throw IngestError(mediadrop::ErrorCode::Unauthorized, "Upload belongs to a different owner");
            }
        }
        else if (assembler_.find_defective(request.upload_id, request.total_chunks).size() == request.total_chunks)
        {
            if (auto replayed = replay(request))
            {
                return *replayed;
            }
        }

        const auto extension = StorageLayout::extension_of(filename);
        const auto assembled = assembler_.assemble(request.upload_id, request.total_chunks, extension);

        spdlog::info("finalize {}: {} from {} ({} bytes)", request.upload_id, filename, *owner, assembled.size);
        return store(UploadAttribution{
                         .owner_token = request.owner_token,
                         .owner_name = *owner,
                         .original_filename = filename,
                         .upload_id = request.upload_id,
                     },
                     request.is_video ? MediaKind::Video : MediaKind::Image, assembled.path, assembled.content_hash,
                     extension);
    }

    DirectUpload IngestService::begin_direct()
    {
        return DirectUpload(*this);
    }

    StoreOutcome IngestService::store(const UploadAttribution &attribution, MediaKind kind,
                                      const std::filesystem::path &staged, const std::string &content_hash,
                                      const std::string &extension)
    {
        std::lock_guard lock(commit_mutex_);
        try
        {
            if (const auto existing = deduper_.lookup(content_hash))
            {
                remove_staged(staged);
                deduper_.record_duplicate(attribution, content_hash, *existing);
                return StoreOutcome{.deduped = true, .saved_name = *existing, .content_hash = content_hash};
            }

            auto reservation = allocator_.reserve(attribution.owner_name, kind, extension);
            const auto saved_name = allocator_.finalize(std::move(reservation), staged);
            deduper_.record_stored(attribution, content_hash, saved_name);
            return StoreOutcome{.deduped = false, .saved_name = saved_name, .content_hash = content_hash};
        }
        catch (const std::exception &)
        {
            remove_staged(staged);
            throw;
        }
    }

    std::optional<std::string> IngestService::owner_name(std::string_view token) const
    {
        return owners_.find_owner(token);
    }

    std::optional<StoreOutcome> IngestService::replay(const FinalizeRequest &request) const
    {
        const auto entry = log_.find_upload(request.upload_id);
        if (!entry || entry->owner_token != request.owner_token)
        {
            return std::nullopt;
        }
        spdlog::info("finalize {}: already committed as {}", request.upload_id, entry->saved_name);
        return StoreOutcome{
            .deduped = entry->deduped,
            .saved_name = entry->saved_name,
            .content_hash = entry->content_hash,
            .replayed = true,
        };
    }

} // namespace mediadrop::server
