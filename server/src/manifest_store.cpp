#include "mediadrop/server/manifest_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "durable_file.hpp"
#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server
{

    namespace
    {

        nlohmann::json to_json(const UploadManifest &manifest)
        {
            return {
                {"upload_id", manifest.upload_id},
                {"total_chunks", manifest.total_chunks},
                {"received", manifest.received},
                {"filename", manifest.original_filename},
                {"owner_token", manifest.owner_token},
                {"is_video", manifest.is_video},
                {"last_modified", std::chrono::duration_cast<std::chrono::milliseconds>(
                                      manifest.last_modified.time_since_epoch())
                                      .count()},
            };
        }

        UploadManifest manifest_from_json(const nlohmann::json &json)
        {
            UploadManifest manifest{};
            manifest.upload_id = json.at("upload_id").get<std::string>();
            manifest.total_chunks = json.at("total_chunks").get<std::uint32_t>();
            if (manifest.total_chunks == 0)
            {
                throw std::runtime_error("manifest declares zero chunks");
            }
            for (const auto index : json.value("received", std::vector<std::uint32_t>{}))
            {
                if (index < manifest.total_chunks)
                {
                    manifest.received.insert(index);
                }
            }
            manifest.original_filename = json.value("filename", std::string{});
            manifest.owner_token = json.value("owner_token", std::string{});
            manifest.is_video = json.value("is_video", false);
            const auto millis = json.value("last_modified", 0LL);
            manifest.last_modified = std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
            return manifest;
        }

    } // namespace

    ManifestStore::ManifestStore(const StorageLayout &layout) : layout_(layout)
    {
        std::filesystem::create_directories(layout_.manifest_dir());
    }

    std::optional<UploadManifest> ManifestStore::get(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        return load_locked(upload_id);
    }

    bool ManifestStore::create(const UploadManifest &manifest)
    {
        std::lock_guard lock(mutex_);
        if (load_locked(manifest.upload_id))
        {
            return false;
        }
        persist_locked(manifest);
        return true;
    }

    void ManifestStore::update(const UploadManifest &manifest)
    {
        std::lock_guard lock(mutex_);
        persist_locked(manifest);
    }

    UploadManifest ManifestStore::record_chunk(const ChunkRecord &record)
    {
        std::lock_guard lock(mutex_);
        auto manifest = load_locked(record.upload_id);
        if (!manifest)
        {
            manifest = UploadManifest{
                .upload_id = record.upload_id,
                .total_chunks = record.total_chunks,
                .received = {},
                .original_filename = record.original_filename,
                .owner_token = record.owner_token,
                .is_video = record.is_video,
            };
            spdlog::info("manifest {}: created for {} chunks", record.upload_id, record.total_chunks);
        }
        else if (manifest->total_chunks != record.total_chunks)
        {
            spdlog::warn("manifest {}: ignoring totalChunks {} (fixed at {})", record.upload_id, record.total_chunks,
                         manifest->total_chunks);
        }

        if (record.index >= manifest->total_chunks)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest,
                              "index " + std::to_string(record.index) + " outside upload of " +
                                  std::to_string(manifest->total_chunks) + " chunks");
        }
        if (manifest->original_filename.empty())
        {
            manifest->original_filename = record.original_filename;
        }
        manifest->received.insert(record.index);
        manifest->last_modified = std::chrono::system_clock::now();
        persist_locked(*manifest);
        return *manifest;
    }

    bool ManifestStore::remove(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        const bool removed = std::filesystem::remove(layout_.manifest_path(upload_id), ec);
        if (ec)
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              "failed to remove manifest " + upload_id + ": " + ec.message());
        }
        return removed;
    }

    std::vector<std::uint32_t> ManifestStore::received(const std::string &upload_id) const
    {
        const auto manifest = get(upload_id);
        if (!manifest)
        {
            return {};
        }
        return {manifest->received.begin(), manifest->received.end()};
    }

    std::optional<UploadManifest> ManifestStore::load_locked(const std::string &upload_id) const
    {
        const auto path = layout_.manifest_path(upload_id);
        try
        {
            const auto json = durable_file::read_json(path);
            if (!json)
            {
                return std::nullopt;
            }
            auto manifest = manifest_from_json(*json);
            if (manifest.upload_id != upload_id)
            {
                spdlog::warn("manifest {} names upload {}; treating as absent", path.string(), manifest.upload_id);
                return std::nullopt;
            }
            return manifest;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("manifest {} unreadable, treating as absent: {}", path.string(), ex.what());
            return std::nullopt;
        }
    }

    void ManifestStore::persist_locked(const UploadManifest &manifest) const
    {
        durable_file::write_json_atomic(layout_.manifest_path(manifest.upload_id), to_json(manifest));
    }

} // namespace mediadrop::server
