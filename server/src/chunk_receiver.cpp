#include "mediadrop/server/chunk_receiver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>

#include <spdlog/spdlog.h>

#include "durable_file.hpp"
#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        bool is_token_field(std::string_view name)
        {
            return name == "ownerToken" || name == "authKey";
        }

    } // namespace

    ChunkSubmission::ChunkSubmission(ChunkReceiver &receiver) : receiver_(receiver) {}

    ChunkSubmission::~ChunkSubmission()
    {
        if (!committed_)
        {
            discard_staging();
        }
    }

    void ChunkSubmission::add_field(std::string_view name, std::string_view value)
    {
        if (is_token_field(name))
        {
            const auto token = std::string(trim(value));
            if (!receiver_.owners_.find_owner(token))
            {
                throw IngestError(mediadrop::ErrorCode::Unauthorized, "Invalid ownerToken");
            }
            owner_token_ = token;
        }
        else if (name == "uploadId")
        {
            const auto upload_id = std::string(trim(value));
            StorageLayout::validate_upload_id(upload_id);
            upload_id_ = upload_id;
        }
        else if (name == "index")
        {
            index_ = ChunkReceiver::parse_number("index", value, 0, kMaxChunksPerUpload - 1);
            check_index_in_range();
        }
        else if (name == "totalChunks")
        {
            total_chunks_ = ChunkReceiver::parse_number("totalChunks", value, 1, kMaxChunksPerUpload);
            check_index_in_range();
        }
        else if (name == "filename")
        {
            filename_ = StorageLayout::sanitize_filename(value);
        }
        else if (name == "isVideo")
        {
            is_video_ = ChunkReceiver::parse_flag(value);
        }
        else
        {
            spdlog::debug("chunk submission: ignoring field {}", name);
        }
    }

    void ChunkSubmission::add_payload(std::span<const std::byte> data)
    {
        if (payload_seen_)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "Only one chunk payload per submission");
        }
        payload_seen_ = true;
        staging_path_ = receiver_.layout_.new_chunk_staging_path();

        std::ofstream out(staging_path_, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            staging_path_.clear();
            throw IngestError(mediadrop::ErrorCode::StorageIOError, "Failed to open chunk staging file");
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out)
        {
            discard_staging();
            throw IngestError(mediadrop::ErrorCode::StorageIOError, "Failed to write chunk staging file");
        }
        payload_bytes_ = data.size();
    }

    ChunkReceipt ChunkSubmission::commit()
    {
        if (committed_)
        {
            throw std::logic_error("chunk submission committed twice");
        }
        if (!owner_token_)
        {
            throw IngestError(mediadrop::ErrorCode::Unauthorized, "Missing ownerToken");
        }
        if (!upload_id_ || !index_ || !total_chunks_ || !payload_seen_)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "Missing fields for chunk");
        }
        if (payload_bytes_ == 0)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "Chunk payload is empty");
        }

        const auto existing = receiver_.manifests_.get(*upload_id_);
        if (existing && *index_ >= existing->total_chunks)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest,
                              "index " + std::to_string(*index_) + " outside upload of " +
                                  std::to_string(existing->total_chunks) + " chunks");
        }
        // Later chunks may omit the filename once the manifest carries one.
        if (filename_.empty() && (!existing || existing->original_filename.empty()))
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "Missing filename for upload " + *upload_id_);
        }

        const auto chunk_path = receiver_.layout_.chunk_path(*upload_id_, *index_);
        durable_file::rename_with_retry(staging_path_, chunk_path);
        staging_path_.clear();

        const auto manifest = receiver_.manifests_.record_chunk(ChunkRecord{
            .upload_id = *upload_id_,
            .index = *index_,
            .total_chunks = *total_chunks_,
            .original_filename = filename_,
            .owner_token = *owner_token_,
            .is_video = is_video_,
        });
        committed_ = true;

        spdlog::info("chunk ok: upload {} index {} ({} bytes, {}/{} received)", *upload_id_, *index_, payload_bytes_,
                     manifest.received.size(), manifest.total_chunks);

        return ChunkReceipt{
            .upload_id = *upload_id_,
            .index = *index_,
            .received_count = manifest.received.size(),
            .total_chunks = manifest.total_chunks,
            .complete = manifest.complete(),
            .manifest = manifest,
        };
    }

    void ChunkSubmission::check_index_in_range() const
    {
        if (index_ && total_chunks_ && *index_ >= *total_chunks_)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "index must be below totalChunks");
        }
    }

    void ChunkSubmission::discard_staging() noexcept
    {
        if (staging_path_.empty())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(staging_path_, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove chunk staging file {}: {}", staging_path_.string(), ec.message());
        }
        staging_path_.clear();
    }

    ChunkReceiver::ChunkReceiver(const StorageLayout &layout, ManifestStore &manifests, const OwnerLookup &owners)
        : layout_(layout), manifests_(manifests), owners_(owners)
    {
    }

    ChunkSubmission ChunkReceiver::begin()
    {
        return ChunkSubmission(*this);
    }

    std::uint32_t ChunkReceiver::parse_number(std::string_view field, std::string_view value, std::uint32_t min_value,
                                              std::uint32_t max_value)
    {
        const auto text = trim(value);
        std::uint32_t parsed = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (text.empty() || ec != std::errc{} || end != text.data() + text.size() || parsed < min_value ||
            parsed > max_value)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest,
                              "Malformed " + std::string(field) + ": '" + std::string(text) + "'");
        }
        return parsed;
    }

    bool ChunkReceiver::parse_flag(std::string_view value) noexcept
    {
        const auto text = trim(value);
        constexpr std::string_view kTrue = "true";
        return text.size() == kTrue.size() &&
               std::equal(text.begin(), text.end(), kTrue.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) == b; });
    }

} // namespace mediadrop::server
