#include "mediadrop/server/direct_upload.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

#include <spdlog/spdlog.h>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/ingest_error.hpp"
#include "mediadrop/server/ingest_service.hpp"

namespace mediadrop::server
{

    namespace
    {
        constexpr std::size_t kWriteSliceSize = 64 * 1024;

        constexpr std::array<std::string_view, 7> kVideoExtensions = {".mp4", ".mov", ".avi", ".mkv",
                                                                      ".webm", ".flv", ".ogv"};

        std::string to_lower(std::string_view value)
        {
            std::string lowered(value);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return lowered;
        }

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

    } // namespace

    DirectUpload::DirectUpload(IngestService &service) : service_(service) {}

    DirectUpload::~DirectUpload()
    {
        if (!committed_)
        {
            discard_staged();
        }
    }

    void DirectUpload::add_field(std::string_view name, std::string_view value)
    {
        if (name != "ownerToken" && name != "authKey")
        {
            spdlog::debug("direct upload: ignoring field {}", name);
            return;
        }
        const auto token = std::string(trim(value));
        if (!service_.owner_name(token))
        {
            throw IngestError(mediadrop::ErrorCode::Unauthorized, "Invalid ownerToken");
        }
        owner_token_ = token;
    }

    void DirectUpload::add_file(std::string_view filename, std::string_view content_type,
                                std::span<const std::byte> data)
    {
        if (committed_)
        {
            throw std::logic_error("direct upload already committed");
        }
        StagedFile staged{};
        staged.original_filename = StorageLayout::sanitize_filename(filename);
        if (data.empty())
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, staged.original_filename + " is empty");
        }
        staged.extension = StorageLayout::extension_of(staged.original_filename);
        staged.kind = media_kind_for(staged.original_filename, content_type);
        staged.path = service_.layout().new_direct_staging_path(staged.extension);

        crypto::ContentHasher hasher;
        std::ofstream out(staged.path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              "Failed to stage " + staged.original_filename);
        }
        // Registered before writing so a failed write is still cleaned up.
        staged_.push_back(staged);
        for (std::size_t offset = 0; offset < data.size(); offset += kWriteSliceSize)
        {
            const auto slice = data.subspan(offset, std::min(kWriteSliceSize, data.size() - offset));
            hasher.update(slice);
            out.write(reinterpret_cast<const char *>(slice.data()), static_cast<std::streamsize>(slice.size()));
            if (!out)
            {
                throw IngestError(mediadrop::ErrorCode::StorageIOError,
                                  "Failed to stage " + staged.original_filename);
            }
        }
        out.close();
        if (!out)
        {
            throw IngestError(mediadrop::ErrorCode::StorageIOError, "Failed to stage " + staged.original_filename);
        }
        staged_.back().content_hash = hasher.finish();
        spdlog::debug("direct upload: staged {} ({} bytes)", staged.original_filename, data.size());
    }

    DirectUploadResult DirectUpload::commit()
    {
        if (committed_)
        {
            throw std::logic_error("direct upload committed twice");
        }
        if (!owner_token_)
        {
            throw IngestError(mediadrop::ErrorCode::Unauthorized, "Missing ownerToken");
        }
        const auto owner = service_.owner_name(*owner_token_);
        if (!owner)
        {
            throw IngestError(mediadrop::ErrorCode::Unauthorized, "Invalid ownerToken");
        }
        if (staged_.empty())
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "No files in upload");
        }

        DirectUploadResult result;
        while (!staged_.empty())
        {
            const auto staged = staged_.front();
            staged_.erase(staged_.begin());
            const auto outcome = service_.store(
                UploadAttribution{
                    .owner_token = *owner_token_,
                    .owner_name = *owner,
                    .original_filename = staged.original_filename,
                    .upload_id = std::nullopt,
                },
                staged.kind, staged.path, staged.content_hash, staged.extension);
            if (outcome.deduped)
            {
                result.deduped.push_back(outcome.saved_name);
            }
            else
            {
                result.files.push_back(outcome.saved_name);
            }
        }
        committed_ = true;
        spdlog::info("direct upload from {}: {} stored, {} deduped", *owner, result.files.size(),
                     result.deduped.size());
        return result;
    }

    MediaKind DirectUpload::media_kind_for(std::string_view filename, std::string_view content_type)
    {
        if (to_lower(trim(content_type)).starts_with("video/"))
        {
            return MediaKind::Video;
        }
        const auto extension = to_lower(StorageLayout::extension_of(filename));
        const bool is_video = std::find(kVideoExtensions.begin(), kVideoExtensions.end(), extension) !=
                              kVideoExtensions.end();
        return is_video ? MediaKind::Video : MediaKind::Image;
    }

    void DirectUpload::discard_staged() noexcept
    {
        for (const auto &staged : staged_)
        {
            std::error_code ec;
            std::filesystem::remove(staged.path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove staged upload {}: {}", staged.path.string(), ec.message());
            }
        }
        staged_.clear();
    }

} // namespace mediadrop::server
