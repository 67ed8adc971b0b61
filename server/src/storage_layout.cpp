#include "mediadrop/server/storage_layout.hpp"

#include <algorithm>
#include <cctype>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server
{

    namespace
    {
        constexpr auto kStoreDir = "store";
        constexpr auto kTempDir = "tmp";
        constexpr auto kChunkDir = "tmp_chunks";
        constexpr auto kManifestDir = "manifests";
        constexpr auto kUploadLog = "upload_log.json";
        constexpr auto kCredentials = "users.csv";

        constexpr std::size_t kMaxUploadIdLength = 128;
        constexpr std::size_t kMaxFilenameLength = 255;
        constexpr std::size_t kMaxExtensionLength = 16;

        bool is_control(char ch)
        {
            return std::iscntrl(static_cast<unsigned char>(ch)) != 0;
        }

        bool is_upload_id_char(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '_' || ch == '-';
        }

    } // namespace

    StorageLayout::StorageLayout(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_);
        std::filesystem::create_directories(store_dir());
        std::filesystem::create_directories(temp_dir());
        std::filesystem::create_directories(chunk_dir());
        std::filesystem::create_directories(manifest_dir());
    }

    std::filesystem::path StorageLayout::store_dir() const
    {
        return base_ / kStoreDir;
    }

    std::filesystem::path StorageLayout::temp_dir() const
    {
        return base_ / kTempDir;
    }

    std::filesystem::path StorageLayout::chunk_dir() const
    {
        return base_ / kChunkDir;
    }

    std::filesystem::path StorageLayout::manifest_dir() const
    {
        return base_ / kManifestDir;
    }

    std::filesystem::path StorageLayout::upload_log_path() const
    {
        return base_ / kUploadLog;
    }

    std::filesystem::path StorageLayout::default_credentials_path() const
    {
        return base_ / kCredentials;
    }

    std::filesystem::path StorageLayout::chunk_path(const std::string &upload_id, std::uint32_t index) const
    {
        validate_upload_id(upload_id);
        return chunk_dir() / (upload_id + "_chunk_" + std::to_string(index));
    }

    std::filesystem::path StorageLayout::manifest_path(const std::string &upload_id) const
    {
        validate_upload_id(upload_id);
        return manifest_dir() / (upload_id + ".json");
    }

    std::filesystem::path StorageLayout::new_chunk_staging_path() const
    {
        return chunk_dir() / (".inflight." + crypto::random_hex(12));
    }

    std::filesystem::path StorageLayout::new_merge_path(const std::string &extension) const
    {
        return temp_dir() / (".merge." + crypto::random_hex(12) + extension);
    }

    std::filesystem::path StorageLayout::new_direct_staging_path(const std::string &extension) const
    {
        return temp_dir() / (".direct." + crypto::random_hex(12) + extension);
    }

    void StorageLayout::validate_upload_id(std::string_view upload_id)
    {
        if (upload_id.empty() || upload_id.size() > kMaxUploadIdLength)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "uploadId must be 1-128 characters");
        }
        if (upload_id.front() == '.' || !std::all_of(upload_id.begin(), upload_id.end(), is_upload_id_char))
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "uploadId contains invalid characters");
        }
    }

    std::string StorageLayout::sanitize_filename(std::string_view requested)
    {
        // Clients may send a full local path; only the last component is meaningful.
        const auto separator = requested.find_last_of("/\\");
        auto name = separator == std::string_view::npos ? requested : requested.substr(separator + 1);
        if (name.empty() || name == "." || name == "..")
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "filename is required");
        }
        if (name.size() > kMaxFilenameLength)
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "filename too long");
        }
        if (std::any_of(name.begin(), name.end(), is_control))
        {
            throw IngestError(mediadrop::ErrorCode::InvalidRequest, "filename contains control characters");
        }
        return std::string(name);
    }

    std::string StorageLayout::sanitize_owner_name(std::string_view owner)
    {
        std::string result;
        result.reserve(owner.size());
        for (const char ch : owner)
        {
            result.push_back(ch == '/' || ch == '\\' || is_control(ch) ? '_' : ch);
        }
        if (result.empty() || result.front() == '.')
        {
            result.insert(result.begin(), '_');
        }
        return result;
    }

    std::string StorageLayout::extension_of(std::string_view filename)
    {
        const auto dot = filename.find_last_of('.');
        if (dot == std::string_view::npos || dot == 0)
        {
            return {};
        }
        auto extension = filename.substr(dot);
        if (extension.size() < 2 || extension.size() > kMaxExtensionLength ||
            extension.find_first_of("/\\") != std::string_view::npos ||
            std::any_of(extension.begin(), extension.end(), is_control))
        {
            return {};
        }
        return std::string(extension);
    }

} // namespace mediadrop::server
