#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace mediadrop::server
{

    // Directory layout shared by the ingestion components. Every path the
    // core touches is derived here so that request-supplied names never
    // escape the storage root.
    class StorageLayout
    {
    public:
        explicit StorageLayout(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return base_; }
        std::filesystem::path store_dir() const;
        std::filesystem::path temp_dir() const;
        std::filesystem::path chunk_dir() const;
        std::filesystem::path manifest_dir() const;
        std::filesystem::path upload_log_path() const;
        std::filesystem::path default_credentials_path() const;

        std::filesystem::path chunk_path(const std::string &upload_id, std::uint32_t index) const;
        std::filesystem::path manifest_path(const std::string &upload_id) const;

        std::filesystem::path new_chunk_staging_path() const;
        std::filesystem::path new_merge_path(const std::string &extension) const;
        std::filesystem::path new_direct_staging_path(const std::string &extension) const;

        static void validate_upload_id(std::string_view upload_id);
        static std::string sanitize_filename(std::string_view requested);
        static std::string sanitize_owner_name(std::string_view owner);
        static std::string extension_of(std::string_view filename);

    private:
        std::filesystem::path base_;
    };

} // namespace mediadrop::server
