#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mediadrop/server/serial_allocator.hpp"

namespace mediadrop::server
{

    class IngestService;

    struct DirectUploadResult
    {
        // Names of newly stored files, in submission order.
        std::vector<std::string> files;
        // Existing names the remaining files resolved to.
        std::vector<std::string> deduped;
    };

    // Whole-file submission. Files are staged and hashed as they arrive and
    // only committed once a valid owner token has been seen; a submission
    // destroyed before commit() deletes whatever it staged.
    class DirectUpload
    {
    public:
        explicit DirectUpload(IngestService &service);
        ~DirectUpload();

        DirectUpload(const DirectUpload &) = delete;
        DirectUpload &operator=(const DirectUpload &) = delete;

        void add_field(std::string_view name, std::string_view value);

        void add_file(std::string_view filename, std::string_view content_type, std::span<const std::byte> data);

        DirectUploadResult commit();

        std::size_t staged_count() const noexcept { return staged_.size(); }

        static MediaKind media_kind_for(std::string_view filename, std::string_view content_type);

    private:
        struct StagedFile
        {
            std::filesystem::path path;
            std::string original_filename;
            std::string extension;
            std::string content_hash;
            MediaKind kind{MediaKind::Image};
        };

        void discard_staged() noexcept;

        IngestService &service_;
        std::optional<std::string> owner_token_;
        std::vector<StagedFile> staged_;
        bool committed_{false};
    };

} // namespace mediadrop::server
