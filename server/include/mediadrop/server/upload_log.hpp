#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mediadrop::server
{

    struct UploadLogEntry
    {
        std::string owner_token;
        std::string owner_name;
        std::string original_filename;
        std::string saved_name;
        std::string timestamp;
        std::string content_hash;
        bool deduped{};
        std::optional<std::string> upload_id;
    };

    // Append-only upload history persisted as one JSON array. The whole file
    // is rewritten atomically on every append; entries are never changed or
    // removed.
    class UploadLog
    {
    public:
        explicit UploadLog(std::filesystem::path path);

        // On failure the entry is not kept and IngestError(StorageIOError) is thrown.
        void append(UploadLogEntry entry);

        std::vector<UploadLogEntry> entries() const;
        std::size_t size() const;

        // Most recent entry produced by the given chunked upload.
        std::optional<UploadLogEntry> find_upload(const std::string &upload_id) const;

        const std::filesystem::path &path() const noexcept { return path_; }

        static std::string format_timestamp(std::chrono::system_clock::time_point time);

    private:
        void load();
        void persist_locked() const;

        std::filesystem::path path_;
        mutable std::mutex mutex_;
        std::vector<UploadLogEntry> entries_;
    };

} // namespace mediadrop::server
