#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "mediadrop/server/upload_log.hpp"

namespace mediadrop::server
{

    // Who uploaded a file and under which name, independent of where it ends up stored.
    struct UploadAttribution
    {
        std::string owner_token;
        std::string owner_name;
        std::string original_filename;
        std::optional<std::string> upload_id;
    };

    /**
     * Global content hash -> stored filename index.
     *
     * The key is the content hash alone, so identical bytes from different
     * owners resolve to one stored file; per-owner attribution survives only
     * in the upload log. The first stored file for a hash wins. The index is
     * rebuilt from the upload log at construction and kept in memory.
     */
    class HashDeduper
    {
    public:
        explicit HashDeduper(UploadLog &log);

        std::optional<std::string> lookup(const std::string &content_hash) const;

        // Appends a deduped=true entry pointing at the already stored file.
        UploadLogEntry record_duplicate(const UploadAttribution &attribution, const std::string &content_hash,
                                        const std::string &existing_name);

        // Indexes a newly stored file and appends its deduped=false entry.
        UploadLogEntry record_stored(const UploadAttribution &attribution, const std::string &content_hash,
                                     const std::string &saved_name);

        void rebuild();

        std::size_t size() const;

    private:
        UploadLog &log_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::string> index_;
    };

} // namespace mediadrop::server
