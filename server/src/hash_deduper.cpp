#include "mediadrop/server/hash_deduper.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace mediadrop::server
{

    namespace
    {

        UploadLogEntry make_entry(const UploadAttribution &attribution, const std::string &content_hash,
                                  const std::string &saved_name, bool deduped)
        {
            return UploadLogEntry{
                .owner_token = attribution.owner_token,
                .owner_name = attribution.owner_name,
                .original_filename = attribution.original_filename,
                .saved_name = saved_name,
                .timestamp = UploadLog::format_timestamp(std::chrono::system_clock::now()),
                .content_hash = content_hash,
                .deduped = deduped,
                .upload_id = attribution.upload_id,
            };
        }

    } // namespace

    HashDeduper::HashDeduper(UploadLog &log) : log_(log)
    {
        rebuild();
    }

    std::optional<std::string> HashDeduper::lookup(const std::string &content_hash) const
    {
        std::lock_guard lock(mutex_);
        const auto it = index_.find(content_hash);
        if (it == index_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    UploadLogEntry HashDeduper::record_duplicate(const UploadAttribution &attribution, const std::string &content_hash,
                                                 const std::string &existing_name)
    {
        auto entry = make_entry(attribution, content_hash, existing_name, true);
        log_.append(entry);
        spdlog::info("dedupe hit: {} from {} resolves to {}", attribution.original_filename, attribution.owner_name,
                     existing_name);
        return entry;
    }

    UploadLogEntry HashDeduper::record_stored(const UploadAttribution &attribution, const std::string &content_hash,
                                              const std::string &saved_name)
    {
        {
            // The file is already on disk, so index it even if the log append below fails.
            std::lock_guard lock(mutex_);
            index_.try_emplace(content_hash, saved_name);
        }
        auto entry = make_entry(attribution, content_hash, saved_name, false);
        log_.append(entry);
        return entry;
    }

    void HashDeduper::rebuild()
    {
        std::unordered_map<std::string, std::string> index;
        for (const auto &entry : log_.entries())
        {
            if (!entry.content_hash.empty() && !entry.saved_name.empty())
            {
                index.try_emplace(entry.content_hash, entry.saved_name);
            }
        }
        std::lock_guard lock(mutex_);
        index_ = std::move(index);
        spdlog::info("Hash index rebuilt: {} unique files", index_.size());
    }

    std::size_t HashDeduper::size() const
    {
        std::lock_guard lock(mutex_);
        return index_.size();
    }

} // namespace mediadrop::server
