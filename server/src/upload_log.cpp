#include "mediadrop/server/upload_log.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "durable_file.hpp"

namespace mediadrop::server
{

    namespace
    {

        // Key names match logs written by earlier deployments so their history still seeds the hash index.
        nlohmann::json to_json(const UploadLogEntry &entry)
        {
            nlohmann::json json = {
                {"authKey", entry.owner_token},
                {"fullName", entry.owner_name},
                {"originalName", entry.original_filename},
                {"savedName", entry.saved_name},
                {"timestamp", entry.timestamp},
                {"hash", entry.content_hash},
            };
            if (entry.deduped)
            {
                json["deduped"] = true;
            }
            if (entry.upload_id)
            {
                json["uploadId"] = *entry.upload_id;
            }
            return json;
        }

        UploadLogEntry entry_from_json(const nlohmann::json &json)
        {
            UploadLogEntry entry{};
            entry.owner_token = json.value("authKey", std::string{});
            entry.owner_name = json.value("fullName", std::string{});
            entry.original_filename = json.value("originalName", std::string{});
            entry.saved_name = json.at("savedName").get<std::string>();
            entry.timestamp = json.value("timestamp", std::string{});
            entry.content_hash = json.value("hash", std::string{});
            entry.deduped = json.value("deduped", false);
            if (auto it = json.find("uploadId"); it != json.end() && it->is_string())
            {
                entry.upload_id = it->get<std::string>();
            }
            return entry;
        }

    } // namespace

    UploadLog::UploadLog(std::filesystem::path path) : path_(std::move(path))
    {
        load();
    }

    void UploadLog::append(UploadLogEntry entry)
    {
        std::lock_guard lock(mutex_);
        entries_.push_back(std::move(entry));
        try
        {
            persist_locked();
        }
        catch (...)
        {
            entries_.pop_back();
            throw;
        }
    }

    std::vector<UploadLogEntry> UploadLog::entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::size_t UploadLog::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    std::optional<UploadLogEntry> UploadLog::find_upload(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
        {
            if (it->upload_id && *it->upload_id == upload_id)
            {
                return *it;
            }
        }
        return std::nullopt;
    }

    std::string UploadLog::format_timestamp(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();
        const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
        std::tm utc{};
        gmtime_r(&raw, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }

    void UploadLog::load()
    {
        std::lock_guard lock(mutex_);
        entries_.clear();

        // A history that cannot be read is moved aside rather than overwritten by the next append.
        const auto quarantine = [this](const std::string &reason)
        {
            auto target = path_;
            target += ".corrupt-" + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                                       std::chrono::system_clock::now().time_since_epoch())
                                                       .count());
            std::error_code ec;
            std::filesystem::rename(path_, target, ec);
            spdlog::warn("Upload log {} {}; moved to {}{}", path_.string(), reason, target.string(),
                         ec ? " failed: " + ec.message() : std::string{});
        };

        std::optional<nlohmann::json> document;
        try
        {
            document = durable_file::read_json(path_);
        }
        catch (const nlohmann::json::exception &ex)
        {
            quarantine(std::string("unparseable (") + ex.what() + ")");
            return;
        }
        if (!document)
        {
            return;
        }
        if (!document->is_array())
        {
            quarantine("is not an array");
            return;
        }
        std::size_t skipped = 0;
        for (const auto &item : *document)
        {
            try
            {
                entries_.push_back(entry_from_json(item));
            }
            catch (const nlohmann::json::exception &)
            {
                ++skipped;
            }
        }
        if (skipped > 0)
        {
            spdlog::warn("Upload log {}: skipped {} unreadable entries", path_.string(), skipped);
        }
        spdlog::info("Upload log loaded: {} entries", entries_.size());
    }

    void UploadLog::persist_locked() const
    {
        nlohmann::json document = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            document.push_back(to_json(entry));
        }
        durable_file::write_json_atomic(path_, document);
    }

} // namespace mediadrop::server
