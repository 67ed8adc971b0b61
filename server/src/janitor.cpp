#include "mediadrop/server/janitor.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "durable_file.hpp"
#include "mediadrop/server/serial_allocator.hpp"

namespace mediadrop::server
{

    namespace
    {

        bool has_suffix(const std::filesystem::path &path, std::string_view suffix)
        {
            return path.filename().string().ends_with(suffix);
        }

    } // namespace

    Janitor::Janitor(const StorageLayout &layout, JanitorOptions options) : layout_(layout), options_(options) {}

    SweepReport Janitor::sweep_once()
    {
        SweepReport report{};

        try
        {
            report.markers = sweep_directory(
                layout_.store_dir(), options_.lock_ttl,
                [](const std::filesystem::directory_entry &entry)
                {
                    return has_suffix(entry.path(), SerialAllocator::kMarkerSuffix) ||
                           has_suffix(entry.path(), SerialAllocator::kLegacyPlaceholderSuffix);
                },
                report.errors);
        }
        catch (const std::exception &ex)
        {
            ++report.errors;
            spdlog::warn("janitor: marker sweep failed: {}", ex.what());
        }

        try
        {
            report.chunks = sweep_directory(
                layout_.chunk_dir(), options_.temp_ttl,
                [](const std::filesystem::directory_entry &entry)
                { return entry.is_regular_file(); },
                report.errors);
        }
        catch (const std::exception &ex)
        {
            ++report.errors;
            spdlog::warn("janitor: chunk sweep failed: {}", ex.what());
        }

        try
        {
            report.manifests = sweep_directory(
                layout_.manifest_dir(), options_.temp_ttl,
                [](const std::filesystem::directory_entry &entry)
                {
                    return entry.path().extension() == ".json" || durable_file::is_staging_name(entry.path());
                },
                report.errors);
        }
        catch (const std::exception &ex)
        {
            ++report.errors;
            spdlog::warn("janitor: manifest sweep failed: {}", ex.what());
        }

        try
        {
            report.temp_files = sweep_directory(
                layout_.temp_dir(), options_.temp_ttl,
                [](const std::filesystem::directory_entry &) { return true; }, report.errors);

            const auto log_name = layout_.upload_log_path().filename().string();
            report.temp_files += sweep_directory(
                layout_.root(), options_.temp_ttl,
                [&log_name](const std::filesystem::directory_entry &entry)
                {
                    return entry.path().filename().string().starts_with(log_name) &&
                           durable_file::is_staging_name(entry.path());
                },
                report.errors);
        }
        catch (const std::exception &ex)
        {
            ++report.errors;
            spdlog::warn("janitor: temp sweep failed: {}", ex.what());
        }

        if (report.removed() > 0 || report.errors > 0)
        {
            spdlog::info("janitor: removed {} markers, {} chunks, {} manifests, {} temp files ({} errors)",
                         report.markers, report.chunks, report.manifests, report.temp_files, report.errors);
        }
        return report;
    }

    std::size_t Janitor::sweep_directory(const std::filesystem::path &directory, std::chrono::seconds ttl,
                                         const Filter &filter, std::size_t &errors) const
    {
        std::error_code ec;
        if (!std::filesystem::exists(directory, ec))
        {
            return 0;
        }

        const auto now = std::filesystem::file_time_type::clock::now();
        std::size_t removed = 0;
        for (const auto &entry : std::filesystem::directory_iterator(directory))
        {
            if (!filter(entry))
            {
                continue;
            }
            const auto modified = entry.last_write_time(ec);
            if (ec)
            {
                // Already gone.
                continue;
            }
            if (now - modified <= ttl)
            {
                continue;
            }
            std::filesystem::remove_all(entry.path(), ec);
            if (ec)
            {
                ++errors;
                spdlog::warn("janitor: failed to remove {}: {}", entry.path().string(), ec.message());
                continue;
            }
            spdlog::info("janitor: removed {}", entry.path().filename().string());
            ++removed;
        }
        return removed;
    }

} // namespace mediadrop::server
