#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mediadrop::server
{

    class OwnerLookup
    {
    public:
        virtual ~OwnerLookup() = default;

        virtual std::optional<std::string> find_owner(std::string_view token) const = 0;

        virtual std::size_t size() const = 0;
    };

    // Token -> owner name map loaded from a CSV file with AuthKey and FullName
    // columns. reload_if_changed() is polled by the server so edits to the file
    // take effect without a restart.
    class OwnerDirectory : public OwnerLookup
    {
    public:
        explicit OwnerDirectory(std::filesystem::path csv_path);

        std::optional<std::string> find_owner(std::string_view token) const override;
        std::size_t size() const override;

        // Returns false and keeps the current map if the file cannot be read.
        bool reload();
        bool reload_if_changed();

        const std::filesystem::path &path() const noexcept { return csv_path_; }

        static std::unordered_map<std::string, std::string> parse_csv(std::istream &input);

    private:
        std::filesystem::path csv_path_;
        std::optional<std::filesystem::file_time_type> loaded_mtime_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::string> owners_;
    };

} // namespace mediadrop::server
