#include "mediadrop/server/owner_directory.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

namespace mediadrop::server
{

    namespace
    {
        constexpr std::string_view kKeyColumn = "AuthKey";
        constexpr std::string_view kNameColumn = "FullName";
        constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

        std::string trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return std::string(value.substr(first, last - first + 1));
        }

        std::vector<std::string> split_csv_line(std::string_view line)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;
            for (std::size_t i = 0; i < line.size(); ++i)
            {
                const char ch = line[i];
                if (quoted)
                {
                    if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        current.push_back('"');
                        ++i;
                    }
                    else if (ch == '"')
                    {
                        quoted = false;
                    }
                    else
                    {
                        current.push_back(ch);
                    }
                }
                else if (ch == '"')
                {
                    quoted = true;
                }
                else if (ch == ',')
                {
                    fields.push_back(trim(current));
                    current.clear();
                }
                else
                {
                    current.push_back(ch);
                }
            }
            fields.push_back(trim(current));
            return fields;
        }

        std::optional<std::size_t> column_index(const std::vector<std::string> &header, std::string_view name)
        {
            const auto it = std::find(header.begin(), header.end(), name);
            if (it == header.end())
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(std::distance(header.begin(), it));
        }

    } // namespace

    OwnerDirectory::OwnerDirectory(std::filesystem::path csv_path) : csv_path_(std::move(csv_path))
    {
        if (!reload())
        {
            spdlog::warn("No owners loaded from {}; every token will be rejected", csv_path_.string());
        }
    }

    std::optional<std::string> OwnerDirectory::find_owner(std::string_view token) const
    {
        if (token.empty())
        {
            return std::nullopt;
        }
        std::lock_guard lock(mutex_);
        const auto it = owners_.find(std::string(token));
        if (it == owners_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t OwnerDirectory::size() const
    {
        std::lock_guard lock(mutex_);
        return owners_.size();
    }

    bool OwnerDirectory::reload()
    {
        std::error_code ec;
        const auto mtime = std::filesystem::last_write_time(csv_path_, ec);
        std::ifstream in(csv_path_);
        if (ec || !in.is_open())
        {
            spdlog::error("Owner reload failed: cannot open {}", csv_path_.string());
            return false;
        }
        try
        {
            auto owners = parse_csv(in);
            std::lock_guard lock(mutex_);
            owners_ = std::move(owners);
            loaded_mtime_ = mtime;
            spdlog::info("Owners reloaded from {} ({} entries)", csv_path_.string(), owners_.size());
            return true;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Owner reload failed for {}: {}", csv_path_.string(), ex.what());
            return false;
        }
    }

    bool OwnerDirectory::reload_if_changed()
    {
        std::error_code ec;
        const auto mtime = std::filesystem::last_write_time(csv_path_, ec);
        if (ec)
        {
            return false;
        }
        {
            std::lock_guard lock(mutex_);
            if (loaded_mtime_ && *loaded_mtime_ == mtime)
            {
                return false;
            }
        }
        return reload();
    }

    std::unordered_map<std::string, std::string> OwnerDirectory::parse_csv(std::istream &input)
    {
        std::unordered_map<std::string, std::string> owners;
        std::string line;
        if (!std::getline(input, line))
        {
            return owners;
        }
        if (line.starts_with(kUtf8Bom))
        {
            line.erase(0, kUtf8Bom.size());
        }
        const auto header = split_csv_line(line);
        const auto key_column = column_index(header, kKeyColumn);
        if (!key_column)
        {
            throw std::runtime_error("CSV header has no AuthKey column");
        }
        const auto name_column = column_index(header, kNameColumn);

        while (std::getline(input, line))
        {
            const auto fields = split_csv_line(line);
            if (*key_column >= fields.size() || fields[*key_column].empty())
            {
                continue;
            }
            std::string name;
            if (name_column && *name_column < fields.size())
            {
                name = fields[*name_column];
            }
            if (name.empty())
            {
                continue;
            }
            owners[fields[*key_column]] = std::move(name);
        }
        return owners;
    }

} // namespace mediadrop::server
