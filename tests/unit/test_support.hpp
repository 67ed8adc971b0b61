#pragma once

#include <cassert>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/ingest_error.hpp"
#include "mediadrop/server/owner_directory.hpp"

namespace mediadrop::test
{

    // Unique scratch directory removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &label)
            : path_(std::filesystem::temp_directory_path() / ("mediadrop_" + label + "_" + crypto::random_hex(6)))
        {
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    class MapOwners : public server::OwnerLookup
    {
    public:
        MapOwners(std::initializer_list<std::pair<const std::string, std::string>> owners) : owners_(owners) {}

        std::optional<std::string> find_owner(std::string_view token) const override
        {
            const auto it = owners_.find(std::string(token));
            if (it == owners_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::size_t size() const override { return owners_.size(); }

    private:
        std::map<std::string, std::string> owners_;
    };

    inline std::vector<std::byte> to_bytes(std::string_view text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

    inline void write_file(const std::filesystem::path &path, std::string_view content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Backdates a file or directory so TTL checks see it as old.
    inline void age(const std::filesystem::path &path, std::chrono::seconds by)
    {
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - by);
    }

    inline std::size_t count_entries(const std::filesystem::path &directory)
    {
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(directory),
                                                      std::filesystem::directory_iterator()));
    }

    template <typename Fn>
    server::IngestError expect_ingest_error(mediadrop::ErrorCode expected, Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const server::IngestError &ex)
        {
            assert(ex.code() == expected);
            return ex;
        }
        assert(false && "expected IngestError");
        throw std::logic_error("expected IngestError");
    }

} // namespace mediadrop::test
