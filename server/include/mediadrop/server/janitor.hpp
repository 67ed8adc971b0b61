#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>

#include "mediadrop/server/storage_layout.hpp"

namespace mediadrop::server
{

    struct JanitorOptions
    {
        std::chrono::seconds lock_ttl{std::chrono::minutes{10}};
        std::chrono::seconds temp_ttl{std::chrono::hours{48}};
    };

    struct SweepReport
    {
        std::size_t markers{};
        std::size_t chunks{};
        std::size_t manifests{};
        std::size_t temp_files{};
        std::size_t errors{};

        std::size_t removed() const noexcept { return markers + chunks + manifests + temp_files; }
    };

    // Removes reservation markers past the lock TTL and chunk, manifest and
    // merge leftovers past the temp TTL. Each category is swept on its own;
    // failures are logged and counted, never thrown.
    class Janitor
    {
    public:
        Janitor(const StorageLayout &layout, JanitorOptions options);

        SweepReport sweep_once();

        const JanitorOptions &options() const noexcept { return options_; }

    private:
        using Filter = std::function<bool(const std::filesystem::directory_entry &)>;

        std::size_t sweep_directory(const std::filesystem::path &directory, std::chrono::seconds ttl,
                                    const Filter &filter, std::size_t &errors) const;

        const StorageLayout &layout_;
        JanitorOptions options_;
    };

} // namespace mediadrop::server
