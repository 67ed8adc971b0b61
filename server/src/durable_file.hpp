#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace mediadrop::server::durable_file
{

    // Writes a uniquely named sibling, fsyncs it and renames it over target.
    // Readers see either the old or the new document, never a mix.
    void write_json_atomic(const std::filesystem::path &target, const nlohmann::json &document);

    // std::nullopt when the file does not exist; throws nlohmann::json::parse_error when it is unparseable.
    std::optional<nlohmann::json> read_json(const std::filesystem::path &path);

    // rename(2) with bounded retries; throws IngestError(StorageIOError) once exhausted.
    void rename_with_retry(const std::filesystem::path &from, const std::filesystem::path &to);

    bool is_staging_name(const std::filesystem::path &path);

} // namespace mediadrop::server::durable_file
