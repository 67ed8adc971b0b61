#include "mediadrop/server/assembler.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/ingest_error.hpp"

namespace mediadrop::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 256 * 1024;

        std::string join_indices(const std::vector<std::uint32_t> &indices)
        {
            std::ostringstream oss;
            for (std::size_t i = 0; i < indices.size(); ++i)
            {
                if (i > 0)
                {
                    oss << ',';
                }
                oss << indices[i];
            }
            return oss.str();
        }

    } // namespace

    Assembler::Assembler(const StorageLayout &layout, ManifestStore &manifests)
        : layout_(layout), manifests_(manifests)
    {
    }

    std::vector<std::uint32_t> Assembler::find_defective(const std::string &upload_id,
                                                         std::uint32_t total_chunks) const
    {
        std::vector<std::uint32_t> defective;
        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(layout_.chunk_path(upload_id, index), ec);
            if (ec || size == 0)
            {
                defective.push_back(index);
            }
        }
        return defective;
    }

    AssembledFile Assembler::assemble(const std::string &upload_id, std::uint32_t total_chunks,
                                      const std::string &extension)
    {
        const auto defective = find_defective(upload_id, total_chunks);
        if (!defective.empty())
        {
            spdlog::warn("assembly of {} aborted; missing or empty chunks: {}", upload_id, join_indices(defective));
            throw IngestError(mediadrop::ErrorCode::IntegrityError,
                              "Missing or empty chunks: " + join_indices(defective), defective);
        }

        AssembledFile result{.path = layout_.new_merge_path(extension), .content_hash = {}, .size = 0};
        std::error_code dir_ec;
        std::filesystem::create_directories(result.path.parent_path(), dir_ec);
        if (dir_ec)
        {
            spdlog::error("assembly of {} failed: {}", upload_id, dir_ec.message());
            throw IngestError(mediadrop::ErrorCode::StorageIOError,
                              "Failed to prepare " + result.path.parent_path().string() + ": " + dir_ec.message());
        }

        const auto fail = [&](const std::string &message) -> IngestError
        {
            std::error_code ec;
            std::filesystem::remove(result.path, ec);
            spdlog::error("assembly of {} failed: {}", upload_id, message);
            return IngestError(mediadrop::ErrorCode::StorageIOError, message);
        };

        crypto::ContentHasher hasher;
        std::vector<std::byte> buffer(kCopyBufferSize);
        std::ofstream out(result.path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw fail("Failed to open merge output " + result.path.string());
        }

        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            std::ifstream in(layout_.chunk_path(upload_id, index), std::ios::binary);
            if (!in.is_open())
            {
                out.close();
                throw fail("Chunk " + std::to_string(index) + " disappeared during merge");
            }
            while (in)
            {
                in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(in.gcount());
                if (read_count == 0)
                {
                    break;
                }
                const std::span<const std::byte> slice(buffer.data(), read_count);
                hasher.update(slice);
                out.write(reinterpret_cast<const char *>(slice.data()), static_cast<std::streamsize>(slice.size()));
                if (!out)
                {
                    out.close();
                    throw fail("Write to merge output failed at chunk " + std::to_string(index));
                }
            }
            if (in.bad())
            {
                out.close();
                throw fail("Read of chunk " + std::to_string(index) + " failed");
            }
        }

        out.close();
        if (!out)
        {
            throw fail("Failed to close merge output " + result.path.string());
        }

        result.size = hasher.bytes_hashed();
        result.content_hash = hasher.finish();
        spdlog::info("assembled {} ({} chunks, {} bytes, sha256 {})", upload_id, total_chunks, result.size,
                     result.content_hash);

        discard_sources(upload_id, total_chunks);
        return result;
    }

    void Assembler::discard_sources(const std::string &upload_id, std::uint32_t total_chunks)
    {
        // Leftovers are reclaimed by the janitor, so failures here only warn.
        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            std::error_code ec;
            std::filesystem::remove(layout_.chunk_path(upload_id, index), ec);
            if (ec)
            {
                spdlog::warn("Failed to remove chunk {} of {}: {}", index, upload_id, ec.message());
            }
        }
        try
        {
            manifests_.remove(upload_id);
        }
        catch (const IngestError &ex)
        {
            spdlog::warn("{}", ex.what());
        }
    }

} // namespace mediadrop::server
