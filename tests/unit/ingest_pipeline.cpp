#include <cassert>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/assembler.hpp"
#include "mediadrop/server/direct_upload.hpp"
#include "mediadrop/server/hash_deduper.hpp"
#include "mediadrop/server/ingest_service.hpp"
#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/serial_allocator.hpp"
#include "mediadrop/server/storage_layout.hpp"
#include "mediadrop/server/upload_log.hpp"

#include "test_support.hpp"

using namespace mediadrop;
using namespace mediadrop::server;
using namespace mediadrop::test;

namespace
{

    struct Pipeline
    {
        explicit Pipeline(bool auto_assemble)
            : dir("pipeline"),
              layout(dir.path()),
              owners{{"key-alice", "Alice"}, {"key-bob", "Bob"}},
              manifests(layout),
              log(layout.upload_log_path()),
              deduper(log),
              allocator(layout.store_dir()),
              assembler(layout, manifests),
              service(layout, manifests, owners, assembler, deduper, allocator, log, auto_assemble)
        {
        }

        // Stored media only, reservation markers excluded.
        std::vector<std::string> stored_files() const
        {
            std::vector<std::string> names;
            for (const auto &entry : std::filesystem::directory_iterator(layout.store_dir()))
            {
                if (entry.is_regular_file())
                {
                    names.push_back(entry.path().filename().string());
                }
            }
            return names;
        }

        TempDir dir;
        StorageLayout layout;
        MapOwners owners;
        ManifestStore manifests;
        UploadLog log;
        HashDeduper deduper;
        SerialAllocator allocator;
        Assembler assembler;
        IngestService service;
    };

    ChunkOutcome send_chunk(IngestService &service, const std::string &token, const std::string &upload_id,
                            std::uint32_t index, std::uint32_t total, std::string_view bytes,
                            const std::string &filename = "abc.jpg")
    {
        auto submission = service.begin_chunk();
        submission.add_field("ownerToken", token);
        submission.add_field("uploadId", upload_id);
        submission.add_field("index", std::to_string(index));
        submission.add_field("totalChunks", std::to_string(total));
        submission.add_field("filename", filename);
        submission.add_payload(to_bytes(bytes));
        return service.accept_chunk(submission);
    }

    FinalizeRequest finalize_request(const std::string &token, const std::string &upload_id, std::uint32_t total,
                                     const std::string &filename = "abc.jpg", bool is_video = false)
    {
        return FinalizeRequest{
            .upload_id = upload_id,
            .total_chunks = total,
            .filename = filename,
            .owner_token = token,
            .is_video = is_video,
        };
    }

    void test_out_of_order_upload_assembles_and_dedupes_across_owners()
    {
        Pipeline pipeline(true);
        auto &service = pipeline.service;

        auto outcome = send_chunk(service, "key-alice", "first", 1, 3, "B");
        assert(!outcome.receipt.complete && !outcome.finalized);
        outcome = send_chunk(service, "key-alice", "first", 0, 3, "A");
        assert(!outcome.finalized);
        assert(service.upload_status("first") == std::vector<std::uint32_t>({0, 1}));

        outcome = send_chunk(service, "key-alice", "first", 2, 3, "C");
        assert(outcome.receipt.complete);
        assert(outcome.finalized.has_value());
        assert(!outcome.finalize_error.has_value());
        const auto first = *outcome.finalized;
        assert(!first.deduped);
        assert(first.saved_name == "Alice_IMG-0000.jpg");
        assert(first.content_hash == crypto::hash_bytes(to_bytes("ABC")));
        assert(read_file(pipeline.layout.store_dir() / first.saved_name) == "ABC");
        assert(service.upload_status("first").empty());

        send_chunk(service, "key-bob", "second", 2, 3, "C", "copy.jpg");
        send_chunk(service, "key-bob", "second", 0, 3, "A", "copy.jpg");
        outcome = send_chunk(service, "key-bob", "second", 1, 3, "B", "copy.jpg");
        assert(outcome.finalized.has_value());
        assert(outcome.finalized->deduped);
        assert(outcome.finalized->saved_name == first.saved_name);
        assert(outcome.finalized->content_hash == first.content_hash);

        assert(pipeline.stored_files() == std::vector<std::string>({"Alice_IMG-0000.jpg"}));
        assert(count_entries(pipeline.layout.temp_dir()) == 0);

        const auto entries = pipeline.log.entries();
        assert(entries.size() == 2);
        assert(!entries[0].deduped && entries[0].owner_name == "Alice");
        assert(entries[1].deduped && entries[1].owner_name == "Bob");
        assert(entries[1].saved_name == entries[0].saved_name);
        assert(entries[1].original_filename == "copy.jpg");
    }

    void test_finalize_reports_missing_chunks_then_recovers()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;

        send_chunk(service, "key-alice", "clip", 0, 3, "v0", "clip.MP4");
        send_chunk(service, "key-alice", "clip", 2, 3, "v2", "clip.MP4");

        const auto error = expect_ingest_error(ErrorCode::IntegrityError, [&]
                                               { service.finalize(finalize_request("key-alice", "clip", 3, "clip.MP4", true)); });
        assert(error.defective_indices() == std::vector<std::uint32_t>({1}));
        assert(service.upload_status("clip") == std::vector<std::uint32_t>({0, 2}));

        const auto ack = send_chunk(service, "key-alice", "clip", 1, 3, "v1", "clip.MP4");
        assert(ack.receipt.complete);
        assert(!ack.finalized);

        const auto stored = service.finalize(finalize_request("key-alice", "clip", 3, "clip.MP4", true));
        assert(stored.saved_name == "Alice_VID-0000.MP4");
        assert(read_file(pipeline.layout.store_dir() / stored.saved_name) == "v0v1v2");

        // A retried finalize answers with the committed result.
        const auto replayed = service.finalize(finalize_request("key-alice", "clip", 3, "clip.MP4", true));
        assert(replayed.replayed);
        assert(replayed.saved_name == stored.saved_name);
        assert(replayed.content_hash == stored.content_hash);
        assert(pipeline.log.size() == 1);

        // Nobody else can replay it.
        expect_ingest_error(ErrorCode::IntegrityError, [&]
                            { service.finalize(finalize_request("key-bob", "clip", 3, "clip.MP4", true)); });
    }

    void test_finalize_rejections()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;
        send_chunk(service, "key-alice", "mine", 0, 2, "x");

        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            { service.finalize(finalize_request("nobody", "mine", 2)); });
        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            { service.finalize(finalize_request("key-bob", "mine", 2)); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { service.finalize(finalize_request("key-alice", "mine", 5)); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { service.finalize(finalize_request("key-alice", "mine", 0)); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { service.finalize(finalize_request("key-alice", "../mine", 2)); });
        expect_ingest_error(ErrorCode::IntegrityError, [&]
                            { service.finalize(finalize_request("key-alice", "unknown", 2)); });

        assert(service.upload_status("mine") == std::vector<std::uint32_t>({0}));
        assert(pipeline.stored_files().empty());
        assert(pipeline.log.size() == 0);
    }

    void test_auto_assembly_failure_is_reported_on_the_ack()
    {
        Pipeline pipeline(true);
        auto &service = pipeline.service;
        send_chunk(service, "key-alice", "lossy", 0, 2, "a");
        std::filesystem::remove(pipeline.layout.chunk_path("lossy", 0));

        const auto outcome = send_chunk(service, "key-alice", "lossy", 1, 2, "b");
        assert(outcome.receipt.complete);
        assert(!outcome.finalized);
        assert(outcome.finalize_error.has_value());
        assert(outcome.finalize_error->code() == ErrorCode::IntegrityError);
        assert(outcome.finalize_error->defective_indices() == std::vector<std::uint32_t>({0}));
    }

    void test_unwritable_merge_area_is_reported_on_the_ack()
    {
        Pipeline pipeline(true);
        auto &service = pipeline.service;
        const auto merge_dir = pipeline.layout.temp_dir();
        std::filesystem::remove_all(merge_dir);
        write_file(merge_dir, "not a directory");

        send_chunk(service, "key-alice", "blocked", 0, 2, "a");
        const auto outcome = send_chunk(service, "key-alice", "blocked", 1, 2, "b");
        assert(outcome.receipt.complete);
        assert(!outcome.finalized);
        assert(outcome.finalize_error.has_value());
        assert(outcome.finalize_error->code() == ErrorCode::StorageIOError);
        assert(outcome.finalize_error->retryable());
        assert(std::filesystem::exists(pipeline.layout.chunk_path("blocked", 0)));
        assert(pipeline.manifests.get("blocked"));

        std::filesystem::remove(merge_dir);
        std::filesystem::create_directories(merge_dir);
        const auto stored = service.finalize(finalize_request("key-alice", "blocked", 2));
        assert(!stored.deduped);
        assert(stored.saved_name == "Alice_IMG-0000.jpg");
    }

    void test_direct_upload()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;

        {
            auto upload = service.begin_direct();
            upload.add_file("beach.jpg", "image/jpeg", to_bytes("sand"));
            upload.add_field("authKey", "key-alice");
            upload.add_file("surf", "video/quicktime", to_bytes("waves"));
            upload.add_file("C:\\tmp\\reel.WEBM", "application/octet-stream", to_bytes("reel"));
            const auto result = upload.commit();
            assert(result.files ==
                   std::vector<std::string>({"Alice_IMG-0000.jpg", "Alice_VID-0000", "Alice_VID-0001.WEBM"}));
            assert(result.deduped.empty());
        }

        {
            auto upload = service.begin_direct();
            upload.add_field("ownerToken", "key-bob");
            upload.add_file("again.jpg", "image/jpeg", to_bytes("sand"));
            const auto result = upload.commit();
            assert(result.files.empty());
            assert(result.deduped == std::vector<std::string>({"Alice_IMG-0000.jpg"}));
        }

        assert(pipeline.stored_files().size() == 3);
        assert(pipeline.log.size() == 4);
        assert(!pipeline.log.entries()[0].upload_id);
        assert(count_entries(pipeline.layout.temp_dir()) == 0);
    }

    void test_direct_upload_without_token_leaves_nothing()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;

        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            {
            auto upload = service.begin_direct();
            upload.add_file("a.jpg", "image/jpeg", to_bytes("1"));
            upload.add_file("b.jpg", "image/jpeg", to_bytes("2"));
            assert(upload.staged_count() == 2);
            (void)upload.commit(); });
        assert(count_entries(pipeline.layout.temp_dir()) == 0);

        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            {
            auto upload = service.begin_direct();
            upload.add_file("a.jpg", "image/jpeg", to_bytes("1"));
            upload.add_field("ownerToken", "forged"); });
        assert(count_entries(pipeline.layout.temp_dir()) == 0);

        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto upload = service.begin_direct();
            upload.add_field("ownerToken", "key-alice");
            (void)upload.commit(); });

        assert(pipeline.stored_files().empty());
        assert(pipeline.log.size() == 0);
    }

    void test_direct_upload_accepts_longest_filenames()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;

        const std::string long_name = std::string(246, 'p') + ".jpeg";
        assert(long_name.size() == 251);
        auto upload = service.begin_direct();
        upload.add_field("ownerToken", "key-alice");
        upload.add_file(long_name, "image/jpeg", to_bytes("long"));
        upload.add_file(std::string(255, 'v'), "video/mp4", to_bytes("longer"));
        const auto result = upload.commit();
        assert(result.files == std::vector<std::string>({"Alice_IMG-0000.jpeg", "Alice_VID-0000"}));
        assert(pipeline.log.entries()[0].original_filename == long_name);
        assert(count_entries(pipeline.layout.temp_dir()) == 0);
    }

    void test_media_kind_detection()
    {
        assert(DirectUpload::media_kind_for("x.jpg", "image/jpeg") == MediaKind::Image);
        assert(DirectUpload::media_kind_for("x.bin", "Video/MP4") == MediaKind::Video);
        assert(DirectUpload::media_kind_for("x.MKV", "") == MediaKind::Video);
        assert(DirectUpload::media_kind_for("x.ogv", "application/octet-stream") == MediaKind::Video);
        assert(DirectUpload::media_kind_for("mp4", "") == MediaKind::Image);
    }

    void test_concurrent_identical_uploads_store_once()
    {
        Pipeline pipeline(false);
        auto &service = pipeline.service;

        constexpr int kUploads = 8;
        std::mutex mutex;
        std::vector<std::string> names;
        std::vector<std::thread> threads;
        for (int i = 0; i < kUploads; ++i)
        {
            threads.emplace_back([&, i]
                                 {
                auto upload = service.begin_direct();
                upload.add_field("ownerToken", i % 2 == 0 ? "key-alice" : "key-bob");
                upload.add_file("same.png", "image/png", to_bytes("identical bytes"));
                auto result = upload.commit();
                std::lock_guard lock(mutex);
                assert(result.files.size() + result.deduped.size() == 1);
                names.push_back(result.files.empty() ? result.deduped.front() : result.files.front()); });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        assert(pipeline.stored_files().size() == 1);
        assert(std::set<std::string>(names.begin(), names.end()).size() == 1);
        std::size_t originals = 0;
        for (const auto &entry : pipeline.log.entries())
        {
            originals += entry.deduped ? 0 : 1;
        }
        assert(originals == 1);
        assert(pipeline.log.size() == kUploads);
    }

} // namespace

void run_ingest_pipeline_tests()
{
    test_out_of_order_upload_assembles_and_dedupes_across_owners();
    test_finalize_reports_missing_chunks_then_recovers();
    test_finalize_rejections();
    test_auto_assembly_failure_is_reported_on_the_ack();
    test_unwritable_merge_area_is_reported_on_the_ack();
    test_direct_upload();
    test_direct_upload_without_token_leaves_nothing();
    test_direct_upload_accepts_longest_filenames();
    test_media_kind_detection();
    test_concurrent_identical_uploads_store_once();
    std::cout << "ingest pipeline tests passed\n";
}
