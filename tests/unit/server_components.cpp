#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediadrop/crypto.hpp"
#include "mediadrop/server/assembler.hpp"
#include "mediadrop/server/chunk_receiver.hpp"
#include "mediadrop/server/hash_deduper.hpp"
#include "mediadrop/server/janitor.hpp"
#include "mediadrop/server/manifest_store.hpp"
#include "mediadrop/server/owner_directory.hpp"
#include "mediadrop/server/serial_allocator.hpp"
#include "mediadrop/server/storage_layout.hpp"
#include "mediadrop/server/upload_log.hpp"

#include "test_support.hpp"

using namespace mediadrop;
using namespace mediadrop::server;
using namespace mediadrop::test;

namespace
{

    ChunkReceipt submit_chunk(ChunkReceiver &receiver, const std::string &token, const std::string &upload_id,
                              std::uint32_t index, std::uint32_t total, std::string_view bytes,
                              bool payload_first = false)
    {
        auto submission = receiver.begin();
        const auto payload = to_bytes(bytes);
        if (payload_first)
        {
            submission.add_payload(payload);
        }
        submission.add_field("ownerToken", token);
        submission.add_field("uploadId", upload_id);
        submission.add_field("index", std::to_string(index));
        submission.add_field("totalChunks", std::to_string(total));
        submission.add_field("filename", "holiday.jpg");
        submission.add_field("isVideo", "false");
        if (!payload_first)
        {
            submission.add_payload(payload);
        }
        return submission.commit();
    }

    void test_storage_layout_names()
    {
        StorageLayout::validate_upload_id("abc-1.2_X");
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { StorageLayout::validate_upload_id(""); });
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { StorageLayout::validate_upload_id("../escape"); });
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { StorageLayout::validate_upload_id(".hidden"); });
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { StorageLayout::validate_upload_id(std::string(129, 'a')); });

        assert(StorageLayout::sanitize_filename("C:\\Users\\ann\\photo.jpg") == "photo.jpg");
        assert(StorageLayout::sanitize_filename("albums/2024/clip.mov") == "clip.mov");
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { (void)StorageLayout::sanitize_filename("albums/"); });
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { (void)StorageLayout::sanitize_filename(".."); });
        expect_ingest_error(ErrorCode::InvalidRequest, []
                            { (void)StorageLayout::sanitize_filename("bad\nname.jpg"); });

        assert(StorageLayout::sanitize_owner_name("Ann/Lee") == "Ann_Lee");
        assert(StorageLayout::sanitize_owner_name(".hidden") == "_.hidden");
        assert(StorageLayout::sanitize_owner_name("") == "_");

        assert(StorageLayout::extension_of("photo.JPG") == ".JPG");
        assert(StorageLayout::extension_of("archive.tar.gz") == ".gz");
        assert(StorageLayout::extension_of("noext").empty());
        assert(StorageLayout::extension_of(".bashrc").empty());
        assert(StorageLayout::extension_of("trailing.").empty());
    }

    void test_manifest_store()
    {
        TempDir dir("manifest");
        StorageLayout layout(dir.path());
        ManifestStore store(layout);

        assert(!store.get("u1"));
        assert(store.received("u1").empty());

        const UploadManifest manifest{
            .upload_id = "u1",
            .total_chunks = 3,
            .received = {},
            .original_filename = "a.jpg",
            .owner_token = "k",
            .is_video = false,
        };
        assert(store.create(manifest));
        assert(!store.create(manifest));

        ChunkRecord record{.upload_id = "u1", .index = 2, .total_chunks = 3, .original_filename = "a.jpg",
                           .owner_token = "k", .is_video = false};
        store.record_chunk(record);
        record.index = 0;
        record.total_chunks = 7;
        const auto updated = store.record_chunk(record);
        assert(updated.total_chunks == 3);
        assert(updated.received == std::set<std::uint32_t>({0, 2}));
        assert(!updated.complete());

        record.index = 2;
        assert(store.record_chunk(record).received.size() == 2);

        record.index = 3;
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { store.record_chunk(record); });

        assert(store.received("u1") == std::vector<std::uint32_t>({0, 2}));

        // Only the canonical document remains; staging files were renamed away.
        assert(count_entries(layout.manifest_dir()) == 1);

        const auto on_disk = nlohmann::json::parse(read_file(layout.manifest_path("u1")));
        assert(on_disk.at("total_chunks") == 3);
        assert(on_disk.at("received").size() == 2);

        assert(store.remove("u1"));
        assert(!store.remove("u1"));
        assert(!store.get("u1"));
    }

    void test_manifest_corruption_is_absence()
    {
        TempDir dir("manifest_corrupt");
        StorageLayout layout(dir.path());
        ManifestStore store(layout);

        write_file(layout.manifest_path("broken"), "{\"upload_id\": \"broken\", \"total_");
        assert(!store.get("broken"));

        write_file(layout.manifest_path("zero"), R"({"upload_id":"zero","total_chunks":0,"received":[]})");
        assert(!store.get("zero"));

        // A corrupt manifest is replaced by the next chunk instead of wedging the upload.
        const auto manifest = store.record_chunk(ChunkRecord{.upload_id = "broken", .index = 0, .total_chunks = 2,
                                                             .original_filename = "b.png", .owner_token = "k",
                                                             .is_video = false});
        assert(manifest.received.size() == 1);
        assert(store.get("broken")->total_chunks == 2);
    }

    void test_chunk_receiver_out_of_order_and_repeats()
    {
        TempDir dir("chunks");
        StorageLayout layout(dir.path());
        ManifestStore manifests(layout);
        MapOwners owners{{"key-alice", "Alice"}};
        ChunkReceiver receiver(layout, manifests, owners);

        auto receipt = submit_chunk(receiver, "key-alice", "up", 1, 3, "BB");
        assert(receipt.received_count == 1);
        assert(!receipt.complete);

        receipt = submit_chunk(receiver, "key-alice", "up", 0, 3, "AA", true);
        assert(receipt.received_count == 2);

        receipt = submit_chunk(receiver, "key-alice", "up", 1, 3, "B2");
        assert(receipt.received_count == 2);
        assert(read_file(layout.chunk_path("up", 1)) == "B2");

        receipt = submit_chunk(receiver, "key-alice", "up", 2, 3, "CC");
        assert(receipt.received_count == 3);
        assert(receipt.complete);
        assert(receipt.manifest.original_filename == "holiday.jpg");
        assert(receipt.manifest.owner_token == "key-alice");

        // Chunk files plus nothing left over from staging.
        assert(count_entries(layout.chunk_dir()) == 3);
    }

    void test_chunk_receiver_validation()
    {
        TempDir dir("chunk_validation");
        StorageLayout layout(dir.path());
        ManifestStore manifests(layout);
        MapOwners owners{{"key-alice", "Alice"}};
        ChunkReceiver receiver(layout, manifests, owners);

        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("ownerToken", "stolen"); });

        // Bytes staged before a bad token are discarded with the submission.
        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            {
            auto submission = receiver.begin();
            submission.add_payload(to_bytes("zz"));
            submission.add_field("authKey", "stolen"); });
        assert(count_entries(layout.chunk_dir()) == 0);

        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("index", "1x"); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("totalChunks", "0"); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("totalChunks", "2");
            submission.add_field("index", "2"); });
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("uploadId", "../../etc"); });

        expect_ingest_error(ErrorCode::Unauthorized, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("uploadId", "u");
            submission.add_field("index", "0");
            submission.add_field("totalChunks", "1");
            submission.add_payload(to_bytes("x"));
            submission.commit(); });

        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("ownerToken", "key-alice");
            submission.add_field("uploadId", "u");
            submission.add_field("index", "0");
            submission.commit(); });

        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { submit_chunk(receiver, "key-alice", "u", 0, 1, ""); });

        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            {
            auto submission = receiver.begin();
            submission.add_field("ownerToken", "key-alice");
            submission.add_field("uploadId", "nameless");
            submission.add_field("index", "0");
            submission.add_field("totalChunks", "2");
            submission.add_payload(to_bytes("a"));
            submission.commit(); });
        assert(!manifests.get("nameless"));
        assert(!std::filesystem::exists(layout.chunk_path("nameless", 0)));

        submit_chunk(receiver, "key-alice", "named", 0, 2, "a");
        {
            auto submission = receiver.begin();
            submission.add_field("ownerToken", "key-alice");
            submission.add_field("uploadId", "named");
            submission.add_field("index", "1");
            submission.add_field("totalChunks", "2");
            submission.add_payload(to_bytes("b"));
            const auto receipt = submission.commit();
            assert(receipt.complete);
            assert(receipt.manifest.original_filename == "holiday.jpg");
        }

        // Once a manifest exists its total bounds every later index.
        submit_chunk(receiver, "key-alice", "fixed", 0, 2, "a");
        expect_ingest_error(ErrorCode::InvalidRequest, [&]
                            { submit_chunk(receiver, "key-alice", "fixed", 4, 9, "b"); });
        assert(!std::filesystem::exists(layout.chunk_path("fixed", 4)));

        assert(!manifests.get("u"));
        assert(ChunkReceiver::parse_flag(" TRUE "));
        assert(!ChunkReceiver::parse_flag("yes"));
    }

    void test_assembler_merges_in_order()
    {
        TempDir dir("assemble");
        StorageLayout layout(dir.path());
        ManifestStore manifests(layout);
        MapOwners owners{{"key-alice", "Alice"}};
        ChunkReceiver receiver(layout, manifests, owners);
        Assembler assembler(layout, manifests);

        submit_chunk(receiver, "key-alice", "merge", 2, 3, "third");
        submit_chunk(receiver, "key-alice", "merge", 0, 3, "first-");
        submit_chunk(receiver, "key-alice", "merge", 1, 3, "second-");

        const auto assembled = assembler.assemble("merge", 3, ".jpg");
        assert(read_file(assembled.path) == "first-second-third");
        assert(assembled.content_hash == crypto::hash_bytes(to_bytes("first-second-third")));
        assert(assembled.size == 18);
        assert(assembled.path.extension() == ".jpg");
        assert(assembled.path.parent_path() == layout.temp_dir());

        assert(count_entries(layout.chunk_dir()) == 0);
        assert(!manifests.get("merge"));
    }

    void test_assembler_reports_defective_chunks()
    {
        TempDir dir("assemble_defect");
        StorageLayout layout(dir.path());
        ManifestStore manifests(layout);
        MapOwners owners{{"key-alice", "Alice"}};
        ChunkReceiver receiver(layout, manifests, owners);
        Assembler assembler(layout, manifests);

        submit_chunk(receiver, "key-alice", "gap", 0, 4, "a");
        submit_chunk(receiver, "key-alice", "gap", 3, 4, "d");
        write_file(layout.chunk_path("gap", 2), "");

        const auto error = expect_ingest_error(ErrorCode::IntegrityError, [&]
                                               { assembler.assemble("gap", 4, ""); });
        assert(error.defective_indices() == std::vector<std::uint32_t>({1, 2}));
        assert(!error.retryable());

        assert(std::filesystem::exists(layout.chunk_path("gap", 0)));
        assert(std::filesystem::exists(layout.chunk_path("gap", 3)));
        assert(manifests.get("gap")->received.size() == 2);
        assert(count_entries(layout.temp_dir()) == 0);
    }

    void test_upload_log_and_hash_index()
    {
        TempDir dir("dedupe");
        StorageLayout layout(dir.path());
        {
            UploadLog log(layout.upload_log_path());
            HashDeduper deduper(log);
            assert(!deduper.lookup("h1"));

            const UploadAttribution alice{.owner_token = "key-alice", .owner_name = "Alice",
                                          .original_filename = "a.jpg", .upload_id = std::string("up-a")};
            const UploadAttribution bob{.owner_token = "key-bob", .owner_name = "Bob",
                                        .original_filename = "b.jpg", .upload_id = std::nullopt};

            deduper.record_stored(alice, "h1", "Alice_IMG-0000.jpg");
            assert(deduper.lookup("h1") == std::optional<std::string>("Alice_IMG-0000.jpg"));

            const auto duplicate = deduper.record_duplicate(bob, "h1", "Alice_IMG-0000.jpg");
            assert(duplicate.deduped);
            assert(duplicate.saved_name == "Alice_IMG-0000.jpg");
            assert(log.size() == 2);
            assert(deduper.size() == 1);

            assert(log.find_upload("up-a")->saved_name == "Alice_IMG-0000.jpg");
            assert(!log.find_upload("missing"));
        }

        const auto document = nlohmann::json::parse(read_file(layout.upload_log_path()));
        assert(document.is_array());
        assert(document.size() == 2);
        assert(document[0].at("authKey") == "key-alice");
        assert(document[0].at("savedName") == "Alice_IMG-0000.jpg");
        assert(document[0].at("uploadId") == "up-a");
        assert(!document[0].contains("deduped"));
        assert(document[1].at("deduped") == true);
        assert(document[1].at("fullName") == "Bob");
        const std::string timestamp = document[1].at("timestamp");
        assert(timestamp.size() == 24 && timestamp.back() == 'Z');

        // History seeds the index on the next start.
        UploadLog reloaded(layout.upload_log_path());
        HashDeduper rebuilt(reloaded);
        assert(reloaded.size() == 2);
        assert(rebuilt.lookup("h1") == std::optional<std::string>("Alice_IMG-0000.jpg"));
    }

    void test_upload_log_corruption()
    {
        TempDir dir("log_corrupt");
        const auto path = dir.path() / "upload_log.json";

        write_file(path, R"([{"savedName":"A_IMG-0000.jpg","hash":"h"},{"hash":"no-name"},42])");
        {
            UploadLog log(path);
            assert(log.size() == 1);
            assert(log.entries()[0].content_hash == "h");
        }

        write_file(path, "[{\"savedName\": ");
        UploadLog log(path);
        assert(log.size() == 0);
        bool quarantined = false;
        for (const auto &entry : std::filesystem::directory_iterator(dir.path()))
        {
            quarantined = quarantined || entry.path().filename().string().starts_with("upload_log.json.corrupt-");
        }
        assert(quarantined);
        assert(!std::filesystem::exists(path));

        log.append(UploadLogEntry{.owner_token = "k", .owner_name = "A", .original_filename = "x.jpg",
                                  .saved_name = "A_IMG-0000.jpg", .timestamp = "t", .content_hash = "h2"});
        assert(UploadLog(path).size() == 1);
    }

    void test_allocator_serials()
    {
        TempDir dir("alloc");
        SerialAllocator allocator(dir.path());

        auto first = allocator.reserve("Alice", MediaKind::Image, ".jpg");
        assert(first.serial() == 0);
        assert(std::filesystem::is_directory(first.marker_path()));
        assert(first.final_path().filename() == "Alice_IMG-0000.jpg");

        const auto source = dir.path() / "staged.bin";
        write_file(source, "pixels");
        const auto marker = first.marker_path();
        assert(allocator.finalize(std::move(first), source) == "Alice_IMG-0000.jpg");
        assert(!std::filesystem::exists(marker));
        assert(!std::filesystem::exists(source));
        assert(read_file(dir.path() / "Alice_IMG-0000.jpg") == "pixels");

        // Serials ignore the extension.
        auto png = allocator.reserve("Alice", MediaKind::Image, ".png");
        assert(png.serial() == 1);
        const auto png_marker = png.marker_path();
        png.release();
        assert(!png.active());
        assert(!std::filesystem::exists(png_marker));

        auto video = allocator.reserve("Alice", MediaKind::Video, ".mp4");
        assert(video.serial() == 0);
        assert(video.final_path().filename() == "Alice_VID-0000.mp4");

        write_file(dir.path() / "Alice_IMG-0001.heic", "x");
        write_file(dir.path() / "Alice_IMG-0002.serial", "");
        write_file(dir.path() / "Alice_IMG-0003", "x");
        auto next = allocator.reserve("Alice", MediaKind::Image, ".jpg");
        assert(next.serial() == 2);

        write_file(dir.path() / "Alice_IMG-10000.jpg", "x");
        assert(allocator.serial_in_use("Alice", MediaKind::Image, 10000));
        assert(!allocator.serial_in_use("Alice", MediaKind::Image, 1000));
        assert(!allocator.serial_in_use("Bob", MediaKind::Image, 0));

        assert(SerialAllocator::base_name("Ann/Lee", MediaKind::Video, 12) == "Ann_Lee_VID-0012");
    }

    void test_allocator_concurrent_reservations()
    {
        TempDir dir("alloc_concurrent");
        const auto store = dir.path() / "store";
        SerialAllocator allocator(store);
        write_file(store / "Carol_IMG-0004.jpg", "taken");

        constexpr int kWriters = 16;
        std::mutex mutex;
        std::vector<std::string> names;
        std::vector<std::thread> threads;
        for (int i = 0; i < kWriters; ++i)
        {
            threads.emplace_back([&, i]
                                 {
                const auto source = dir.path() / ("src-" + std::to_string(i));
                write_file(source, std::to_string(i));
                auto reservation = allocator.reserve("Carol", MediaKind::Image, ".jpg");
                auto name = allocator.finalize(std::move(reservation), source);
                std::lock_guard lock(mutex);
                names.push_back(std::move(name)); });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        const std::set<std::string> unique(names.begin(), names.end());
        assert(unique.size() == kWriters);
        assert(!unique.contains("Carol_IMG-0004.jpg"));
        assert(read_file(store / "Carol_IMG-0004.jpg") == "taken");
        assert(count_entries(store) == kWriters + 1);
    }

    void test_allocator_reclaims_stale_marker()
    {
        TempDir dir("alloc_stale");
        SerialAllocator allocator(dir.path(), AllocatorOptions{.stale_after = std::chrono::minutes{10}});

        const auto stale = dir.path() / "Dan_IMG-0000.lock";
        std::filesystem::create_directory(stale);
        age(stale, std::chrono::minutes{11});

        const auto fresh = dir.path() / "Dan_VID-0000.lock";
        std::filesystem::create_directory(fresh);

        auto image = allocator.reserve("Dan", MediaKind::Image, ".jpg");
        assert(image.serial() == 0);

        // A live marker is contention: skipped, never reclaimed.
        auto video = allocator.reserve("Dan", MediaKind::Video, ".mov");
        assert(video.serial() == 1);
        assert(std::filesystem::exists(fresh));
    }

    void test_allocator_exhaustion_and_failed_finalize()
    {
        TempDir dir("alloc_exhaust");
        SerialAllocator allocator(dir.path(), AllocatorOptions{.stale_after = std::chrono::minutes{10}, .max_probes = 2});
        write_file(dir.path() / "Eve_IMG-0000.jpg", "a");
        write_file(dir.path() / "Eve_IMG-0001.png", "b");
        expect_ingest_error(ErrorCode::AllocationExhausted, [&]
                            { (void)allocator.reserve("Eve", MediaKind::Image, ".jpg"); });

        auto reservation = allocator.reserve("Eve", MediaKind::Video, ".mp4");
        const auto marker = reservation.marker_path();
        expect_ingest_error(ErrorCode::StorageIOError, [&]
                            { (void)allocator.finalize(std::move(reservation), dir.path() / "missing.bin"); });
        assert(!std::filesystem::exists(marker));
        assert(!std::filesystem::exists(dir.path() / "Eve_VID-0000.mp4"));
    }

    void test_janitor_sweeps_each_category()
    {
        TempDir dir("janitor");
        StorageLayout layout(dir.path());
        constexpr auto kOld = std::chrono::hours{49};

        const auto stale_marker = layout.store_dir() / "A_IMG-0001.lock";
        std::filesystem::create_directory(stale_marker);
        age(stale_marker, std::chrono::minutes{11});
        const auto fresh_marker = layout.store_dir() / "A_IMG-0002.lock";
        std::filesystem::create_directory(fresh_marker);
        const auto placeholder = layout.store_dir() / "A_IMG-0003.serial";
        write_file(placeholder, "");
        age(placeholder, std::chrono::minutes{11});
        const auto stored = layout.store_dir() / "A_IMG-0000.jpg";
        write_file(stored, "keep");
        age(stored, kOld);

        const auto old_chunk = layout.chunk_path("old", 0);
        write_file(old_chunk, "x");
        age(old_chunk, kOld);
        const auto fresh_chunk = layout.chunk_path("new", 0);
        write_file(fresh_chunk, "y");

        const auto old_manifest = layout.manifest_path("old");
        write_file(old_manifest, "{}");
        age(old_manifest, kOld);

        const auto old_merge = layout.temp_dir() / ".merge.abc.jpg";
        write_file(old_merge, "partial");
        age(old_merge, kOld);

        write_file(layout.upload_log_path(), "[]");
        age(layout.upload_log_path(), kOld);
        const auto log_staging = dir.path() / "upload_log.json.tmp.deadbeef";
        write_file(log_staging, "[");
        age(log_staging, kOld);

        Janitor janitor(layout, JanitorOptions{.lock_ttl = std::chrono::minutes{10}, .temp_ttl = std::chrono::hours{48}});
        const auto report = janitor.sweep_once();
        assert(report.markers == 2);
        assert(report.chunks == 1);
        assert(report.manifests == 1);
        assert(report.temp_files == 2);
        assert(report.errors == 0);

        assert(!std::filesystem::exists(stale_marker));
        assert(!std::filesystem::exists(placeholder));
        assert(std::filesystem::exists(fresh_marker));
        assert(std::filesystem::exists(stored));
        assert(!std::filesystem::exists(old_chunk));
        assert(std::filesystem::exists(fresh_chunk));
        assert(!std::filesystem::exists(old_manifest));
        assert(!std::filesystem::exists(old_merge));
        assert(std::filesystem::exists(layout.upload_log_path()));
        assert(!std::filesystem::exists(log_staging));

        assert(janitor.sweep_once().removed() == 0);
    }

    void test_janitor_survives_missing_directories()
    {
        TempDir dir("janitor_missing");
        StorageLayout layout(dir.path());
        std::filesystem::remove_all(layout.chunk_dir());
        std::filesystem::remove_all(layout.temp_dir());

        Janitor janitor(layout, JanitorOptions{});
        const auto report = janitor.sweep_once();
        assert(report.removed() == 0);
        assert(report.errors == 0);
    }

    void test_owner_csv_parsing()
    {
        std::istringstream csv("\xEF\xBB\xBF"
                               "Email,FullName,AuthKey\n"
                               "a@x,\"Lee, Ann\",key-ann\n"
                               "b@x,Bob , key-bob \n"
                               "c@x,No Key,\n"
                               "d@x,,key-nameless\n"
                               "\n");
        const auto owners = OwnerDirectory::parse_csv(csv);
        assert(owners.size() == 2);
        assert(owners.at("key-ann") == "Lee, Ann");
        assert(owners.at("key-bob") == "Bob");

        std::istringstream no_key("Name,Token\nA,B\n");
        bool caught = false;
        try
        {
            (void)OwnerDirectory::parse_csv(no_key);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_owner_directory_reload()
    {
        TempDir dir("owners");
        const auto csv = dir.path() / "users.csv";

        OwnerDirectory missing(dir.path() / "absent.csv");
        assert(missing.size() == 0);
        assert(!missing.find_owner("anything"));

        write_file(csv, "AuthKey,FullName\nk1,Alice\n");
        OwnerDirectory directory(csv);
        assert(directory.size() == 1);
        assert(directory.find_owner("k1") == std::optional<std::string>("Alice"));
        assert(!directory.find_owner(""));
        assert(!directory.reload_if_changed());

        write_file(csv, "AuthKey,FullName\nk1,Alice\nk2,Bob\n");
        std::filesystem::last_write_time(csv, std::filesystem::file_time_type::clock::now() + std::chrono::seconds{5});
        assert(directory.reload_if_changed());
        assert(directory.find_owner("k2") == std::optional<std::string>("Bob"));

        // A broken edit keeps the previous map.
        write_file(csv, "garbage without columns\n");
        std::filesystem::last_write_time(csv, std::filesystem::file_time_type::clock::now() + std::chrono::seconds{10});
        assert(!directory.reload_if_changed());
        assert(directory.size() == 2);
    }

} // namespace

void run_server_component_tests()
{
    test_storage_layout_names();
    test_manifest_store();
    test_manifest_corruption_is_absence();
    test_chunk_receiver_out_of_order_and_repeats();
    test_chunk_receiver_validation();
    test_assembler_merges_in_order();
    test_assembler_reports_defective_chunks();
    test_upload_log_and_hash_index();
    test_upload_log_corruption();
    test_allocator_serials();
    test_allocator_concurrent_reservations();
    test_allocator_reclaims_stale_marker();
    test_allocator_exhaustion_and_failed_finalize();
    test_janitor_sweeps_each_category();
    test_janitor_survives_missing_directories();
    test_owner_csv_parsing();
    test_owner_directory_reload();
    std::cout << "server component tests passed\n";
}
