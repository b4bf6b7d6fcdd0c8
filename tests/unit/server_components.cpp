#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "tusk/server/file_storage.hpp"
#include "tusk/server/metadata_store.hpp"
#include "tusk/server/segmented_storage.hpp"
#include "tusk/server/transfer_coordinator.hpp"
#include "tusk/server/upload_error.hpp"

using namespace tusk;
using namespace tusk::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        std::vector<std::byte> out;
        for (const char c : text)
        {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    std::string text_of(const std::vector<std::byte> &bytes)
    {
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    template <typename F>
    std::optional<ErrorCode> error_of(F &&operation)
    {
        try
        {
            operation();
        }
        catch (const UploadError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void exercise_backend(StorageBackend &storage)
    {
        storage.create_object("upload-1");
        assert(storage.exists("upload-1"));
        assert(storage.length("upload-1") == 0);
        assert(error_of([&]
                        { storage.create_object("upload-1"); }) == ErrorCode::InternalError);

        assert(storage.write_at("upload-1", 0, bytes_of("hello ")) == 6);
        assert(storage.write_at("upload-1", 6, bytes_of("world")) == 11);
        assert(error_of([&]
                        { storage.write_at("upload-1", 3, bytes_of("x")); }) == ErrorCode::OffsetMismatch);
        assert(storage.length("upload-1") == 11);

        auto whole = storage.read_range("upload-1", 0, 11);
        assert(whole->remaining() == 11);
        assert(text_of(read_all(*whole)) == "hello world");

        // Spans the boundary between the two appends.
        auto middle = storage.read_range("upload-1", 4, 8);
        assert(text_of(read_all(*middle)) == "o wo");
        assert(error_of([&]
                        { (void)storage.read_range("upload-1", 5, 12); }) == ErrorCode::InvalidRange);

        storage.truncate("upload-1", 8);
        assert(storage.length("upload-1") == 8);
        assert(storage.write_at("upload-1", 8, bytes_of("rld")) == 11);
        auto again = storage.read_range("upload-1", 0, 11);
        assert(text_of(read_all(*again)) == "hello world");

        assert(error_of([&]
                        { (void)storage.length("missing"); }) == ErrorCode::NotFound);
        assert(!storage.exists("../escape"));

        storage.remove("upload-1");
        assert(!storage.exists("upload-1"));
        storage.remove("upload-1");
    }

    void test_file_storage()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_file_storage_test";
        cleanup_path(temp_root);
        FileStorage storage(temp_root);
        exercise_backend(storage);
        storage.create_object("plain");
        assert(std::filesystem::exists(storage.object_path("plain")));
        cleanup_path(temp_root);
    }

    void test_segmented_storage()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_segmented_storage_test";
        cleanup_path(temp_root);
        SegmentedStorage storage(temp_root);
        exercise_backend(storage);

        storage.create_object("parts");
        storage.write_at("parts", 0, bytes_of("abc"));
        storage.write_at("parts", 3, bytes_of("defg"));
        storage.write_at("parts", 7, {});
        const auto segments = storage.segments("parts");
        assert(segments.size() == 2);
        assert(segments[0].start == 0 && segments[0].size == 3);
        assert(segments[1].start == 3 && segments[1].size == 4);

        storage.truncate("parts", 2);
        assert(storage.segments("parts").size() == 1);
        assert(storage.length("parts") == 2);
        cleanup_path(temp_root);
    }

    void test_make_storage()
    {
        assert(storage_kind_from_string("segmented") == StorageKind::Segmented);
        assert(storage_kind_from_string("file") == StorageKind::File);
        assert(!storage_kind_from_string("s3"));
        assert(to_string(StorageKind::Segmented) == "segmented");

        assert(is_valid_upload_id("a1B2_c-3"));
        assert(!is_valid_upload_id(""));
        assert(!is_valid_upload_id("a/b"));
        assert(!is_valid_upload_id(".."));

        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_make_storage_test";
        cleanup_path(temp_root);
        auto storage = make_storage(StorageKind::Segmented, temp_root);
        assert(dynamic_cast<SegmentedStorage *>(storage.get()) != nullptr);
        cleanup_path(temp_root);
    }

    void test_metadata_store_lifecycle()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_metadata_store_test";
        cleanup_path(temp_root);

        std::string id;
        {
            MetadataStore store(temp_root);
            const auto info = store.create(10, tus::Metadata{{"filename", "a.bin"}});
            id = info.id;
            assert(is_valid_upload_id(id));
            assert(info.offset == 0);
            assert(!info.completed());
            assert(std::filesystem::exists(store.record_path(id)));

            assert(store.advance_offset(id, 4).offset == 4);
            assert(error_of([&]
                            { store.advance_offset(id, 3); }) == ErrorCode::InvalidOffset);
            assert(error_of([&]
                            { store.advance_offset(id, 11); }) == ErrorCode::InvalidOffset);
            assert(error_of([&]
                            { store.set_length(id, 12); }) == ErrorCode::AlreadySet);
            assert(error_of([&]
                            { store.advance_offset("nope", 1); }) == ErrorCode::NotFound);

            const auto deferred = store.create(std::nullopt, {});
            assert(deferred.length_deferred());
            store.advance_offset(deferred.id, 5);
            assert(error_of([&]
                            { store.set_length(deferred.id, 4); }) == ErrorCode::InvalidLength);
            assert(store.set_length(deferred.id, 5).completed());
            store.mark_notified(deferred.id);
        }

        // Records survive a restart.
        MetadataStore reloaded(temp_root);
        const auto info = reloaded.get(id);
        assert(info);
        assert(info->offset == 4);
        assert(info->length == std::optional<std::uint64_t>(10));
        assert(info->metadata.at("filename") == "a.bin");
        assert(reloaded.list().size() == 2);
        for (const auto &entry : reloaded.list())
        {
            if (entry.id != id)
            {
                assert(entry.completion_notified);
            }
        }

        assert(reloaded.remove(id));
        assert(!reloaded.remove(id));
        assert(!reloaded.get(id));
        assert(!std::filesystem::exists(reloaded.record_path(id)));

        cleanup_path(temp_root);
    }

    void test_metadata_store_skips_malformed_records()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "tusk_metadata_malformed_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        {
            std::ofstream out(temp_root / "broken.info");
            out << "{not json";
        }
        {
            std::ofstream out(temp_root / "renamed.info");
            out << nlohmann::json{{"id", "other"}, {"offset", 0}}.dump();
        }

        MetadataStore store(temp_root);
        assert(store.list().empty());
        cleanup_path(temp_root);
    }

    void test_coordinator_serializes_same_id()
    {
        TransferCoordinator coordinator(std::chrono::milliseconds(2000));
        auto first = coordinator.acquire("abc");
        assert(coordinator.in_flight("abc"));
        assert(!coordinator.try_acquire("abc"));
        assert(coordinator.try_acquire("other"));

        std::atomic<bool> second_done{false};
        std::atomic<bool> saw_terminated{false};
        std::thread waiter([&]
                           {
            auto second = coordinator.acquire("abc");
            saw_terminated = second.terminated();
            second_done = true; });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(!second_done);
        first.mark_terminated();
        {
            auto released = std::move(first);
        }
        waiter.join();
        assert(second_done);
        assert(saw_terminated);

        // The slot is gone once nobody holds it; a fresh holder starts clean.
        assert(!coordinator.in_flight("abc"));
        auto fresh = coordinator.acquire("abc");
        assert(!fresh.terminated());
    }

    void test_coordinator_times_out()
    {
        TransferCoordinator coordinator(std::chrono::milliseconds(20));
        auto held = coordinator.acquire("slow");
        std::optional<ErrorCode> code;
        std::thread contender([&]
                              { code = error_of([&]
                                                { (void)coordinator.acquire("slow"); }); });
        contender.join();
        assert(code == ErrorCode::Busy);
    }

    class FlakyObserver : public CompletionObserver
    {
    public:
        void on_upload_completed(const CompletionEvent &event) override
        {
            if (failures_left > 0)
            {
                --failures_left;
                throw std::runtime_error("observer offline");
            }
            received.push_back(event.id);
        }

        void on_completion_settled(const std::string &id) override { settled.push_back(id); }

        int failures_left{1};
        std::vector<std::string> received;
        std::vector<std::string> settled;
    };

    void test_coordinator_redelivers_failed_events()
    {
        TransferCoordinator coordinator(std::chrono::milliseconds(100));
        auto observer = std::make_shared<FlakyObserver>();
        coordinator.subscribe(observer);

        assert(!coordinator.publish_completion(CompletionEvent{"u1", 3, {}}));
        assert(coordinator.pending_count() == 1);
        assert(observer->received.empty());
        assert(observer->settled.empty());

        const auto delivered = coordinator.redeliver_pending();
        assert(delivered == std::vector<std::string>{"u1"});
        assert(coordinator.pending_count() == 0);
        assert(observer->received == std::vector<std::string>{"u1"});
        assert(observer->settled == std::vector<std::string>{"u1"});

        assert(coordinator.publish_completion(CompletionEvent{"u2", 0, {}}));
        assert(coordinator.redeliver_pending().empty());
        assert((observer->settled == std::vector<std::string>{"u1", "u2"}));
    }

} // namespace

void run_server_component_tests()
{
    test_file_storage();
    test_segmented_storage();
    test_make_storage();
    test_metadata_store_lifecycle();
    test_metadata_store_skips_malformed_records();
    test_coordinator_serializes_same_id();
    test_coordinator_times_out();
    test_coordinator_redelivers_failed_events();
}
