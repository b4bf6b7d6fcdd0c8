#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "tusk/http.hpp"
#include "tusk/server/metadata_store.hpp"
#include "tusk/server/storage_backend.hpp"
#include "tusk/server/transfer_coordinator.hpp"
#include "tusk/tus.hpp"

namespace tusk::server
{

    struct RequestContext
    {
        std::string method;
        std::string target;
        http::Headers headers;
        std::string remote;
    };

    struct AuthDecision
    {
        bool allowed{true};
        std::string reason;

        static AuthDecision allow() { return {}; }
        static AuthDecision deny(std::string reason) { return {.allowed = false, .reason = std::move(reason)}; }
    };

    using Authorizer = std::function<AuthDecision(const RequestContext &)>;

    struct CreateRequest
    {
        std::optional<std::int64_t> length;
        bool defer_length{};
        tus::Metadata metadata;
    };

    // Returns the metadata to store; must not touch shared state.
    using MetadataHook = std::function<tus::Metadata(const CreateRequest &, const RequestContext &)>;

    struct AppendRequest
    {
        std::string id;
        std::uint64_t expected_offset{};
        std::span<const std::byte> payload;
        std::optional<tus::Checksum> checksum;
        // Lets a deferred upload fix its length in the same request.
        std::optional<std::int64_t> declare_length;
    };

    enum class UploadPhase
    {
        Created,
        Receiving,
        Completed
    };

    std::string_view to_string(UploadPhase phase) noexcept;

    struct UploadStatus
    {
        UploadInfo info;
        UploadPhase phase{UploadPhase::Created};
        std::optional<std::chrono::system_clock::time_point> expires_at;
    };

    struct EngineOptions
    {
        std::optional<std::uint64_t> max_size;
        // Incomplete uploads idle for longer are reaped.
        std::chrono::seconds retention{std::chrono::hours{24}};
        // Completed uploads are kept forever when unset.
        std::optional<std::chrono::seconds> completed_retention;
        MetadataHook pre_create;
        Authorizer authorizer;
    };

    struct RecoveryReport
    {
        std::size_t truncated{};
        std::size_t removed{};
        std::size_t republished{};
    };

    /**
     * The tus state machine: Created -> Receiving -> Completed, with termination from any state.
     *
     * Every public operation taking a RequestContext runs the authorizer first. Validation errors are raised
     * before anything is mutated. Appends hold the coordinator lock for the upload across
     * validate -> write -> advance, and bytes are written before the offset moves, so a failure at any point
     * leaves the upload at its previous offset.
     */
    class UploadEngine
    {
    public:
        UploadEngine(StorageBackend &storage, MetadataStore &metadata, TransferCoordinator &coordinator,
                     EngineOptions options);

        UploadStatus create(const RequestContext &context, const CreateRequest &request,
                            std::span<const std::byte> initial_payload = {},
                            const std::optional<tus::Checksum> &checksum = std::nullopt);

        UploadStatus append(const RequestContext &context, const AppendRequest &request);

        UploadStatus set_deferred_length(const RequestContext &context, const std::string &id, std::int64_t length);

        UploadStatus head(const RequestContext &context, const std::string &id) const;

        // Idempotent; unknown ids succeed.
        void terminate(const RequestContext &context, const std::string &id);

        std::unique_ptr<ByteReader> read(const RequestContext &context, const std::string &id, std::uint64_t start,
                                         std::uint64_t end) const;

        std::size_t reap_expired(std::chrono::system_clock::time_point now);

        // Retries completion events that an observer rejected earlier.
        std::size_t redeliver_completions();

        RecoveryReport recover();

        const EngineOptions &options() const noexcept { return options_; }

    private:
        void authorize(const RequestContext &context) const;
        UploadStatus status_of(const UploadInfo &info) const;
        UploadInfo require(const std::string &id) const;
        std::uint64_t validate_length(std::int64_t length) const;
        UploadStatus append_locked(const TransferCoordinator::UploadLock &lock, const AppendRequest &request);
        void remove_locked(TransferCoordinator::UploadLock &lock);
        void notify_completed(const UploadInfo &info);

        StorageBackend &storage_;
        MetadataStore &metadata_;
        TransferCoordinator &coordinator_;
        EngineOptions options_;
    };

} // namespace tusk::server
