#include "tusk/server/upload_engine.hpp"

#include <limits>

#include <spdlog/spdlog.h>

#include "tusk/crypto.hpp"
#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    namespace
    {

        void verify_checksum(const tus::Checksum &checksum, std::span<const std::byte> payload)
        {
            const auto computed = crypto::digest(checksum.algorithm, payload);
            if (!computed)
            {
                throw UploadError(ErrorCode::UnsupportedChecksum,
                                  "Unsupported checksum algorithm " + checksum.algorithm);
            }
            if (*computed != checksum.digest)
            {
                throw UploadError(ErrorCode::ChecksumMismatch, "Checksum mismatch");
            }
        }

        std::uint64_t checked_end(std::uint64_t offset, std::size_t size)
        {
            const auto extra = static_cast<std::uint64_t>(size);
            if (extra > std::numeric_limits<std::uint64_t>::max() - offset)
            {
                throw UploadError(ErrorCode::LengthExceeded, "Payload overflows upload offset");
            }
            return offset + extra;
        }

    } // namespace

    std::string_view to_string(UploadPhase phase) noexcept
    {
        switch (phase)
        {
        case UploadPhase::Created:
            return "created";
        case UploadPhase::Receiving:
            return "receiving";
        case UploadPhase::Completed:
            return "completed";
        }
        return "unknown";
    }

    UploadEngine::UploadEngine(StorageBackend &storage, MetadataStore &metadata, TransferCoordinator &coordinator,
                               EngineOptions options)
        : storage_(storage), metadata_(metadata), coordinator_(coordinator), options_(std::move(options))
    {
    }

    UploadStatus UploadEngine::create(const RequestContext &context, const CreateRequest &request,
                                      std::span<const std::byte> initial_payload,
                                      const std::optional<tus::Checksum> &checksum)
    {
        authorize(context);

        if (request.defer_length == request.length.has_value())
        {
            throw UploadError(ErrorCode::InvalidLength, "Exactly one of a length or a deferred length is required");
        }
        std::optional<std::uint64_t> length;
        if (request.length)
        {
            length = validate_length(*request.length);
        }

        if (!initial_payload.empty())
        {
            const auto size = static_cast<std::uint64_t>(initial_payload.size());
            if ((length && size > *length) || (options_.max_size && size > *options_.max_size))
            {
                throw UploadError(ErrorCode::LengthExceeded, "Initial payload exceeds upload length");
            }
            if (checksum)
            {
                verify_checksum(*checksum, initial_payload);
            }
        }

        auto metadata = options_.pre_create ? options_.pre_create(request, context) : request.metadata;
        auto info = metadata_.create(length, std::move(metadata));
        try
        {
            storage_.create_object(info.id);
        }
        catch (const UploadError &)
        {
            metadata_.remove(info.id);
            throw;
        }
        spdlog::info("Created upload {} (length {})", info.id,
                     info.length ? std::to_string(*info.length) : std::string("deferred"));

        if (!initial_payload.empty())
        {
            auto lock = coordinator_.acquire(info.id);
            return append_locked(lock, AppendRequest{
                                           .id = info.id,
                                           .expected_offset = 0,
                                           .payload = initial_payload,
                                           .checksum = std::nullopt,
                                           .declare_length = std::nullopt,
                                       });
        }
        if (info.completed())
        {
            notify_completed(info);
        }
        return status_of(info);
    }

    UploadStatus UploadEngine::append(const RequestContext &context, const AppendRequest &request)
    {
        authorize(context);
        auto lock = coordinator_.acquire(request.id);
        return append_locked(lock, request);
    }

    UploadStatus UploadEngine::append_locked(const TransferCoordinator::UploadLock &lock, const AppendRequest &request)
    {
        if (lock.terminated())
        {
            throw UploadError(ErrorCode::Terminated, "Upload " + request.id + " was terminated");
        }
        auto info = require(request.id);
        const bool was_completed = info.completed();

        std::optional<std::uint64_t> new_length;
        if (request.declare_length)
        {
            const auto declared = validate_length(*request.declare_length);
            if (info.length && *info.length != declared)
            {
                throw UploadError(ErrorCode::AlreadySet, "Upload length already set");
            }
            if (!info.length)
            {
                if (declared < info.offset)
                {
                    throw UploadError(ErrorCode::InvalidLength, "Upload length below current offset");
                }
                new_length = declared;
            }
        }

        if (request.expected_offset != info.offset)
        {
            throw UploadError(ErrorCode::OffsetMismatch, "Expected offset " + std::to_string(info.offset) +
                                                             ", got " + std::to_string(request.expected_offset));
        }

        const auto end = checked_end(info.offset, request.payload.size());
        const auto effective_length = new_length ? new_length : info.length;
        if (effective_length && end > *effective_length)
        {
            throw UploadError(ErrorCode::LengthExceeded, "Payload exceeds declared upload length");
        }
        if (options_.max_size && end > *options_.max_size)
        {
            throw UploadError(ErrorCode::LengthExceeded, "Payload exceeds maximum upload size");
        }
        if (request.checksum)
        {
            verify_checksum(*request.checksum, request.payload);
        }

        if (new_length)
        {
            info = metadata_.set_length(request.id, *new_length);
        }

        if (!request.payload.empty())
        {
            try
            {
                storage_.write_at(request.id, info.offset, request.payload);
            }
            catch (const UploadError &ex)
            {
                if (ex.code() == ErrorCode::OffsetMismatch)
                {
                    spdlog::error("Storage for upload {} drifted from its recorded offset: {}", request.id, ex.what());
                    throw UploadError(ErrorCode::InternalError, "Stored object out of sync with upload offset");
                }
                throw;
            }

            try
            {
                info = metadata_.advance_offset(request.id, end);
            }
            catch (const UploadError &)
            {
                try
                {
                    storage_.truncate(request.id, info.offset);
                }
                catch (const UploadError &rollback)
                {
                    spdlog::error("Rollback of upload {} to {} failed: {}", request.id, info.offset, rollback.what());
                }
                throw;
            }
            spdlog::debug("Upload {} advanced to {}", request.id, info.offset);
        }

        if (!was_completed && info.completed())
        {
            notify_completed(info);
        }
        return status_of(info);
    }

    UploadStatus UploadEngine::set_deferred_length(const RequestContext &context, const std::string &id,
                                                   std::int64_t length)
    {
        authorize(context);
        auto lock = coordinator_.acquire(id);
        if (lock.terminated())
        {
            throw UploadError(ErrorCode::Terminated, "Upload " + id + " was terminated");
        }
        const auto info = require(id);
        if (info.length)
        {
            throw UploadError(ErrorCode::AlreadySet, "Upload length already set");
        }
        const auto validated = validate_length(length);
        const auto updated = metadata_.set_length(id, validated);
        if (updated.completed())
        {
            notify_completed(updated);
        }
        return status_of(updated);
    }

    UploadStatus UploadEngine::head(const RequestContext &context, const std::string &id) const
    {
        authorize(context);
        return status_of(require(id));
    }

    void UploadEngine::terminate(const RequestContext &context, const std::string &id)
    {
        authorize(context);
        if (!is_valid_upload_id(id))
        {
            return;
        }
        auto lock = coordinator_.acquire(id);
        remove_locked(lock);
    }

    std::unique_ptr<ByteReader> UploadEngine::read(const RequestContext &context, const std::string &id,
                                                   std::uint64_t start, std::uint64_t end) const
    {
        authorize(context);
        const auto info = require(id);
        if (start > end || end > info.offset)
        {
            throw UploadError(ErrorCode::InvalidRange, "Range outside received bytes");
        }
        return storage_.read_range(id, start, end);
    }

    std::size_t UploadEngine::reap_expired(std::chrono::system_clock::time_point now)
    {
        std::size_t reaped = 0;
        for (const auto &info : metadata_.list())
        {
            std::optional<std::chrono::seconds> window = options_.retention;
            if (info.completed())
            {
                // Hold on to completed uploads until their event is out.
                window = info.completion_notified ? options_.completed_retention : std::nullopt;
            }
            if (!window || now - info.last_update <= *window)
            {
                continue;
            }

            auto lock = coordinator_.try_acquire(info.id);
            if (!lock)
            {
                continue;
            }
            const auto current = metadata_.get(info.id);
            if (!current || current->last_update != info.last_update)
            {
                continue;
            }
            try
            {
                remove_locked(*lock);
                ++reaped;
                spdlog::info("Reaped upload {} idle since {}", info.id, tus::format_http_date(info.last_update));
            }
            catch (const UploadError &ex)
            {
                spdlog::error("Failed to reap upload {}: {}", info.id, ex.what());
            }
        }
        return reaped;
    }

    std::size_t UploadEngine::redeliver_completions()
    {
        const auto delivered = coordinator_.redeliver_pending();
        for (const auto &id : delivered)
        {
            try
            {
                metadata_.mark_notified(id);
            }
            catch (const UploadError &ex)
            {
                spdlog::error("Failed to record notification for upload {}: {}", id, ex.what());
            }
        }
        return delivered.size();
    }

    RecoveryReport UploadEngine::recover()
    {
        RecoveryReport report;
        for (const auto &info : metadata_.list())
        {
            try
            {
                if (!storage_.exists(info.id))
                {
                    spdlog::warn("Upload {} has no stored bytes, removing its record", info.id);
                    metadata_.remove(info.id);
                    ++report.removed;
                    continue;
                }
                const auto stored = storage_.length(info.id);
                if (stored > info.offset)
                {
                    spdlog::warn("Upload {} holds {} unacknowledged bytes, truncating to {}", info.id,
                                 stored - info.offset, info.offset);
                    storage_.truncate(info.id, info.offset);
                    ++report.truncated;
                }
                else if (stored < info.offset)
                {
                    spdlog::error("Upload {} lost bytes ({} stored, {} acknowledged), removing it", info.id, stored,
                                  info.offset);
                    storage_.remove(info.id);
                    metadata_.remove(info.id);
                    ++report.removed;
                    continue;
                }
                if (info.completed() && !info.completion_notified)
                {
                    notify_completed(info);
                    ++report.republished;
                }
            }
            catch (const UploadError &ex)
            {
                spdlog::error("Recovery of upload {} failed: {}", info.id, ex.what());
            }
        }
        spdlog::info("Recovery finished: {} truncated, {} removed, {} completions republished", report.truncated,
                     report.removed, report.republished);
        return report;
    }

    void UploadEngine::authorize(const RequestContext &context) const
    {
        if (!options_.authorizer)
        {
            return;
        }
        const auto decision = options_.authorizer(context);
        if (!decision.allowed)
        {
            throw UploadError(ErrorCode::Unauthorized, decision.reason.empty() ? "Access denied" : decision.reason);
        }
    }

    UploadStatus UploadEngine::status_of(const UploadInfo &info) const
    {
        UploadStatus status{.info = info};
        if (info.completed())
        {
            status.phase = UploadPhase::Completed;
            if (options_.completed_retention)
            {
                status.expires_at = info.last_update + *options_.completed_retention;
            }
        }
        else
        {
            status.phase = info.offset > 0 ? UploadPhase::Receiving : UploadPhase::Created;
            status.expires_at = info.last_update + options_.retention;
        }
        return status;
    }

    UploadInfo UploadEngine::require(const std::string &id) const
    {
        if (!is_valid_upload_id(id))
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload " + id);
        }
        auto info = metadata_.get(id);
        if (!info)
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload " + id);
        }
        return *info;
    }

    std::uint64_t UploadEngine::validate_length(std::int64_t length) const
    {
        if (length < 0)
        {
            throw UploadError(ErrorCode::InvalidLength, "Upload length must not be negative");
        }
        const auto value = static_cast<std::uint64_t>(length);
        if (options_.max_size && value > *options_.max_size)
        {
            throw UploadError(ErrorCode::LengthExceeded, "Upload length exceeds maximum size");
        }
        return value;
    }

    void UploadEngine::remove_locked(TransferCoordinator::UploadLock &lock)
    {
        const auto &id = lock.id();
        if (!metadata_.get(id))
        {
            storage_.remove(id);
            return;
        }
        lock.mark_terminated();
        storage_.remove(id);
        metadata_.remove(id);
        spdlog::info("Terminated upload {}", id);
    }

    void UploadEngine::notify_completed(const UploadInfo &info)
    {
        spdlog::info("Upload {} completed ({} bytes)", info.id, info.offset);
        const CompletionEvent event{
            .id = info.id,
            .length = info.offset,
            .metadata = info.metadata,
        };
        if (!coordinator_.publish_completion(event))
        {
            return;
        }
        try
        {
            metadata_.mark_notified(info.id);
        }
        catch (const UploadError &ex)
        {
            spdlog::error("Failed to record notification for upload {}: {}", info.id, ex.what());
        }
    }

} // namespace tusk::server
