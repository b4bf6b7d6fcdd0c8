#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tusk/tus.hpp"

namespace tusk::server
{

    struct CompletionEvent
    {
        std::string id;
        std::uint64_t length{};
        tus::Metadata metadata;
    };

    // Events may be delivered more than once; implementations must dedupe by upload id.
    class CompletionObserver
    {
    public:
        virtual ~CompletionObserver() = default;

        virtual void on_upload_completed(const CompletionEvent &event) = 0;

        // Every observer accepted the event for `id`; it is not delivered again.
        virtual void on_completion_settled(const std::string & /*id*/) {}
    };

    class TransferCoordinator
    {
        struct Slot;

    public:
        // Exclusive hold on one upload id; released on destruction.
        class UploadLock
        {
        public:
            UploadLock(UploadLock &&other) noexcept;
            UploadLock &operator=(UploadLock &&other) = delete;
            UploadLock(const UploadLock &) = delete;
            UploadLock &operator=(const UploadLock &) = delete;
            ~UploadLock();

            const std::string &id() const noexcept { return id_; }

            // True when a terminate ran on this id while the holder was queued.
            bool terminated() const noexcept;

            // Makes every holder still queued on this id observe terminated().
            void mark_terminated() noexcept;

        private:
            friend class TransferCoordinator;
            UploadLock(TransferCoordinator *owner, std::string id, std::shared_ptr<Slot> slot);

            TransferCoordinator *owner_;
            std::string id_;
            std::shared_ptr<Slot> slot_;
        };

        explicit TransferCoordinator(std::chrono::milliseconds lock_timeout);

        // Waits up to the lock timeout, then throws UploadError(Busy).
        UploadLock acquire(const std::string &id);

        std::optional<UploadLock> try_acquire(const std::string &id);

        bool in_flight(const std::string &id) const;

        void subscribe(std::shared_ptr<CompletionObserver> observer);

        // Delivers to every observer. Returns false and queues the event when any observer throws.
        bool publish_completion(const CompletionEvent &event);

        // Retries queued events; returns the ids that were delivered to every observer this time.
        std::vector<std::string> redeliver_pending();

        std::size_t pending_count() const;

    private:
        struct Slot
        {
            std::timed_mutex mutex;
            std::size_t users{0};
            bool terminated{false};
        };

        std::shared_ptr<Slot> checkout(const std::string &id);
        void release(const std::string &id, const std::shared_ptr<Slot> &slot) noexcept;
        std::vector<std::shared_ptr<CompletionObserver>> observers() const;
        bool deliver(const CompletionEvent &event);
        void settle(const std::string &id);

        std::chrono::milliseconds lock_timeout_;

        mutable std::mutex slots_mutex_;
        std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

        mutable std::mutex observers_mutex_;
        std::vector<std::shared_ptr<CompletionObserver>> observers_;
        std::deque<CompletionEvent> pending_;
    };

} // namespace tusk::server
