#include "tusk/server/transfer_coordinator.hpp"

#include <spdlog/spdlog.h>

#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    TransferCoordinator::UploadLock::UploadLock(TransferCoordinator *owner, std::string id, std::shared_ptr<Slot> slot)
        : owner_(owner), id_(std::move(id)), slot_(std::move(slot))
    {
    }

    TransferCoordinator::UploadLock::UploadLock(UploadLock &&other) noexcept
        : owner_(other.owner_), id_(std::move(other.id_)), slot_(std::move(other.slot_))
    {
        other.owner_ = nullptr;
    }

    TransferCoordinator::UploadLock::~UploadLock()
    {
        if (owner_ && slot_)
        {
            slot_->mutex.unlock();
            owner_->release(id_, slot_);
        }
    }

    bool TransferCoordinator::UploadLock::terminated() const noexcept
    {
        return slot_ && slot_->terminated;
    }

    void TransferCoordinator::UploadLock::mark_terminated() noexcept
    {
        if (slot_)
        {
            slot_->terminated = true;
        }
    }

    TransferCoordinator::TransferCoordinator(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout)
    {
    }

    TransferCoordinator::UploadLock TransferCoordinator::acquire(const std::string &id)
    {
        auto slot = checkout(id);
        if (!slot->mutex.try_lock_for(lock_timeout_))
        {
            release(id, slot);
            throw UploadError(ErrorCode::Busy, "Upload " + id + " is locked by another request");
        }
        return UploadLock(this, id, std::move(slot));
    }

    std::optional<TransferCoordinator::UploadLock> TransferCoordinator::try_acquire(const std::string &id)
    {
        auto slot = checkout(id);
        if (!slot->mutex.try_lock())
        {
            release(id, slot);
            return std::nullopt;
        }
        return UploadLock(this, id, std::move(slot));
    }

    bool TransferCoordinator::in_flight(const std::string &id) const
    {
        std::lock_guard lock(slots_mutex_);
        return slots_.contains(id);
    }

    void TransferCoordinator::subscribe(std::shared_ptr<CompletionObserver> observer)
    {
        std::lock_guard lock(observers_mutex_);
        observers_.push_back(std::move(observer));
    }

    bool TransferCoordinator::publish_completion(const CompletionEvent &event)
    {
        if (deliver(event))
        {
            settle(event.id);
            return true;
        }
        std::lock_guard lock(observers_mutex_);
        pending_.push_back(event);
        return false;
    }

    std::vector<std::string> TransferCoordinator::redeliver_pending()
    {
        std::deque<CompletionEvent> batch;
        {
            std::lock_guard lock(observers_mutex_);
            batch.swap(pending_);
        }

        std::vector<std::string> delivered;
        std::deque<CompletionEvent> failed;
        for (auto &event : batch)
        {
            if (deliver(event))
            {
                settle(event.id);
                delivered.push_back(event.id);
            }
            else
            {
                failed.push_back(std::move(event));
            }
        }

        if (!failed.empty())
        {
            std::lock_guard lock(observers_mutex_);
            for (auto &event : failed)
            {
                pending_.push_back(std::move(event));
            }
        }
        return delivered;
    }

    std::size_t TransferCoordinator::pending_count() const
    {
        std::lock_guard lock(observers_mutex_);
        return pending_.size();
    }

    std::shared_ptr<TransferCoordinator::Slot> TransferCoordinator::checkout(const std::string &id)
    {
        std::lock_guard lock(slots_mutex_);
        auto &slot = slots_[id];
        if (!slot)
        {
            slot = std::make_shared<Slot>();
        }
        ++slot->users;
        return slot;
    }

    void TransferCoordinator::release(const std::string &id, const std::shared_ptr<Slot> &slot) noexcept
    {
        std::lock_guard lock(slots_mutex_);
        if (--slot->users == 0)
        {
            auto it = slots_.find(id);
            if (it != slots_.end() && it->second == slot)
            {
                slots_.erase(it);
            }
        }
    }

    std::vector<std::shared_ptr<CompletionObserver>> TransferCoordinator::observers() const
    {
        std::lock_guard lock(observers_mutex_);
        return observers_;
    }

    bool TransferCoordinator::deliver(const CompletionEvent &event)
    {
        bool all_accepted = true;
        for (const auto &observer : observers())
        {
            try
            {
                observer->on_upload_completed(event);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Completion observer failed for upload {}: {}", event.id, ex.what());
                all_accepted = false;
            }
        }
        return all_accepted;
    }

    void TransferCoordinator::settle(const std::string &id)
    {
        for (const auto &observer : observers())
        {
            try
            {
                observer->on_completion_settled(id);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Completion observer failed to settle upload {}: {}", id, ex.what());
            }
        }
    }

} // namespace tusk::server
