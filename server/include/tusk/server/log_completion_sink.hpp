#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

#include "tusk/server/transfer_coordinator.hpp"

namespace tusk::server
{

    // Logs each finished upload once, ignoring redeliveries of the same id.
    // An id is remembered only until its event settles.
    class LogCompletionSink : public CompletionObserver
    {
    public:
        void on_upload_completed(const CompletionEvent &event) override;

        void on_completion_settled(const std::string &id) override;

        // Number of uploads logged so far.
        std::size_t delivered() const;

        // Ids still held for deduplication.
        std::size_t tracked() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_set<std::string> seen_;
        std::size_t delivered_{0};
    };

} // namespace tusk::server
