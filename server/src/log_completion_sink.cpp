#include "tusk/server/log_completion_sink.hpp"

#include <spdlog/spdlog.h>

namespace tusk::server
{

    void LogCompletionSink::on_upload_completed(const CompletionEvent &event)
    {
        {
            std::lock_guard lock(mutex_);
            if (!seen_.insert(event.id).second)
            {
                return;
            }
            ++delivered_;
        }
        const auto filename = event.metadata.find("filename");
        if (filename != event.metadata.end())
        {
            spdlog::info("Upload {} finished ({} bytes, {})", event.id, event.length, filename->second);
        }
        else
        {
            spdlog::info("Upload {} finished ({} bytes)", event.id, event.length);
        }
    }

    void LogCompletionSink::on_completion_settled(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        seen_.erase(id);
    }

    std::size_t LogCompletionSink::delivered() const
    {
        std::lock_guard lock(mutex_);
        return delivered_;
    }

    std::size_t LogCompletionSink::tracked() const
    {
        std::lock_guard lock(mutex_);
        return seen_.size();
    }

} // namespace tusk::server
