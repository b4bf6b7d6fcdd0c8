#include "tusk/server/upload_reaper.hpp"

#include <asio/post.hpp>

#include <spdlog/spdlog.h>

namespace tusk::server
{

    UploadReaper::UploadReaper(asio::io_context &io_context, UploadEngine &engine, std::chrono::seconds interval)
        : engine_(engine), strand_(asio::make_strand(io_context)), timer_(strand_), interval_(interval)
    {
    }

    void UploadReaper::start()
    {
        running_ = true;
        asio::post(strand_, [this]
                   { schedule(); });
    }

    void UploadReaper::stop()
    {
        running_ = false;
        asio::post(strand_, [this]
                   { timer_.cancel(); });
    }

    void UploadReaper::sweep()
    {
        try
        {
            const auto reaped = engine_.reap_expired(std::chrono::system_clock::now());
            const auto redelivered = engine_.redeliver_completions();
            if (reaped > 0 || redelivered > 0)
            {
                spdlog::info("Reaper removed {} uploads, redelivered {} completion events", reaped, redelivered);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Reaper sweep failed: {}", ex.what());
        }
    }

    void UploadReaper::schedule()
    {
        if (!running_)
        {
            return;
        }
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          {
                              if (ec || !running_)
                              {
                                  return;
                              }
                              sweep();
                              schedule();
                          });
    }

} // namespace tusk::server
