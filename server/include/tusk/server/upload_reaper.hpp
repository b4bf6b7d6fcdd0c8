#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>

#include "tusk/server/upload_engine.hpp"

namespace tusk::server
{

    // Periodically removes expired uploads and retries undelivered completion events.
    // The timer lives on a strand, so stop() may be called from any thread.
    class UploadReaper
    {
    public:
        UploadReaper(asio::io_context &io_context, UploadEngine &engine, std::chrono::seconds interval);

        void start();

        void stop();

        bool running() const noexcept { return running_; }

        // One sweep; also what every timer tick runs.
        void sweep();

    private:
        void schedule();

        UploadEngine &engine_;
        asio::strand<asio::io_context::executor_type> strand_;
        asio::steady_timer timer_;
        std::chrono::seconds interval_;
        std::atomic<bool> running_{false};
    };

} // namespace tusk::server
