#include "tusk/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

namespace tusk::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("transfer", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::info);
            // Lines must survive a client that is killed mid-transfer.
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Transfer log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::created(std::string_view url, const std::filesystem::path &file, std::uint64_t length)
    {
        if (logger_)
        {
            logger_->info("{} created for {} ({} bytes)", url, file.string(), length);
        }
    }

    void Logger::resuming(std::string_view url, std::uint64_t offset, std::uint64_t length)
    {
        if (logger_)
        {
            logger_->info("{} resuming at offset {} of {}", url, offset, length);
        }
    }

    void Logger::stale_record(std::string_view url)
    {
        if (logger_)
        {
            logger_->warn("{} is gone from the server, starting over", url);
        }
    }

    void Logger::retrying(std::string_view url, std::optional<std::uint64_t> offset, int attempt,
                          std::string_view reason)
    {
        if (!logger_)
        {
            return;
        }
        if (offset)
        {
            logger_->warn("{} attempt {} at offset {} failed: {}", url.empty() ? "(new upload)" : url, attempt,
                          *offset, reason);
        }
        else
        {
            logger_->warn("{} attempt {} failed: {}", url.empty() ? "(new upload)" : url, attempt, reason);
        }
    }

    void Logger::finished(std::string_view url, std::uint64_t length)
    {
        if (logger_)
        {
            logger_->info("{} finished, {} bytes on the server", url, length);
        }
    }

} // namespace tusk::client
