#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace tusk::client
{

    // Transfer log of one client run. Every line names the upload URL it concerns,
    // so a log file shared by several runs can be grepped per upload.
    class Logger
    {
    public:
        // Without a path nothing is written.
        explicit Logger(const std::optional<std::filesystem::path> &path);

        void created(std::string_view url, const std::filesystem::path &file, std::uint64_t length);
        void resuming(std::string_view url, std::uint64_t offset, std::uint64_t length);
        void stale_record(std::string_view url);

        // A request failed and will be retried. `offset` is where the upload stood.
        void retrying(std::string_view url, std::optional<std::uint64_t> offset, int attempt, std::string_view reason);

        void finished(std::string_view url, std::uint64_t length);

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace tusk::client
