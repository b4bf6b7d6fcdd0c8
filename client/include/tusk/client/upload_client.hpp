#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tusk/client/http_connection.hpp"
#include "tusk/client/logger.hpp"
#include "tusk/client/transfer_state_store.hpp"
#include "tusk/error_codes.hpp"
#include "tusk/tus.hpp"

namespace tusk::client
{

    // A tus request the server answered with an error status.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, int status, const std::string &message);

        ErrorCode code() const noexcept { return code_; }
        int status() const noexcept { return status_; }

    private:
        ErrorCode code_;
        int status_;
    };

    struct UploadOptions
    {
        std::string base_path{"/files/"};
        std::size_t chunk_size{1024 * 1024};
        std::optional<std::string> token;
        tus::Metadata metadata;
        std::optional<std::size_t> max_upload_rate;
        int retries{5};
        std::chrono::milliseconds initial_backoff{200};
    };

    struct UploadResult
    {
        std::string url;
        std::uint64_t length{};
        bool resumed{};
    };

    using ProgressCallback = std::function<void(std::uint64_t offset, std::uint64_t total)>;

    class UploadClient
    {
    public:
        UploadClient(HttpConnection &connection, TransferStateStore &state, Logger &logger, UploadOptions options);

        // Resumes a recorded upload of the same file when the server still has it, otherwise creates one.
        UploadResult upload(const std::filesystem::path &file, const ProgressCallback &progress = {});

        // Returns the upload path taken from the Location header.
        std::string create(std::uint64_t length, const tus::Metadata &metadata);

        // std::nullopt when the server no longer knows the upload.
        std::optional<std::uint64_t> query_offset(const std::string &url);

        // Sends one chunk with a sha256 Upload-Checksum and returns the new server offset.
        std::uint64_t patch(const std::string &url, std::uint64_t offset, std::span<const std::byte> chunk);

        void terminate(const std::string &url);

    private:
        http::Request make_request(std::string method, std::string target) const;
        std::string endpoint() const;
        std::uint64_t send_chunks(const std::string &url, const std::filesystem::path &file, std::uint64_t offset,
                                  std::uint64_t total, const ProgressCallback &progress);
        void backoff(int attempt) const;

        template <typename F>
        auto with_retry(std::string_view url, F &&operation) -> decltype(operation());

        HttpConnection &connection_;
        TransferStateStore &state_;
        Logger &logger_;
        UploadOptions options_;
    };

    // Reduces an absolute URL to its path; relative locations pass through.
    std::string target_from_location(std::string_view location);

} // namespace tusk::client
