#include "tusk/client/upload_client.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

#include "tusk/crypto.hpp"

namespace tusk::client
{

    namespace
    {

        void apply_rate_limit(const std::optional<std::size_t> &rate, std::uint64_t bytes,
                              const std::chrono::steady_clock::time_point &start_time)
        {
            if (!rate || *rate == 0 || bytes == 0)
            {
                return;
            }
            const double expected_seconds = static_cast<double>(bytes) / static_cast<double>(*rate);
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            if (elapsed < expected_seconds)
            {
                std::this_thread::sleep_for(std::chrono::duration<double>(expected_seconds - elapsed));
            }
        }

        TransferError error_from(const http::Response &response, std::string_view action)
        {
            std::string message(action);
            message += " failed with HTTP " + std::to_string(http::status_of(response));
            const auto text = http::body_text(response.body());
            if (!text.empty())
            {
                message += ": " + text;
            }
            const auto status = http::status_of(response);
            return TransferError(error_code_from_http_status(status), status, message);
        }

        std::uint64_t require_offset(const http::Response &response)
        {
            const auto header = http::find_header(response, tus::header::kUploadOffset);
            const auto offset = header ? tus::parse_offset(*header) : std::nullopt;
            if (!offset)
            {
                throw TransferError(ErrorCode::InvalidRequest, http::status_of(response),
                                    "Server did not return Upload-Offset");
            }
            return *offset;
        }

    } // namespace

    TransferError::TransferError(ErrorCode code, int status, const std::string &message)
        : std::runtime_error(message), code_(code), status_(status)
    {
    }

    std::string target_from_location(std::string_view location)
    {
        const auto scheme = location.find("://");
        if (scheme == std::string_view::npos)
        {
            return std::string(location);
        }
        const auto path = location.find('/', scheme + 3);
        return path == std::string_view::npos ? std::string("/") : std::string(location.substr(path));
    }

    UploadClient::UploadClient(HttpConnection &connection, TransferStateStore &state, Logger &logger,
                               UploadOptions options)
        : connection_(connection), state_(state), logger_(logger), options_(std::move(options))
    {
        if (options_.base_path.empty() || options_.base_path.front() != '/')
        {
            options_.base_path.insert(options_.base_path.begin(), '/');
        }
        if (options_.base_path.back() != '/')
        {
            options_.base_path.push_back('/');
        }
        if (options_.chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
    }

    void UploadClient::backoff(int attempt) const
    {
        auto delay = options_.initial_backoff;
        for (int i = 1; i < attempt; ++i)
        {
            delay *= 2;
        }
        std::this_thread::sleep_for(delay);
    }

    template <typename F>
    auto UploadClient::with_retry(std::string_view url, F &&operation) -> decltype(operation())
    {
        for (int attempt = 1;; ++attempt)
        {
            try
            {
                return operation();
            }
            catch (const TransferError &ex)
            {
                if (!is_transient(ex.code()) || attempt > options_.retries)
                {
                    throw;
                }
                logger_.retrying(url, std::nullopt, attempt, ex.what());
            }
            catch (const std::system_error &ex)
            {
                if (attempt > options_.retries)
                {
                    throw;
                }
                logger_.retrying(url, std::nullopt, attempt, ex.what());
            }
            backoff(attempt);
        }
    }

    UploadResult UploadClient::upload(const std::filesystem::path &file, const ProgressCallback &progress)
    {
        if (!std::filesystem::is_regular_file(file))
        {
            throw std::runtime_error("Not a regular file: " + file.string());
        }
        const auto total = static_cast<std::uint64_t>(std::filesystem::file_size(file));

        UploadResult result;
        result.length = total;
        std::uint64_t offset = 0;

        if (const auto entry = state_.find(endpoint(), file, total))
        {
            const auto server_offset = with_retry(entry->upload_url, [&]
                                                  { return query_offset(entry->upload_url); });
            if (server_offset && *server_offset <= total)
            {
                result.url = entry->upload_url;
                result.resumed = true;
                offset = *server_offset;
                logger_.resuming(result.url, offset, total);
            }
            else
            {
                logger_.stale_record(entry->upload_url);
                state_.remove(endpoint(), file);
            }
        }

        if (result.url.empty())
        {
            auto metadata = options_.metadata;
            if (!metadata.contains("filename"))
            {
                metadata["filename"] = file.filename().string();
            }
            result.url = with_retry("", [&]
                                    { return create(total, metadata); });
            state_.upsert(endpoint(), file, total, result.url);
            logger_.created(result.url, file, total);
        }

        if (progress)
        {
            progress(offset, total);
        }
        send_chunks(result.url, file, offset, total, progress);
        state_.remove(endpoint(), file);
        logger_.finished(result.url, total);
        return result;
    }

    std::string UploadClient::create(std::uint64_t length, const tus::Metadata &metadata)
    {
        auto request = make_request("POST", options_.base_path);
        http::set_header(request, tus::header::kUploadLength, std::to_string(length));
        if (!metadata.empty())
        {
            http::set_header(request, tus::header::kUploadMetadata, tus::encode_metadata(metadata));
        }
        const auto response = connection_.send(std::move(request));
        if (http::status_of(response) != 201)
        {
            throw error_from(response, "Create");
        }
        const auto location = http::find_header(response, "Location");
        if (!location || location->empty())
        {
            throw TransferError(ErrorCode::InvalidRequest, http::status_of(response), "Server did not return Location");
        }
        return target_from_location(*location);
    }

    std::optional<std::uint64_t> UploadClient::query_offset(const std::string &url)
    {
        const auto response = connection_.send(make_request("HEAD", url));
        const auto status = http::status_of(response);
        if (status == 404 || status == 410)
        {
            return std::nullopt;
        }
        if (status != 200)
        {
            throw error_from(response, "Head");
        }
        return require_offset(response);
    }

    std::uint64_t UploadClient::patch(const std::string &url, std::uint64_t offset, std::span<const std::byte> chunk)
    {
        auto request = make_request("PATCH", url);
        http::set_header(request, "Content-Type", tus::kOffsetContentType);
        http::set_header(request, tus::header::kUploadOffset, std::to_string(offset));
        http::set_header(request, tus::header::kUploadChecksum,
                         tus::format_checksum(tus::Checksum{"sha256", crypto::sha256(chunk)}));
        request.body().assign(chunk.begin(), chunk.end());
        const auto response = connection_.send(std::move(request));
        if (http::status_of(response) != 204)
        {
            throw error_from(response, "Patch");
        }
        return require_offset(response);
    }

    void UploadClient::terminate(const std::string &url)
    {
        const auto response = connection_.send(make_request("DELETE", url));
        const auto status = http::status_of(response);
        if (status != 204 && status != 404)
        {
            throw error_from(response, "Terminate");
        }
    }

    http::Request UploadClient::make_request(std::string method, std::string target) const
    {
        auto request = http::make_request(method, target);
        http::set_header(request, tus::header::kResumable, tus::kVersion);
        if (options_.token)
        {
            http::set_header(request, "Authorization", "Bearer " + *options_.token);
        }
        return request;
    }

    std::string UploadClient::endpoint() const
    {
        return connection_.authority() + options_.base_path;
    }

    std::uint64_t UploadClient::send_chunks(const std::string &url, const std::filesystem::path &file,
                                            std::uint64_t offset, std::uint64_t total,
                                            const ProgressCallback &progress)
    {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open " + file.string() + " for reading");
        }

        std::vector<std::byte> buffer(options_.chunk_size);
        const auto send_start = std::chrono::steady_clock::now();
        std::uint64_t sent = 0;
        int failures = 0;

        // A zero-length upload is complete at creation; the loop never runs.
        while (offset < total)
        {
            const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), total - offset));
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(count));
            if (static_cast<std::size_t>(in.gcount()) != count)
            {
                throw std::runtime_error("Short read from " + file.string());
            }

            try
            {
                const auto next = patch(url, offset, std::span<const std::byte>(buffer.data(), count));
                if (next <= offset || next > total)
                {
                    throw TransferError(ErrorCode::InvalidOffset, 204,
                                        "Server reported offset " + std::to_string(next));
                }
                sent += next - offset;
                offset = next;
                failures = 0;
            }
            catch (const TransferError &ex)
            {
                if (!is_transient(ex.code()) || ++failures > options_.retries)
                {
                    throw;
                }
                logger_.retrying(url, offset, failures, ex.what());
                backoff(failures);
                const auto server_offset = with_retry(url, [&]
                                                      { return query_offset(url); });
                if (!server_offset)
                {
                    throw TransferError(ErrorCode::NotFound, 404, "Upload disappeared from the server");
                }
                offset = *server_offset;
            }
            catch (const std::system_error &ex)
            {
                if (++failures > options_.retries)
                {
                    throw;
                }
                logger_.retrying(url, offset, failures, ex.what());
                backoff(failures);
                const auto server_offset = with_retry(url, [&]
                                                      { return query_offset(url); });
                if (!server_offset)
                {
                    throw TransferError(ErrorCode::NotFound, 404, "Upload disappeared from the server");
                }
                offset = *server_offset;
            }

            state_.update_progress(endpoint(), file, offset);
            if (progress)
            {
                progress(offset, total);
            }
            apply_rate_limit(options_.max_upload_rate, sent, send_start);
        }
        return offset;
    }

} // namespace tusk::client
