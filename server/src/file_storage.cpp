#include "tusk/server/file_storage.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    namespace
    {

        class FileReader : public ByteReader
        {
        public:
            FileReader(const std::filesystem::path &path, std::uint64_t start, std::uint64_t end)
                : in_(path, std::ios::binary), remaining_(end - start)
            {
                if (!in_.is_open())
                {
                    throw UploadError(ErrorCode::StorageUnavailable, "Failed to open " + path.string());
                }
                in_.seekg(static_cast<std::streamoff>(start));
            }

            std::size_t read(std::span<std::byte> out) override
            {
                if (remaining_ == 0 || out.empty())
                {
                    return 0;
                }
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(out.size(), remaining_));
                in_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(wanted));
                const auto count = static_cast<std::size_t>(in_.gcount());
                if (count == 0)
                {
                    throw UploadError(ErrorCode::StorageUnavailable, "Unexpected end of stored object");
                }
                remaining_ -= count;
                return count;
            }

            std::uint64_t remaining() const noexcept override { return remaining_; }

        private:
            std::ifstream in_;
            std::uint64_t remaining_;
        };

        void require_valid(const std::string &id)
        {
            if (!is_valid_upload_id(id))
            {
                throw UploadError(ErrorCode::NotFound, "Invalid upload id");
            }
        }

    } // namespace

    FileStorage::FileStorage(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    std::filesystem::path FileStorage::object_path(const std::string &id) const
    {
        return directory_ / id;
    }

    void FileStorage::create_object(const std::string &id)
    {
        require_valid(id);
        const auto path = object_path(id);
        if (std::filesystem::exists(path))
        {
            throw UploadError(ErrorCode::InternalError, "Storage object already exists: " + id);
        }
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to create " + path.string());
        }
    }

    std::uint64_t FileStorage::write_at(const std::string &id, std::uint64_t offset, std::span<const std::byte> data)
    {
        const auto current = length(id);
        if (current != offset)
        {
            throw UploadError(ErrorCode::OffsetMismatch,
                              "Write at " + std::to_string(offset) + " but object holds " + std::to_string(current));
        }
        if (data.empty())
        {
            return current;
        }

        const auto path = object_path(id);
        std::ofstream out(path, std::ios::binary | std::ios::app);
        if (!out.is_open())
        {
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to open " + path.string());
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ec;
            std::filesystem::resize_file(path, current, ec);
            if (ec)
            {
                spdlog::error("Failed to roll back {} to {} bytes: {}", path.string(), current, ec.message());
            }
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to write " + path.string());
        }
        return current + static_cast<std::uint64_t>(data.size());
    }

    std::unique_ptr<ByteReader> FileStorage::read_range(const std::string &id, std::uint64_t start,
                                                        std::uint64_t end) const
    {
        const auto size = length(id);
        if (start > end || end > size)
        {
            throw UploadError(ErrorCode::InvalidRange, "Range outside stored object");
        }
        return std::make_unique<FileReader>(object_path(id), start, end);
    }

    std::uint64_t FileStorage::length(const std::string &id) const
    {
        require_valid(id);
        std::error_code ec;
        const auto size = std::filesystem::file_size(object_path(id), ec);
        if (ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                throw UploadError(ErrorCode::NotFound, "Unknown upload " + id);
            }
            throw UploadError(ErrorCode::StorageUnavailable, ec.message());
        }
        return static_cast<std::uint64_t>(size);
    }

    bool FileStorage::exists(const std::string &id) const
    {
        if (!is_valid_upload_id(id))
        {
            return false;
        }
        std::error_code ec;
        return std::filesystem::is_regular_file(object_path(id), ec);
    }

    void FileStorage::remove(const std::string &id)
    {
        require_valid(id);
        std::error_code ec;
        std::filesystem::remove(object_path(id), ec);
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, ec.message());
        }
    }

    void FileStorage::truncate(const std::string &id, std::uint64_t new_length)
    {
        if (length(id) <= new_length)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::resize_file(object_path(id), new_length, ec);
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, ec.message());
        }
    }

} // namespace tusk::server
