#include "tusk/server/segmented_storage.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    namespace
    {
        constexpr auto kPartsSuffix = ".parts";
        constexpr auto kSegmentExtension = ".seg";
        constexpr auto kTempExtension = ".tmp";

        std::string segment_name(std::uint64_t start)
        {
            std::ostringstream oss;
            oss << std::setw(20) << std::setfill('0') << start << kSegmentExtension;
            return oss.str();
        }

        std::optional<std::uint64_t> segment_start(const std::filesystem::path &path)
        {
            if (path.extension() != kSegmentExtension)
            {
                return std::nullopt;
            }
            const auto stem = path.stem().string();
            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), value);
            if (ec != std::errc{} || ptr != stem.data() + stem.size())
            {
                return std::nullopt;
            }
            return value;
        }

        void require_valid(const std::string &id)
        {
            if (!is_valid_upload_id(id))
            {
                throw UploadError(ErrorCode::NotFound, "Invalid upload id");
            }
        }

        class SegmentReader : public ByteReader
        {
        public:
            SegmentReader(std::vector<SegmentedStorage::Segment> segments, std::uint64_t start, std::uint64_t end)
                : segments_(std::move(segments)), position_(start), end_(end)
            {
            }

            std::size_t read(std::span<std::byte> out) override
            {
                if (position_ < end_ && !out.empty())
                {
                    if (!current_ || position_ >= current_end_)
                    {
                        open_segment_at(position_);
                    }
                    const auto wanted = static_cast<std::size_t>(
                        std::min<std::uint64_t>({out.size(), end_ - position_, current_end_ - position_}));
                    in_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(wanted));
                    const auto count = static_cast<std::size_t>(in_.gcount());
                    if (count == 0)
                    {
                        throw UploadError(ErrorCode::StorageUnavailable, "Unexpected end of segment");
                    }
                    position_ += count;
                    return count;
                }
                return 0;
            }

            std::uint64_t remaining() const noexcept override { return end_ - position_; }

        private:
            void open_segment_at(std::uint64_t position)
            {
                const auto it = std::find_if(segments_.begin(), segments_.end(), [position](const auto &segment)
                                             { return position >= segment.start && position < segment.start + segment.size; });
                if (it == segments_.end())
                {
                    throw UploadError(ErrorCode::StorageUnavailable, "Missing segment for offset " +
                                                                         std::to_string(position));
                }
                in_.close();
                in_.clear();
                in_.open(it->path, std::ios::binary);
                if (!in_.is_open())
                {
                    throw UploadError(ErrorCode::StorageUnavailable, "Failed to open " + it->path.string());
                }
                in_.seekg(static_cast<std::streamoff>(position - it->start));
                current_ = true;
                current_end_ = it->start + it->size;
            }

            std::vector<SegmentedStorage::Segment> segments_;
            std::uint64_t position_;
            std::uint64_t end_;
            std::ifstream in_;
            bool current_{false};
            std::uint64_t current_end_{0};
        };

    } // namespace

    SegmentedStorage::SegmentedStorage(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    std::filesystem::path SegmentedStorage::object_directory(const std::string &id) const
    {
        return directory_ / (id + kPartsSuffix);
    }

    std::vector<SegmentedStorage::Segment> SegmentedStorage::segments(const std::string &id) const
    {
        require_valid(id);
        const auto dir = object_directory(id);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload " + id);
        }

        std::vector<Segment> result;
        for (const auto &entry : std::filesystem::directory_iterator(dir, ec))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            const auto start = segment_start(entry.path());
            if (!start)
            {
                continue;
            }
            result.push_back(Segment{
                .start = *start,
                .size = static_cast<std::uint64_t>(entry.file_size()),
                .path = entry.path(),
            });
        }
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, ec.message());
        }
        std::sort(result.begin(), result.end(), [](const Segment &lhs, const Segment &rhs)
                  { return lhs.start < rhs.start; });
        return result;
    }

    void SegmentedStorage::create_object(const std::string &id)
    {
        require_valid(id);
        std::error_code ec;
        if (!std::filesystem::create_directory(object_directory(id), ec))
        {
            if (ec)
            {
                throw UploadError(ErrorCode::StorageUnavailable, ec.message());
            }
            throw UploadError(ErrorCode::InternalError, "Storage object already exists: " + id);
        }
    }

    std::uint64_t SegmentedStorage::write_at(const std::string &id, std::uint64_t offset,
                                             std::span<const std::byte> data)
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

        const auto final_path = object_directory(id) / segment_name(offset);
        auto temp_path = final_path;
        temp_path += kTempExtension;
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (out.is_open())
            {
                out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                out.flush();
            }
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                throw UploadError(ErrorCode::StorageUnavailable, "Failed to write segment " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to publish segment: " + ec.message());
        }
        return current + static_cast<std::uint64_t>(data.size());
    }

    std::unique_ptr<ByteReader> SegmentedStorage::read_range(const std::string &id, std::uint64_t start,
                                                             std::uint64_t end) const
    {
        auto parts = segments(id);
        std::uint64_t total = 0;
        for (const auto &segment : parts)
        {
            total += segment.size;
        }
        if (start > end || end > total)
        {
            throw UploadError(ErrorCode::InvalidRange, "Range outside stored object");
        }
        return std::make_unique<SegmentReader>(std::move(parts), start, end);
    }

    std::uint64_t SegmentedStorage::length(const std::string &id) const
    {
        std::uint64_t total = 0;
        for (const auto &segment : segments(id))
        {
            total += segment.size;
        }
        return total;
    }

    bool SegmentedStorage::exists(const std::string &id) const
    {
        if (!is_valid_upload_id(id))
        {
            return false;
        }
        std::error_code ec;
        return std::filesystem::is_directory(object_directory(id), ec);
    }

    void SegmentedStorage::remove(const std::string &id)
    {
        require_valid(id);
        std::error_code ec;
        std::filesystem::remove_all(object_directory(id), ec);
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, ec.message());
        }
    }

    void SegmentedStorage::truncate(const std::string &id, std::uint64_t new_length)
    {
        for (const auto &segment : segments(id))
        {
            std::error_code ec;
            if (segment.start >= new_length)
            {
                std::filesystem::remove(segment.path, ec);
            }
            else if (segment.start + segment.size > new_length)
            {
                std::filesystem::resize_file(segment.path, new_length - segment.start, ec);
            }
            if (ec)
            {
                throw UploadError(ErrorCode::StorageUnavailable, ec.message());
            }
        }
        spdlog::debug("Truncated segmented object {} to {} bytes", id, new_length);
    }

} // namespace tusk::server
