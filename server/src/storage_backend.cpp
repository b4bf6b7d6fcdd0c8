#include "tusk/server/storage_backend.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "tusk/server/file_storage.hpp"
#include "tusk/server/segmented_storage.hpp"

namespace tusk::server
{

    namespace
    {
        constexpr std::size_t kReadChunk = 64 * 1024;
        constexpr std::size_t kMaxIdLength = 128;
    } // namespace

    std::vector<std::byte> read_all(ByteReader &reader)
    {
        std::vector<std::byte> out;
        out.reserve(static_cast<std::size_t>(reader.remaining()));
        std::array<std::byte, kReadChunk> buffer{};
        while (true)
        {
            const auto count = reader.read(buffer);
            if (count == 0)
            {
                break;
            }
            out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
        }
        return out;
    }

    std::string_view to_string(StorageKind kind) noexcept
    {
        switch (kind)
        {
        case StorageKind::File:
            return "file";
        case StorageKind::Segmented:
            return "segmented";
        }
        return "unknown";
    }

    std::optional<StorageKind> storage_kind_from_string(std::string_view value) noexcept
    {
        if (value == "file")
        {
            return StorageKind::File;
        }
        if (value == "segmented")
        {
            return StorageKind::Segmented;
        }
        return std::nullopt;
    }

    std::unique_ptr<StorageBackend> make_storage(StorageKind kind, const std::filesystem::path &directory)
    {
        switch (kind)
        {
        case StorageKind::Segmented:
            return std::make_unique<SegmentedStorage>(directory);
        case StorageKind::File:
        default:
            return std::make_unique<FileStorage>(directory);
        }
    }

    bool is_valid_upload_id(std::string_view id) noexcept
    {
        if (id.empty() || id.size() > kMaxIdLength)
        {
            return false;
        }
        return std::all_of(id.begin(), id.end(), [](char c)
                           { return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'; });
    }

} // namespace tusk::server
