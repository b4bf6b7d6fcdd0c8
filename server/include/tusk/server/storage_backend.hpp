#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tusk::server
{

    // Lazy view over a byte range of a stored object.
    class ByteReader
    {
    public:
        virtual ~ByteReader() = default;

        // Fills up to out.size() bytes and returns how many were read; 0 once the range is exhausted.
        virtual std::size_t read(std::span<std::byte> out) = 0;

        virtual std::uint64_t remaining() const noexcept = 0;
    };

    std::vector<std::byte> read_all(ByteReader &reader);

    /**
     * Append-only byte storage keyed by upload id.
     *
     * Implementations must keep an object's length equal to the number of bytes accepted by write_at,
     * restoring the previous length when a write fails part way. Operations on distinct ids must be safe
     * to run concurrently; callers serialize mutations of the same id.
     */
    class StorageBackend
    {
    public:
        virtual ~StorageBackend() = default;

        virtual void create_object(const std::string &id) = 0;

        // Appends `data` when `offset` equals the current length; returns the new length.
        virtual std::uint64_t write_at(const std::string &id, std::uint64_t offset, std::span<const std::byte> data) = 0;

        virtual std::unique_ptr<ByteReader> read_range(const std::string &id, std::uint64_t start,
                                                       std::uint64_t end) const = 0;

        virtual std::uint64_t length(const std::string &id) const = 0;

        virtual bool exists(const std::string &id) const = 0;

        // Succeeds when the object is already gone.
        virtual void remove(const std::string &id) = 0;

        // Shrinks an object; used to drop bytes that were never acknowledged.
        virtual void truncate(const std::string &id, std::uint64_t length) = 0;
    };

    enum class StorageKind
    {
        File,
        Segmented
    };

    std::string_view to_string(StorageKind kind) noexcept;
    std::optional<StorageKind> storage_kind_from_string(std::string_view value) noexcept;

    std::unique_ptr<StorageBackend> make_storage(StorageKind kind, const std::filesystem::path &directory);

    // Ids reach the backends from request paths; only [A-Za-z0-9_-] is accepted.
    bool is_valid_upload_id(std::string_view id) noexcept;

} // namespace tusk::server
