#pragma once

#include <filesystem>
#include <vector>

#include "tusk/server/storage_backend.hpp"

namespace tusk::server
{

    /**
     * Object-store style backend: every accepted append becomes one immutable segment object under
     * <directory>/<id>.parts/, named after the offset it starts at. A segment is written to a temporary
     * name and renamed into place, so a failed append never leaves a visible partial segment.
     */
    class SegmentedStorage : public StorageBackend
    {
    public:
        struct Segment
        {
            std::uint64_t start{};
            std::uint64_t size{};
            std::filesystem::path path;
        };

        explicit SegmentedStorage(std::filesystem::path directory);

        void create_object(const std::string &id) override;
        std::uint64_t write_at(const std::string &id, std::uint64_t offset, std::span<const std::byte> data) override;
        std::unique_ptr<ByteReader> read_range(const std::string &id, std::uint64_t start,
                                               std::uint64_t end) const override;
        std::uint64_t length(const std::string &id) const override;
        bool exists(const std::string &id) const override;
        void remove(const std::string &id) override;
        void truncate(const std::string &id, std::uint64_t length) override;

        std::filesystem::path object_directory(const std::string &id) const;

        std::vector<Segment> segments(const std::string &id) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace tusk::server
