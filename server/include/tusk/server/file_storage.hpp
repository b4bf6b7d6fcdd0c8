#pragma once

#include <filesystem>

#include "tusk/server/storage_backend.hpp"

namespace tusk::server
{

    // One file per upload: <directory>/<id>.
    class FileStorage : public StorageBackend
    {
    public:
        explicit FileStorage(std::filesystem::path directory);

        void create_object(const std::string &id) override;
        std::uint64_t write_at(const std::string &id, std::uint64_t offset, std::span<const std::byte> data) override;
        std::unique_ptr<ByteReader> read_range(const std::string &id, std::uint64_t start,
                                               std::uint64_t end) const override;
        std::uint64_t length(const std::string &id) const override;
        bool exists(const std::string &id) const override;
        void remove(const std::string &id) override;
        void truncate(const std::string &id, std::uint64_t length) override;

        std::filesystem::path object_path(const std::string &id) const;

    private:
        std::filesystem::path directory_;
    };

} // namespace tusk::server
