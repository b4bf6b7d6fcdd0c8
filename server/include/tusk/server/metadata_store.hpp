#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tusk/tus.hpp"

namespace tusk::server
{

    struct UploadInfo
    {
        std::string id;
        std::optional<std::uint64_t> length; // unset while deferred
        std::uint64_t offset{};
        tus::Metadata metadata;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_update{};
        bool completion_notified{};

        bool length_deferred() const noexcept { return !length.has_value(); }
        bool completed() const noexcept { return length.has_value() && offset == *length; }
    };

    /**
     * Durable per-upload descriptors, one JSON record per id at <directory>/<id>.info.
     *
     * The store is the single source of truth for offsets. It only checks that offsets never move
     * backwards; ordering of concurrent writers to one id is the caller's job.
     */
    class MetadataStore
    {
    public:
        explicit MetadataStore(std::filesystem::path directory);

        UploadInfo create(std::optional<std::uint64_t> length, tus::Metadata metadata);

        std::optional<UploadInfo> get(const std::string &id) const;

        UploadInfo advance_offset(const std::string &id, std::uint64_t new_offset);

        UploadInfo set_length(const std::string &id, std::uint64_t length);

        void mark_notified(const std::string &id);

        // Returns false when no record existed.
        bool remove(const std::string &id);

        std::vector<UploadInfo> list() const;

        std::filesystem::path record_path(const std::string &id) const;

    private:
        void load_existing();
        void persist_locked(const UploadInfo &info) const;
        UploadInfo &require_locked(const std::string &id);
        std::string generate_id_locked() const;

        std::filesystem::path directory_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadInfo> uploads_;
    };

} // namespace tusk::server
