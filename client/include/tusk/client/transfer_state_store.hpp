#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tusk::client
{

    // Remembers upload URLs of unfinished uploads so a later run can resume them.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string endpoint;
            std::filesystem::path local_path;
            std::uint64_t total_size{};
            std::string upload_url;
            std::uint64_t bytes_transferred{};
        };

        // Uses ~/.tusk/uploads.json when `path` is unset.
        explicit TransferStateStore(std::optional<std::filesystem::path> path = std::nullopt);

        // Only entries recorded for the same file size are returned; a resized file starts over.
        std::optional<Entry> find(const std::string &endpoint, const std::filesystem::path &local_path,
                                  std::uint64_t total_size) const;

        void upsert(const std::string &endpoint, const std::filesystem::path &local_path, std::uint64_t total_size,
                    const std::string &upload_url);

        void update_progress(const std::string &endpoint, const std::filesystem::path &local_path,
                             std::uint64_t bytes_transferred);

        void remove(const std::string &endpoint, const std::filesystem::path &local_path);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::string &endpoint, const std::filesystem::path &local_path);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace tusk::client
