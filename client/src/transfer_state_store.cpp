#include "tusk/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace tusk::client
{

    TransferStateStore::TransferStateStore(std::optional<std::filesystem::path> path)
        : state_path_(path ? std::move(*path) : default_state_path())
    {
        load();
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find(const std::string &endpoint,
                                                                      const std::filesystem::path &local_path,
                                                                      std::uint64_t total_size) const
    {
        const auto normalized = normalize_path(local_path);
        for (const auto &entry : entries_)
        {
            if (entry.endpoint == endpoint && entry.local_path == normalized && entry.total_size == total_size)
            {
                return entry;
            }
        }
        return std::nullopt;
    }

    void TransferStateStore::upsert(const std::string &endpoint, const std::filesystem::path &local_path,
                                    std::uint64_t total_size, const std::string &upload_url)
    {
        const auto normalized = normalize_path(local_path);
        auto it = find_entry(endpoint, normalized);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{endpoint, normalized, total_size, upload_url, 0});
        }
        else
        {
            it->total_size = total_size;
            it->upload_url = upload_url;
            it->bytes_transferred = 0;
        }
        save();
    }

    void TransferStateStore::update_progress(const std::string &endpoint, const std::filesystem::path &local_path,
                                             std::uint64_t bytes_transferred)
    {
        auto it = find_entry(endpoint, normalize_path(local_path));
        if (it != entries_.end())
        {
            it->bytes_transferred = bytes_transferred;
            save();
        }
    }

    void TransferStateStore::remove(const std::string &endpoint, const std::filesystem::path &local_path)
    {
        auto it = find_entry(endpoint, normalize_path(local_path));
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "tusk" / "uploads.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".tusk" / "uploads.json";
        }
        return std::filesystem::path(".tusk") / "uploads.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot read transfer state " + state_path_.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            // Unreadable state only costs a fresh upload.
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            Entry entry;
            entry.endpoint = item.value("endpoint", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.total_size = item.value("total", 0ULL);
            entry.upload_url = item.value("url", std::string{});
            entry.bytes_transferred = item.value("bytes", 0ULL);
            if (!entry.endpoint.empty() && !entry.upload_url.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"endpoint", entry.endpoint},
                            {"local", entry.local_path.generic_string()},
                            {"total", entry.total_size},
                            {"url", entry.upload_url},
                            {"bytes", entry.bytes_transferred}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write transfer state " + state_path_.string());
        }
        out << json.dump(2);
    }

    std::vector<TransferStateStore::Entry>::iterator TransferStateStore::find_entry(
        const std::string &endpoint, const std::filesystem::path &local_path)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.endpoint == endpoint && entry.local_path == local_path; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace tusk::client
