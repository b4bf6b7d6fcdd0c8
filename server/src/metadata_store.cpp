#include "tusk/server/metadata_store.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tusk/crypto.hpp"
#include "tusk/server/storage_backend.hpp"
#include "tusk/server/upload_error.hpp"

namespace tusk::server
{

    namespace
    {
        constexpr auto kRecordExtension = ".info";

        std::int64_t to_seconds(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_seconds(std::int64_t seconds)
        {
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
        }

        nlohmann::json to_json(const UploadInfo &info)
        {
            nlohmann::json json{
                {"id", info.id},
                {"offset", info.offset},
                {"metadata", info.metadata},
                {"created_at", to_seconds(info.created_at)},
                {"last_update", to_seconds(info.last_update)},
                {"completion_notified", info.completion_notified},
            };
            if (info.length)
            {
                json["length"] = *info.length;
            }
            else
            {
                json["length"] = nullptr;
            }
            return json;
        }

        UploadInfo info_from_json(const nlohmann::json &json)
        {
            UploadInfo info{};
            info.id = json.at("id").get<std::string>();
            info.offset = json.value("offset", 0ULL);
            if (const auto it = json.find("length"); it != json.end() && !it->is_null())
            {
                info.length = it->get<std::uint64_t>();
            }
            info.metadata = json.value("metadata", tus::Metadata{});
            info.created_at = from_seconds(json.value("created_at", 0LL));
            info.last_update = from_seconds(json.value("last_update", 0LL));
            info.completion_notified = json.value("completion_notified", false);
            return info;
        }

    } // namespace

    MetadataStore::MetadataStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
        load_existing();
    }

    UploadInfo MetadataStore::create(std::optional<std::uint64_t> length, tus::Metadata metadata)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();

        UploadInfo info{};
        info.id = generate_id_locked();
        info.length = length;
        info.offset = 0;
        info.metadata = std::move(metadata);
        info.created_at = now;
        info.last_update = now;

        persist_locked(info);
        uploads_[info.id] = info;
        return info;
    }

    std::optional<UploadInfo> MetadataStore::get(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    UploadInfo MetadataStore::advance_offset(const std::string &id, std::uint64_t new_offset)
    {
        std::lock_guard lock(mutex_);
        auto &current = require_locked(id);
        if (new_offset < current.offset)
        {
            throw UploadError(ErrorCode::InvalidOffset, "Offset may not move backwards from " +
                                                            std::to_string(current.offset) + " to " +
                                                            std::to_string(new_offset));
        }
        if (current.length && new_offset > *current.length)
        {
            throw UploadError(ErrorCode::InvalidOffset, "Offset beyond declared length");
        }

        auto updated = current;
        updated.offset = new_offset;
        updated.last_update = std::chrono::system_clock::now();
        persist_locked(updated);
        current = updated;
        return updated;
    }

    UploadInfo MetadataStore::set_length(const std::string &id, std::uint64_t length)
    {
        std::lock_guard lock(mutex_);
        auto &current = require_locked(id);
        if (current.length)
        {
            throw UploadError(ErrorCode::AlreadySet, "Upload length already set");
        }
        if (length < current.offset)
        {
            throw UploadError(ErrorCode::InvalidLength, "Upload length below current offset");
        }

        auto updated = current;
        updated.length = length;
        updated.last_update = std::chrono::system_clock::now();
        persist_locked(updated);
        current = updated;
        return updated;
    }

    void MetadataStore::mark_notified(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(id);
        if (it == uploads_.end() || it->second.completion_notified)
        {
            return;
        }
        auto updated = it->second;
        updated.completion_notified = true;
        persist_locked(updated);
        it->second = updated;
    }

    bool MetadataStore::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto erased = uploads_.erase(id) > 0;
        if (!is_valid_upload_id(id))
        {
            return erased;
        }
        std::error_code ec;
        const auto removed = std::filesystem::remove(record_path(id), ec);
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to remove record: " + ec.message());
        }
        return erased || removed;
    }

    std::vector<UploadInfo> MetadataStore::list() const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadInfo> result;
        result.reserve(uploads_.size());
        for (const auto &[id, info] : uploads_)
        {
            result.push_back(info);
        }
        return result;
    }

    std::filesystem::path MetadataStore::record_path(const std::string &id) const
    {
        return directory_ / (id + kRecordExtension);
    }

    void MetadataStore::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(directory_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension)
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                spdlog::warn("Skipping unreadable upload record {}", entry.path().string());
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto info = info_from_json(json);
                if (!is_valid_upload_id(info.id) || entry.path().stem().string() != info.id)
                {
                    spdlog::warn("Skipping upload record {} with mismatched id", entry.path().string());
                    continue;
                }
                uploads_[info.id] = std::move(info);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping malformed upload record {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::debug("Loaded {} upload records from {}", uploads_.size(), directory_.string());
    }

    void MetadataStore::persist_locked(const UploadInfo &info) const
    {
        const auto path = record_path(info.id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (out.is_open())
            {
                out << to_json(info).dump(2);
                out.flush();
            }
            if (!out)
            {
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                throw UploadError(ErrorCode::StorageUnavailable, "Failed to write record " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw UploadError(ErrorCode::StorageUnavailable, "Failed to publish record: " + ec.message());
        }
    }

    UploadInfo &MetadataStore::require_locked(const std::string &id)
    {
        auto it = uploads_.find(id);
        if (it == uploads_.end())
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload " + id);
        }
        return it->second;
    }

    std::string MetadataStore::generate_id_locked() const
    {
        while (true)
        {
            auto id = crypto::random_id();
            if (!uploads_.contains(id) && !std::filesystem::exists(record_path(id)))
            {
                return id;
            }
        }
    }

} // namespace tusk::server
