#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "tusk/server/storage_backend.hpp"

namespace tusk::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::string base_path{"/files/"};
        StorageKind storage{StorageKind::File};
        std::optional<std::uint64_t> max_size;
        std::uint64_t max_body{16ULL * 1024 * 1024};
        std::chrono::seconds retention{std::chrono::hours{24}};
        std::optional<std::chrono::seconds> completed_retention;
        std::chrono::seconds reap_interval{std::chrono::seconds{60}};
        std::chrono::milliseconds lock_timeout{std::chrono::seconds{3}};
        std::optional<std::string> auth_token;
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
        bool show_help{false};
    };

    // Throws std::runtime_error describing the first invalid argument.
    ServerConfig parse_server_arguments(int argc, char *argv[]);

    std::string server_usage(const char *program_name);

} // namespace tusk::server
