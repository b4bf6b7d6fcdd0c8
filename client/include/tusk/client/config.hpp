#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "tusk/tus.hpp"

namespace tusk::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::filesystem::path file;
        std::string base_path{"/files/"};
        std::size_t chunk_size{1024 * 1024};
        std::optional<std::string> token;
        tus::Metadata metadata;
        std::optional<std::size_t> max_upload_rate;
        int retries{5};
        std::optional<std::filesystem::path> state_path;
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace tusk::client
