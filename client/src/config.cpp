#include "tusk/client/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace tusk::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t read_number(const std::string &flag, const std::string &value)
        {
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c)
                                              { return std::isdigit(c) != 0; }))
            {
                throw std::runtime_error(flag + " expects a non-negative number, got '" + value + "'");
            }
            try
            {
                return std::stoull(value);
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error(flag + " value is out of range");
            }
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error("Expected <host>:<port> and a file to upload");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = read_number("port", endpoint.substr(colon_pos + 1));
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port must be between 1 and 65535");
        }
        config.port = static_cast<std::uint16_t>(port);
        config.file = std::filesystem::path(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--base-path")
            {
                config.base_path = require_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = static_cast<std::size_t>(read_number(arg, require_value(index, argc, argv, arg)));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--token")
            {
                config.token = require_value(index, argc, argv, arg);
            }
            else if (arg == "--metadata")
            {
                const auto pair = require_value(index, argc, argv, arg);
                const auto eq = pair.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    throw std::runtime_error("--metadata expects key=value");
                }
                const auto key = pair.substr(0, eq);
                if (key.find_first_of(" ,") != std::string::npos)
                {
                    throw std::runtime_error("Metadata keys must not contain spaces or commas");
                }
                config.metadata[key] = pair.substr(eq + 1);
            }
            else if (arg == "--max-upload-rate")
            {
                config.max_upload_rate =
                    static_cast<std::size_t>(read_number(arg, require_value(index, argc, argv, arg)));
            }
            else if (arg == "--retries")
            {
                config.retries = static_cast<int>(read_number(arg, require_value(index, argc, argv, arg)));
            }
            else if (arg == "--state")
            {
                config.state_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " <host>:<port> <file> [--base-path <PATH>] [--chunk-size <BYTES>] [--token <TOKEN>]\n"
               "       [--metadata key=value]... [--max-upload-rate <BYTES/s>] [--retries <N>]\n"
               "       [--state <FILE>] [--log <FILE>]\n";
    }

} // namespace tusk::client
