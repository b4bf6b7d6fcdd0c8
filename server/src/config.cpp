#include "tusk/server/config.hpp"

#include <stdexcept>
#include <string>

#include "tusk/version.hpp"

namespace tusk::server
{

    namespace
    {

        std::string read_option(int &index, int argc, char *argv[], const std::string &name)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + name);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t read_number(int &index, int argc, char *argv[], const std::string &name)
        {
            const auto value = read_option(index, argc, argv, name);
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::runtime_error("Invalid number for " + name + ": " + value);
            }
            try
            {
                return std::stoull(value);
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error("Number out of range for " + name + ": " + value);
            }
        }

    } // namespace

    ServerConfig parse_server_arguments(int argc, char *argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto port = read_number(i, argc, argv, arg);
                if (port == 0 || port > 65535)
                {
                    throw std::runtime_error("Port out of range");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(read_option(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = read_option(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(read_number(i, argc, argv, arg));
            }
            else if (arg == "--base-path")
            {
                config.base_path = read_option(i, argc, argv, arg);
            }
            else if (arg == "--storage")
            {
                const auto value = read_option(i, argc, argv, arg);
                const auto kind = storage_kind_from_string(value);
                if (!kind)
                {
                    throw std::runtime_error("Unknown storage backend: " + value);
                }
                config.storage = *kind;
            }
            else if (arg == "--max-size")
            {
                config.max_size = read_number(i, argc, argv, arg);
            }
            else if (arg == "--max-body")
            {
                config.max_body = read_number(i, argc, argv, arg);
            }
            else if (arg == "--retention")
            {
                config.retention = std::chrono::seconds(read_number(i, argc, argv, arg));
            }
            else if (arg == "--completed-retention")
            {
                config.completed_retention = std::chrono::seconds(read_number(i, argc, argv, arg));
            }
            else if (arg == "--reap-interval")
            {
                config.reap_interval = std::chrono::seconds(read_number(i, argc, argv, arg));
                if (config.reap_interval.count() == 0)
                {
                    throw std::runtime_error("--reap-interval must be positive");
                }
            }
            else if (arg == "--lock-timeout")
            {
                config.lock_timeout = std::chrono::milliseconds(read_number(i, argc, argv, arg));
            }
            else if (arg == "--token")
            {
                config.auth_token = read_option(i, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(read_option(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                const auto value = read_option(i, argc, argv, arg);
                const auto level = spdlog::level::from_str(value);
                if (level == spdlog::level::off && value != "off")
                {
                    throw std::runtime_error("Unknown log level: " + value);
                }
                config.log_level = level;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.port == 0 || config.root.empty())
        {
            throw std::runtime_error("--port and --root are required");
        }
        return config;
    }

    std::string server_usage(const char *program_name)
    {
        return "tusk server " + std::string(tusk::version()) + "\n" + "Usage: " + program_name +
               " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--base-path <PATH>]\n"
               "       [--storage file|segmented] [--max-size <BYTES>] [--max-body <BYTES>]\n"
               "       [--retention <seconds>] [--completed-retention <seconds>] [--reap-interval <seconds>]\n"
               "       [--lock-timeout <ms>] [--token <TOKEN>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

} // namespace tusk::server
