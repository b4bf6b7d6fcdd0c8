#include <cstdlib>
#include <exception>
#include <iostream>

#include "tusk/client/config.hpp"
#include "tusk/client/http_connection.hpp"
#include "tusk/client/logger.hpp"
#include "tusk/client/transfer_state_store.hpp"
#include "tusk/client/upload_client.hpp"
#include "tusk/version.hpp"

using namespace tusk::client;

int main(int argc, char *argv[])
{
    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << "tusk client " << tusk::version() << "\n"
                  << usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        Logger logger(config.log_path);
        TransferStateStore state(config.state_path);
        HttpConnection connection(config.host, config.port);

        UploadOptions options;
        options.base_path = config.base_path;
        options.chunk_size = config.chunk_size;
        options.token = config.token;
        options.metadata = config.metadata;
        options.max_upload_rate = config.max_upload_rate;
        options.retries = config.retries;

        UploadClient client(connection, state, logger, std::move(options));
        const auto result = client.upload(config.file, [](std::uint64_t offset, std::uint64_t total)
                                          { std::cout << "\rUploaded " << offset << " / " << total << " bytes"
                                                      << std::flush; });
        std::cout << std::endl;
        std::cout << (result.resumed ? "Resumed and finished " : "Finished ") << result.url << " ("
                  << result.length << " bytes)" << std::endl;
    }
    catch (const TransferError &ex)
    {
        std::cout << std::endl;
        std::cerr << "ERROR: " << tusk::to_string(ex.code()) << std::endl;
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cout << std::endl;
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
