#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "rcctl/client/config.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/shell.hpp"
#include "rcctl/error_codes.hpp"
#include "rcctl/version.hpp"

int main(int argc, char *argv[])
{
    using rcctl::client::ClientConfig;
    using rcctl::client::Logger;
    using rcctl::client::Shell;

    if (argc == 2)
    {
        const std::string arg = argv[1];
        if (arg == "--version")
        {
            std::cout << "rcctl " << rcctl::version() << std::endl;
            return EXIT_SUCCESS;
        }
        if (arg == "--help" || arg == "-h")
        {
            std::cout << "rcctl " << rcctl::version() << "\n"
                      << "Usage: " << argv[0]
                      << " [username@]<host>:<port> [--pass <password>] [--spawn] [--rclone <cmd>] [--log <file>]\n"
                         "       [--timeout <ms>] [--stop-interval <ms>] [--stop-attempts <n>] [--wait-interval <ms>]\n"
                         "Type HELP at the prompt for the list of commands.\n";
            return EXIT_SUCCESS;
        }
    }

    ClientConfig config;
    try
    {
        config = rcctl::client::parse_arguments(argc, argv);
    }
    catch (const rcctl::RcError &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);
    logger.log("info", "rcctl ", rcctl::version(), " starting");
    Shell shell(std::move(config), std::move(logger));
    return shell.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
