#include "rcctl/client/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    namespace
    {

        [[noreturn]] void invalid(const std::string &message)
        {
            throw RcError(ErrorCode::InvalidArgument, message);
        }

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                invalid(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_number(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto number = std::stoull(value, &consumed);
                if (consumed != value.size())
                {
                    invalid(flag + " expects a number, got '" + value + "'");
                }
                return number;
            }
            catch (const std::logic_error &)
            {
                invalid(flag + " expects a number, got '" + value + "'");
            }
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            invalid("Usage: rcctl [username@]<host>:<port> [--pass <password>] [--spawn] [--rclone <cmd>] "
                    "[--log <file>] [--timeout <ms>] [--stop-interval <ms>] [--stop-attempts <n>] "
                    "[--wait-interval <ms>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        std::optional<std::string> username;
        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            username = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            invalid("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port = parse_number(host_part.substr(colon_pos + 1), "port");
        if (port == 0 || port > 65535)
        {
            invalid("port out of range: " + host_part.substr(colon_pos + 1));
        }
        config.port = static_cast<std::uint16_t>(port);

        std::optional<std::string> password;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--pass")
            {
                password = next_value(index, argc, argv, arg);
            }
            else if (arg == "--spawn")
            {
                config.spawn_daemon = true;
            }
            else if (arg == "--rclone")
            {
                config.rclone_command = next_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(index, argc, argv, arg));
            }
            else if (arg == "--timeout")
            {
                config.request_timeout = std::chrono::milliseconds(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--stop-interval")
            {
                config.stop_poll_interval =
                    std::chrono::milliseconds(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--stop-attempts")
            {
                config.stop_max_attempts = static_cast<std::size_t>(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--wait-interval")
            {
                config.wait_poll_interval =
                    std::chrono::milliseconds(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else
            {
                invalid("Unknown argument: " + arg);
            }
        }

        if (!password && username)
        {
            if (const char *env = std::getenv("RCCTL_PASSWORD"))
            {
                password = std::string(env);
            }
        }
        if (password && !username)
        {
            invalid("A password was given without a username");
        }
        if (username)
        {
            config.credentials = Credentials{*username, password.value_or("")};
            config.prompt_password = !password.has_value();
        }
        if (config.request_timeout.count() == 0)
        {
            invalid("--timeout must be positive");
        }

        return config;
    }

} // namespace rcctl::client
