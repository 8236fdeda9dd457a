#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rcctl::client
{

    struct Credentials
    {
        std::string username;
        std::string password;
    };

    struct ClientConfig
    {
        std::string host{"localhost"};
        std::uint16_t port{5572};
        std::optional<Credentials> credentials;
        bool prompt_password{false};
        // Launch "<rclone_command> rcd" instead of attaching to a running daemon.
        bool spawn_daemon{false};
        std::string rclone_command{"rclone"};
        std::optional<std::filesystem::path> log_path;
        std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds stop_poll_interval{500};
        std::size_t stop_max_attempts{120};
        std::chrono::milliseconds wait_poll_interval{1000};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace rcctl::client
