#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rcctl/client/config.hpp"
#include "rcctl/client/logger.hpp"

namespace rcctl::client
{

    struct DaemonOptions
    {
        std::string command{"rclone"};
        std::string address{"localhost"};
        std::uint16_t port{5572};
        std::optional<Credentials> credentials;
    };

    // Arguments used to launch the remote-control daemon.
    std::vector<std::string> daemon_command_line(const DaemonOptions &options);

    // A daemon process launched by this client. Destruction terminates it.
    class DaemonProcess
    {
    public:
        DaemonProcess(DaemonOptions options, Logger logger);
        ~DaemonProcess();

        DaemonProcess(const DaemonProcess &) = delete;
        DaemonProcess &operator=(const DaemonProcess &) = delete;

        void start();
        bool running() const noexcept { return pid_ > 0; }

        // SIGTERM, then SIGKILL once the grace period is over; reaps the child.
        void terminate(std::chrono::milliseconds grace = std::chrono::seconds{5});

        // SIGKILL and reap. Throws RcError(ProcessError) when nothing was started.
        void kill();

    private:
        bool reap(bool block);

        DaemonOptions options_;
        Logger logger_;
        pid_t pid_{-1};
    };

} // namespace rcctl::client
