#include "rcctl/client/daemon.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    std::vector<std::string> daemon_command_line(const DaemonOptions &options)
    {
        std::vector<std::string> args{
            options.command,
            "rcd",
            "--rc-addr",
            options.address + ":" + std::to_string(options.port),
        };
        if (options.credentials)
        {
            args.insert(args.end(), {"--rc-user", options.credentials->username,
                                     "--rc-pass", options.credentials->password});
        }
        else
        {
            args.emplace_back("--rc-no-auth");
        }
        return args;
    }

    DaemonProcess::DaemonProcess(DaemonOptions options, Logger logger)
        : options_(std::move(options)),
          logger_(std::move(logger)) {}

    DaemonProcess::~DaemonProcess()
    {
        if (running())
        {
            terminate();
        }
    }

    void DaemonProcess::start()
    {
        if (running())
        {
            throw RcError(ErrorCode::ProcessError, "daemon already started");
        }

        auto args = daemon_command_line(options_);
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = fork();
        if (pid < 0)
        {
            throw RcError(ErrorCode::ProcessError, std::string("fork failed: ") + std::strerror(errno));
        }
        if (pid == 0)
        {
            // Output is discarded so a full pipe can never stall the daemon.
            const int null_fd = ::open("/dev/null", O_RDWR);
            if (null_fd >= 0)
            {
                dup2(null_fd, STDIN_FILENO);
                dup2(null_fd, STDOUT_FILENO);
                dup2(null_fd, STDERR_FILENO);
                if (null_fd > STDERR_FILENO)
                {
                    ::close(null_fd);
                }
            }
            execvp(argv[0], argv.data());
            _exit(127);
        }

        pid_ = pid;
        logger_.log("daemon", "started ", options_.command, " rcd on ", options_.address, ':', options_.port,
                    " pid=", pid_);
    }

    void DaemonProcess::terminate(std::chrono::milliseconds grace)
    {
        if (!running())
        {
            return;
        }
        if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH)
        {
            logger_.warn("daemon", "SIGTERM failed: ", std::strerror(errno));
        }

        const auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (reap(false))
            {
                logger_.log("daemon", "terminated");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        logger_.warn("daemon", "did not exit within grace period, killing pid=", pid_);
        ::kill(pid_, SIGKILL);
        reap(true);
    }

    void DaemonProcess::kill()
    {
        if (!running())
        {
            throw RcError(ErrorCode::ProcessError, "unable to kill a daemon that was not started by this client");
        }
        ::kill(pid_, SIGKILL);
        reap(true);
        logger_.log("daemon", "killed");
    }

    bool DaemonProcess::reap(bool block)
    {
        int status = 0;
        for (;;)
        {
            const pid_t result = waitpid(pid_, &status, block ? 0 : WNOHANG);
            if (result == pid_ || (result < 0 && errno == ECHILD))
            {
                pid_ = -1;
                return true;
            }
            if (result == 0)
            {
                return false;
            }
            if (errno != EINTR)
            {
                logger_.warn("daemon", "waitpid failed: ", std::strerror(errno));
                pid_ = -1;
                return true;
            }
        }
    }

} // namespace rcctl::client
