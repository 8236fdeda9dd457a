#include "rcctl/client/shell.hpp"

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/signal_set.hpp>

#include <cctype>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stop_token>
#include <thread>

#include "rcctl/jobs.hpp"

namespace rcctl::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string human_bytes(double bytes)
        {
            static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
            std::size_t unit = 0;
            while (bytes >= 1024.0 && unit + 1 < std::size(kUnits))
            {
                bytes /= 1024.0;
                ++unit;
            }
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << ' ' << kUnits[unit];
            return oss.str();
        }

        rcctl::jobs::JobId parse_job_id(const std::string &text)
        {
            std::size_t consumed = 0;
            rcctl::jobs::JobId id = 0;
            try
            {
                id = std::stoll(text, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw RcError(ErrorCode::InvalidArgument, "not a job id: " + text);
            }
            if (consumed != text.size() || id <= 0)
            {
                throw RcError(ErrorCode::InvalidArgument, "not a job id: " + text);
            }
            return id;
        }

        // Turns SIGINT into a stop request for as long as the scope lives.
        class InterruptScope
        {
        public:
            InterruptScope()
                : signals_(io_context_, SIGINT)
            {
                signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                                    {
                    if (!ec) {
                        source_.request_stop();
                    } });
                thread_ = std::thread([this]
                                      { io_context_.run(); });
            }

            ~InterruptScope()
            {
                asio::post(io_context_, [this]
                           {
                    std::error_code ignored;
                    signals_.cancel(ignored); });
                if (thread_.joinable())
                {
                    thread_.join();
                }
            }

            InterruptScope(const InterruptScope &) = delete;
            InterruptScope &operator=(const InterruptScope &) = delete;

            std::stop_token token() const { return source_.get_token(); }

        private:
            std::stop_source source_;
            asio::io_context io_context_;
            asio::signal_set signals_;
            std::thread thread_;
        };

    } // namespace

    Shell::Shell(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)) {}

    int Shell::run()
    {
        try
        {
            connect();
            interactive_shell();
            if (client_->owns_daemon())
            {
                client_->quit();
            }
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    std::string Shell::prompt_password(const std::string &username)
    {
        std::string password;
        std::cout << "Password for " << username << ": " << std::flush;
        std::getline(std::cin, password);
        return password;
    }

    void Shell::connect()
    {
        if (config_.credentials && config_.prompt_password)
        {
            config_.credentials->password = prompt_password(config_.credentials->username);
            config_.prompt_password = false;
        }

        client_ = std::make_unique<RcClient>(config_, logger_);
        if (config_.spawn_daemon)
        {
            client_->run_daemon();
            std::cout << "Started daemon on " << config_.host << ':' << config_.port << std::endl;
        }
        else if (!client_->is_ready())
        {
            throw RcError(ErrorCode::TransientNetwork,
                          "no daemon listening on " + config_.host + ":" + std::to_string(config_.port));
        }
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    void Shell::interactive_shell()
    {
        while (true)
        {
            std::cout << config_.host << ':' << config_.port << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const RcError &ex)
            {
                print_error(ex);
                logger_.log("error", "command failed: ", ex.what());
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
        }
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "REMOTES")
        {
            return handle_remotes(args);
        }
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "STAT")
        {
            return handle_stat(args);
        }
        if (command == "HASH")
        {
            return handle_hash(args);
        }
        if (command == "COPY")
        {
            return handle_copy(args);
        }
        if (command == "DELETE")
        {
            return handle_delete(args);
        }
        if (command == "TRACK")
        {
            return handle_track(args);
        }
        if (command == "STATUS")
        {
            return handle_status(args);
        }
        if (command == "JOBS")
        {
            return handle_jobs(args);
        }
        if (command == "WAIT")
        {
            return handle_wait(args);
        }
        if (command == "STOP")
        {
            return handle_stop(args);
        }
        if (command == "STOPALL")
        {
            return handle_stop_all(args);
        }
        if (command == "CLEANUP")
        {
            return handle_cleanup(args);
        }
        if (command == "GROUPS")
        {
            return handle_groups(args);
        }
        if (command == "SHUTDOWN")
        {
            return handle_shutdown(args);
        }
        return false;
    }

    bool Shell::handle_remotes(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "REMOTES"))
        {
            return true;
        }
        for (const auto &remote : client_->list_remotes())
        {
            std::cout << std::left << std::setw(24) << remote.name << remote.type << std::endl;
        }
        return true;
    }

    bool Shell::handle_list(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 1, 2, "LIST <fs> [path]"))
        {
            return true;
        }
        const auto entries = client_->ls(args[0], args.size() == 2 ? args[1] : "");
        for (const auto &entry : entries)
        {
            const bool is_dir = entry.value("IsDir", false);
            const auto size = entry.value("Size", static_cast<std::int64_t>(-1));
            std::cout << (is_dir ? "[DIR] " : "      ") << std::left << std::setw(12)
                      << (is_dir || size < 0 ? std::string("-") : human_bytes(static_cast<double>(size)))
                      << entry.value("Path", std::string{}) << std::endl;
        }
        return true;
    }

    bool Shell::handle_stat(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 2, 2, "STAT <fs> <path>"))
        {
            return true;
        }
        std::cout << client_->stat(args[0], args[1]).dump(2) << std::endl;
        return true;
    }

    bool Shell::handle_hash(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 2, 2, "HASH <fs> <hash_type>"))
        {
            return true;
        }
        for (const auto &line : client_->checksum(args[0], args[1]))
        {
            std::cout << line.get<std::string>() << std::endl;
        }
        return true;
    }

    bool Shell::handle_copy(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 4, 4, "COPY <src_fs> <src_path> <dst_fs> <dst_path>"))
        {
            return true;
        }
        const auto id = client_->copy_file(args[0], args[1], args[2], args[3]);
        std::cout << "OK job " << id << std::endl;
        return true;
    }

    bool Shell::handle_delete(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 2, 2, "DELETE <fs> <path>"))
        {
            return true;
        }
        const auto id = client_->delete_file(args[0], args[1]);
        std::cout << "OK job " << id << std::endl;
        return true;
    }

    bool Shell::handle_track(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 1, 1, "TRACK <job_id>"))
        {
            return true;
        }
        const auto id = parse_job_id(args[0]);
        std::cout << (client_->track(id) ? "OK" : "OK (already tracked)") << std::endl;
        return true;
    }

    bool Shell::handle_status(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 1, 1, "STATUS <job_id>"))
        {
            return true;
        }
        const auto record = client_->job_status(parse_job_id(args[0]));
        std::cout << "job " << record.id << ' ' << rcctl::jobs::to_string(rcctl::jobs::derive_state(record))
                  << std::endl;
        std::cout << "  started  " << rcctl::jobs::format_timestamp(record.start_time) << std::endl;
        if (record.end_time)
        {
            std::cout << "  ended    " << rcctl::jobs::format_timestamp(*record.end_time) << std::endl;
        }
        if (!record.error.empty())
        {
            std::cout << "  error    " << record.error << std::endl;
        }
        if (record.stats)
        {
            std::cout << "  transfer " << record.stats->name << ' ' << human_bytes(record.stats->transferred_bytes)
                      << " / " << human_bytes(record.stats->total_bytes) << std::endl;
        }
        return true;
    }

    bool Shell::handle_jobs(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "JOBS"))
        {
            return true;
        }
        if (client_->registry().empty())
        {
            std::cout << "No tracked jobs." << std::endl;
            return true;
        }
        for (const auto &snapshot : client_->refresh_jobs())
        {
            std::cout << std::right << std::setw(8) << snapshot.id << "  " << rcctl::jobs::to_string(snapshot.state);
            const auto record = client_->registry().get(snapshot.id);
            if (record && record->stats)
            {
                std::cout << "  " << record->stats->name;
            }
            if (record && !record->error.empty())
            {
                std::cout << "  (" << record->error << ')';
            }
            std::cout << std::endl;
        }
        print_summary();
        return true;
    }

    bool Shell::handle_wait(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "WAIT"))
        {
            return true;
        }
        InterruptScope interrupt;
        const auto token = interrupt.token();
        while (!client_->all_terminal())
        {
            print_summary();
            if (!interruptible_sleep(config_.wait_poll_interval, token))
            {
                std::cout << "Interrupted; jobs keep running on the daemon." << std::endl;
                return true;
            }
        }
        std::cout << "OK all jobs finished" << std::endl;
        return true;
    }

    bool Shell::handle_stop(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 1, 1, "STOP <job_id>"))
        {
            return true;
        }
        client_->stop_job(parse_job_id(args[0]));
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_stop_all(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "STOPALL"))
        {
            return true;
        }
        InterruptScope interrupt;
        const auto summary = client_->stop_all_pending(interrupt.token());
        std::cout << "Stopped " << summary.confirmed.size() << " of " << summary.requested.size() << " job(s)";
        if (!summary.unconfirmed.empty())
        {
            std::cout << "; unconfirmed:";
            for (const auto id : summary.unconfirmed)
            {
                std::cout << ' ' << id;
            }
        }
        if (!summary.rejected.empty())
        {
            std::cout << "; rejected:";
            for (const auto id : summary.rejected)
            {
                std::cout << ' ' << id;
            }
        }
        if (summary.cancelled)
        {
            std::cout << " (interrupted)";
        }
        std::cout << std::endl;
        return true;
    }

    bool Shell::handle_cleanup(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "CLEANUP"))
        {
            return true;
        }
        const auto removed = client_->cleanup_terminal();
        std::cout << "Removed " << removed.size() << " job(s)" << std::endl;
        return true;
    }

    bool Shell::handle_groups(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "GROUPS"))
        {
            return true;
        }
        for (const auto &group : client_->stats_groups())
        {
            std::cout << group << std::endl;
        }
        return true;
    }

    bool Shell::handle_shutdown(const std::vector<std::string> &args)
    {
        if (!check_usage(args, 0, 0, "SHUTDOWN"))
        {
            return true;
        }
        client_->quit();
        std::cout << "OK daemon asked to quit" << std::endl;
        return true;
    }

    void Shell::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                                  Show this help" << std::endl;
        std::cout << "  EXIT                                  Leave the shell" << std::endl;
        std::cout << "  REMOTES                               List configured remotes" << std::endl;
        std::cout << "  LIST <fs> [path]                      List a directory" << std::endl;
        std::cout << "  STAT <fs> <path>                      Show metadata for a path" << std::endl;
        std::cout << "  HASH <fs> <hash_type>                 Checksum every file under fs" << std::endl;
        std::cout << "  COPY <src_fs> <src> <dst_fs> <dst>    Start a background copy" << std::endl;
        std::cout << "  DELETE <fs> <path>                    Start a background delete" << std::endl;
        std::cout << "  TRACK <job_id>                        Track a job started elsewhere" << std::endl;
        std::cout << "  STATUS <job_id>                       Query one job" << std::endl;
        std::cout << "  JOBS                                  Refresh and list tracked jobs" << std::endl;
        std::cout << "  WAIT                                  Wait for tracked jobs (Ctrl-C interrupts)" << std::endl;
        std::cout << "  STOP <job_id>                         Ask the daemon to stop a job" << std::endl;
        std::cout << "  STOPALL                               Stop every unfinished job and wait" << std::endl;
        std::cout << "  CLEANUP                               Forget finished jobs" << std::endl;
        std::cout << "  GROUPS                                List stats groups on the daemon" << std::endl;
        std::cout << "  SHUTDOWN                              Ask the daemon to quit" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --pass <password>       Password for user@host:port (or RCCTL_PASSWORD)\n";
        std::cout << "  --spawn                 Launch the daemon instead of attaching to one\n";
        std::cout << "  --rclone <cmd>          Daemon binary used with --spawn\n";
        std::cout << "  --log <file>            Append logs to file\n";
        std::cout << "  --timeout <ms>          Per-request deadline\n";
        std::cout << "  --stop-interval <ms>    Delay between stop confirmation queries\n";
        std::cout << "  --stop-attempts <n>     Confirmation queries per job (0 = unbounded)\n";
        std::cout << "  --wait-interval <ms>    Delay between WAIT refreshes\n";
    }

    void Shell::print_summary() const
    {
        const auto summary = client_->transfer_summary();
        if (summary.transfers == 0)
        {
            return;
        }
        std::cout << "Transfers: " << summary.transfers << "  " << human_bytes(summary.transferred_bytes) << " / "
                  << human_bytes(summary.total_bytes);
        if (summary.percentage)
        {
            std::ostringstream percent;
            percent << std::fixed << std::setprecision(1) << *summary.percentage * 100.0;
            std::cout << " (" << percent.str() << "%)";
        }
        std::cout << "  " << human_bytes(summary.speed) << "/s (avg " << human_bytes(summary.average_speed) << "/s)"
                  << std::endl;
    }

    void Shell::print_error(const RcError &error) const
    {
        std::cout << "ERROR: " << rcctl::to_string(error.code()) << std::endl;
        std::cout << error.what() << std::endl;
    }

    bool Shell::check_usage(const std::vector<std::string> &args, std::size_t min_args, std::size_t max_args,
                            const char *usage)
    {
        if (args.size() < min_args || args.size() > max_args)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: " << usage << std::endl;
            return false;
        }
        return true;
    }

} // namespace rcctl::client
