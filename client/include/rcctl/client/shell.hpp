#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rcctl/client/config.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/rc_client.hpp"
#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    class Shell
    {
    public:
        Shell(ClientConfig config, Logger logger);

        int run();

    private:
        static std::string prompt_password(const std::string &username);
        void connect();
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_remotes(const std::vector<std::string> &args);
        bool handle_list(const std::vector<std::string> &args);
        bool handle_stat(const std::vector<std::string> &args);
        bool handle_hash(const std::vector<std::string> &args);
        bool handle_copy(const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);
        bool handle_track(const std::vector<std::string> &args);
        bool handle_status(const std::vector<std::string> &args);
        bool handle_jobs(const std::vector<std::string> &args);
        bool handle_wait(const std::vector<std::string> &args);
        bool handle_stop(const std::vector<std::string> &args);
        bool handle_stop_all(const std::vector<std::string> &args);
        bool handle_cleanup(const std::vector<std::string> &args);
        bool handle_groups(const std::vector<std::string> &args);
        bool handle_shutdown(const std::vector<std::string> &args);

        void print_help() const;
        void print_summary() const;
        void print_error(const RcError &error) const;
        static bool check_usage(const std::vector<std::string> &args, std::size_t min_args, std::size_t max_args,
                                const char *usage);

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<RcClient> client_;
    };

} // namespace rcctl::client
