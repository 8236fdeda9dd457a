#include "rcctl/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <vector>

namespace rcctl::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "[warning] logging disabled: " << ex.what() << std::endl;
            }
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("rcctl", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(spdlog::level::info);
    }

} // namespace rcctl::client
