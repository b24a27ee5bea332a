#include "stompcli/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace stompcli::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, const std::string &level)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::from_str(level));
            logger_->flush_on(spdlog::level::err);
        }
        catch (const spdlog::spdlog_ex &)
        {
            logger_.reset();
        }
    }

    void Logger::flush()
    {
        if (logger_)
        {
            logger_->flush();
        }
    }

} // namespace stompcli::client
