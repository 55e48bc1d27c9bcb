#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void setupLogging(const LoggingOptions &options)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
        options.color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    console->set_pattern("%^%Y-%m-%d %H:%M:%S - %l - %v%$");
    sinks.push_back(console);

    std::string fileError;
    if (!options.logFile.empty())
    {
        try
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.logFile, false);
            file->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
            sinks.push_back(file);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("filesync", sinks.begin(), sinks.end());
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!fileError.empty())
    {
        spdlog::warn("Cannot open log file {}: {}", options.logFile, fileError);
    }
}
