#include "log.hpp"

#include <cctype>
#include <cstdlib>

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::string env(char const* name)
{
    auto value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::shared_ptr<spdlog::logger> createLogger()
{
    std::shared_ptr<spdlog::logger> logger;

    auto logFile = env("OAUTH_LOG_FILE");
    if (!logFile.empty()) {
        std::size_t maxSize = 1024ull * 1024 * 1024;
        auto maxSizeStr = env("OAUTH_LOG_FILE_MAXSIZE");
        bool maxSizeValid = true;
        try {
            if (!maxSizeStr.empty())
                maxSize = std::stoull(maxSizeStr);
        }
        catch (std::exception const&) {
            maxSizeValid = false;
        }
        logger = spdlog::rotating_logger_mt("oauth", logFile, maxSize, 2);
        if (!maxSizeValid)
            logger->warn("Ignoring invalid OAUTH_LOG_FILE_MAXSIZE '{}'.", maxSizeStr);
        logger->info("Logging to '{}', rotating at {} bytes.", logFile, maxSize);
    }
    else
        logger = spdlog::stderr_color_mt("oauth");

    // from_str yields "off" for names it does not know.
    auto level = env("OAUTH_LOG_LEVEL");
    for (auto& ch : level)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (!level.empty()) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed != spdlog::level::off || level == "off")
            logger->set_level(parsed);
        else
            logger->warn("Ignoring unknown OAUTH_LOG_LEVEL '{}'.", level);
    }

    return logger;
}

}

spdlog::logger& oauthcl::log()
{
    static auto logger = createLogger();
    return *logger;
}
