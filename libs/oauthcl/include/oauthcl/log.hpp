#pragma once

#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

namespace oauthcl
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - OAUTH_LOG_LEVEL
 *  - OAUTH_LOG_FILE
 *  - OAUTH_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @return error_t to throw.
 */
template<typename error_t = std::runtime_error>
error_t logRuntimeError(std::string const& what) {
    log().error(what);
    return error_t(what);
}

}
