/**
 * @file logging.cpp
 * @brief spdlog default logger configuration
 *
 * @date 2026
 */

#include "enclave/utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace enclave {
namespace utils {

void InitLogging(bool verbose) {
    auto logger = spdlog::get("enclave");
    if (!logger) {
        logger = spdlog::stderr_color_mt("enclave");
    }
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace utils
} // namespace enclave
