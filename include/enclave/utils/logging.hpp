/**
 * @file logging.hpp
 * @brief spdlog setup shared by the CLI and the test runner
 *
 * Log lines go to stderr so that tool results printed on stdout stay
 * machine-readable.
 *
 * @date 2026
 */

#pragma once

namespace enclave {
namespace utils {

/**
 * @brief Install the stderr logger as the spdlog default
 * @param verbose Debug level when true, info otherwise
 */
void InitLogging(bool verbose);

} // namespace utils
} // namespace enclave
