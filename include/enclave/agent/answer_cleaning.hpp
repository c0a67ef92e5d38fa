/**
 * @file answer_cleaning.hpp
 * @brief Reduce a final agent response to the bare answer
 *
 * @date 2026
 */

#pragma once

#include <string>

namespace enclave {
namespace agent {

/**
 * @brief Strip filler around a final answer
 *
 * - leading phrases ("The answer is", "Based on my analysis", ...)
 * - a trailing parenthetical ("42 (calculated)" -> "42")
 * - trailing . , ; :
 * - for answers shorter than 100 characters that are a number with an
 *   optional unit, only the number ("42 meters" -> "42")
 */
std::string CleanAnswer(const std::string& response);

} // namespace agent
} // namespace enclave
