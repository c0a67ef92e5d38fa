/**
 * @file truncation.hpp
 * @brief Output-size policy applied to every observation
 *
 * Observations are tail-truncated: the most recent output usually holds the
 * error or the final answer, so the earliest bytes are dropped first.
 *
 * @date 2026
 */

#pragma once

#include "enclave/core/sandbox.hpp"

#include <cstddef>
#include <string>

namespace enclave {
namespace protocol {

/// Approximate characters per model token
constexpr std::size_t kCharsPerToken = 4;

/**
 * @brief Character budget for a token budget
 */
constexpr std::size_t CharBudgetForTokens(std::size_t tokens) {
    return tokens * kCharsPerToken;
}

/**
 * @brief Keep at most the last `budget` bytes of text
 *
 * The kept tail always starts on a UTF-8 character boundary, so it can be
 * shorter than `budget` when the cut would land inside a character.
 * @return text unchanged if it already fits
 */
std::string TailTruncate(const std::string& text, std::size_t budget);

/**
 * @brief Fit stdout + stderr into one budget
 *
 * Both streams are first made valid UTF-8 (invalid bytes become U+FFFD)
 * so the observation always serializes. stderr keeps its tail first;
 * stdout gets whatever budget remains. Sets result.truncated when anything
 * was cut. Applying it twice with the same budget changes nothing.
 */
void TruncateCombined(core::ExecutionResult& result, std::size_t budget);

} // namespace protocol
} // namespace enclave
