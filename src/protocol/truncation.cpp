/**
 * @file truncation.cpp
 * @brief Tail truncation of command output
 *
 * @date 2026
 */

#include "enclave/protocol/truncation.hpp"
#include "enclave/utils/string_utils.hpp"

#include <algorithm>

namespace enclave {
namespace protocol {

std::string TailTruncate(const std::string& text, std::size_t budget) {
    if (text.size() <= budget) {
        return text;
    }
    std::size_t start = text.size() - budget;
    // Skip continuation bytes of a character the cut landed in
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return text.substr(start);
}

void TruncateCombined(core::ExecutionResult& result, std::size_t budget) {
    result.stdout_output = utils::StringUtils::ToValidUtf8(result.stdout_output);
    result.stderr_output = utils::StringUtils::ToValidUtf8(result.stderr_output);

    std::size_t total = result.stdout_output.size() + result.stderr_output.size();
    if (total <= budget) {
        return;
    }

    std::size_t stderr_budget = std::min(result.stderr_output.size(), budget);
    std::size_t stdout_budget = budget - stderr_budget;

    result.stderr_output = TailTruncate(result.stderr_output, stderr_budget);
    result.stdout_output = TailTruncate(result.stdout_output, stdout_budget);
    result.truncated = true;
}

} // namespace protocol
} // namespace enclave
