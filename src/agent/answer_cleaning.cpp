/**
 * @file answer_cleaning.cpp
 * @brief Final answer normalization
 *
 * @date 2026
 */

#include "enclave/agent/answer_cleaning.hpp"
#include "enclave/utils/string_utils.hpp"

#include <regex>
#include <vector>

namespace enclave {
namespace agent {

namespace {

const std::vector<std::regex>& AnswerPrefixes() {
    static const auto icase = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<std::regex> prefixes = {
        std::regex(R"(^the\s+(final\s+)?answer\s+is[:\s]+)", icase),
        std::regex(R"(^based\s+on\s+(my\s+)?(analysis|research|findings)[,:\s]+)", icase),
        std::regex(R"(^after\s+(analyzing|reviewing|examining)[^,]*[,:\s]+)", icase),
        std::regex(R"(^therefore[,:\s]+)", icase),
        std::regex(R"(^so[,:\s]+)", icase),
        std::regex(R"(^in\s+conclusion[,:\s]+)", icase),
        std::regex(R"(^to\s+answer\s+(your\s+)?question[,:\s]+)", icase),
        std::regex(R"(^the\s+result\s+is[:\s]+)", icase),
        std::regex(R"(^i\s+found\s+that[:\s]+)", icase),
        std::regex(R"(^my\s+answer\s+is[:\s]+)", icase),
    };
    return prefixes;
}

std::string StripTrailing(std::string text, const std::string& chars) {
    while (!text.empty() && chars.find(text.back()) != std::string::npos) {
        text.pop_back();
    }
    return text;
}

} // anonymous namespace

std::string CleanAnswer(const std::string& response) {
    std::string text = utils::StringUtils::Trim(response);
    if (text.empty()) {
        return text;
    }

    for (const auto& prefix : AnswerPrefixes()) {
        text = std::regex_replace(text, prefix, "", std::regex_constants::format_first_only);
    }

    static const std::regex trailing_parenthetical(R"(\s*\([^)]*\)\s*$)");
    text = std::regex_replace(text, trailing_parenthetical, "");

    text = StripTrailing(text, ".,;:");

    static const std::regex number_with_unit(
        R"(^[^\d-]*(-?\d+(?:\.\d+)?)\s*(?:thousand|million|billion|hours?|minutes?|seconds?|meters?|m\^?\d*)?[^\d]*$)",
        std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    if (text.size() < 100 && std::regex_search(text, match, number_with_unit)) {
        text = match[1].str();
    }

    return utils::StringUtils::Trim(text);
}

} // namespace agent
} // namespace enclave
